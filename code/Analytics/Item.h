#ifndef ITEM_H
#define ITEM_H

#include <QString>
#include <QList>
#include <QHash>
#include <QMetaType>
#include <QDebug>

#include <algorithm>


namespace Analytics {

    // Products are the items that are mined. Item names are mapped to compact
    // item IDs for mining; ItemIDLists are always sorted ascending.
    typedef QString ItemName;
    typedef quint32 ItemID;
    typedef QList<ItemID> ItemIDList;
    typedef QList<ItemName> ItemNameList;
    typedef QHash<ItemID, ItemName> ItemIDNameHash;
    typedef QHash<ItemName, ItemID> ItemNameIDHash;

    // A basket is the sorted list of distinct items of a single transaction.
    typedef ItemIDList Basket;

    typedef quint32 SupportCount;
    typedef double Support;
    typedef double Confidence;
    typedef double Lift;

    struct FrequentItemset {
        FrequentItemset() : supportCount(0), support(0.0) {}
        FrequentItemset(const ItemIDList & itemset, SupportCount supportCount, Support support)
            : itemset(itemset), supportCount(supportCount), support(support) {}

        ItemIDList itemset;
        SupportCount supportCount;
        Support support;
    };
    inline bool operator==(const FrequentItemset & fis1, const FrequentItemset & fis2) {
        return fis1.itemset == fis2.itemset && fis1.supportCount == fis2.supportCount;
    }

    struct AssociationRule {
        AssociationRule()
            : support(0.0), confidence(0.0), lift(0.0),
              antecedentSupport(0.0), consequentSupport(0.0),
              leverage(0.0), conviction(0.0) {}

        ItemIDList antecedent;
        ItemIDList consequent;
        Support support;
        Confidence confidence;
        Lift lift;

        // Supplementary metrics.
        Support antecedentSupport;
        Support consequentSupport;
        double leverage;
        double conviction; // +inf when confidence == 1.
    };
    inline bool operator==(const AssociationRule & r1, const AssociationRule & r2) {
        return r1.antecedent == r2.antecedent && r1.consequent == r2.consequent;
    }

    // Lexicographical ordering of (sorted) itemsets.
    inline bool itemsetLessThan(const ItemIDList & a, const ItemIDList & b) {
        return std::lexicographical_compare(a.constBegin(), a.constEnd(), b.constBegin(), b.constEnd());
    }

    // Whether the sorted itemset is contained in the sorted basket.
    inline bool basketContains(const Basket & basket, const ItemIDList & itemset) {
        return std::includes(basket.constBegin(), basket.constEnd(), itemset.constBegin(), itemset.constEnd());
    }

    void registerBasicMetaTypes();

#ifdef DEBUG
    // QDebug() streaming output operators.
    QDebug operator<<(QDebug dbg, const FrequentItemset & frequentItemset);
    QDebug operator<<(QDebug dbg, const AssociationRule & associationRule);
#endif

}

Q_DECLARE_METATYPE(Analytics::FrequentItemset)
Q_DECLARE_METATYPE(Analytics::AssociationRule)

#endif // ITEM_H
