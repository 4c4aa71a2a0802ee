#ifndef APRIORI_H
#define APRIORI_H

#include <QList>
#include <QHash>
#include <QSet>
#include <QVector>
#include <QDebug>

#include "Item.h"


namespace Analytics {

#ifdef DEBUG
//    #define APRIORI_DEBUG 1
#endif

    /**
     * Level-wise frequent itemset mining (Apriori) over a list of baskets.
     * An itemset is frequent when the fraction of baskets that contain all
     * of its items is at least the minimum support.
     */
    class Apriori {
    public:
        Apriori(const QList<Basket> & baskets, double minSupport, int maxItemsetLength = 0);

        QList<FrequentItemset> mineFrequentItemsets();

        // Accessors (valid after mining).
        int getNumBaskets() const { return this->baskets.size(); }
        bool isFrequentItemset(const ItemIDList & itemset) const { return this->supportCounts.contains(itemset); }
        SupportCount getSupportCount(const ItemIDList & itemset) const { return this->supportCounts.value(itemset, 0); }

    protected:
        QList<FrequentItemset> mineFrequentItems();
        QHash<ItemIDList, SupportCount> calculateSupportCounts(const QList<ItemIDList> & candidateItemsets, int k) const;
        bool isFrequent(SupportCount supportCount) const;
        Support calculateSupport(SupportCount supportCount) const;

        static QList<ItemIDList> generateCandidateItemsets(const QList<ItemIDList> & frequentItemsubsets);
        static quint64 binomialCoefficient(int n, int k, quint64 cap);

        QList<Basket> baskets;
        double minSupport;
        int maxItemsetLength;
        QHash<ItemIDList, SupportCount> supportCounts;
    };
}

#endif // APRIORI_H
