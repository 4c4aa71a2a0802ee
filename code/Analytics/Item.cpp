#include "Item.h"

namespace Analytics {

    void registerBasicMetaTypes() {
        qRegisterMetaType<ItemIDList>("Analytics::ItemIDList");
        qRegisterMetaType<FrequentItemset>("Analytics::FrequentItemset");
        qRegisterMetaType<AssociationRule>("Analytics::AssociationRule");
        qRegisterMetaType< QList<Analytics::AssociationRule> >("QList<Analytics::AssociationRule>");
    }

#ifdef DEBUG
    QDebug operator<<(QDebug dbg, const FrequentItemset & frequentItemset) {
        dbg.nospace() << "({";
        for (int i = 0; i < frequentItemset.itemset.size(); i++) {
            if (i > 0)
                dbg.nospace() << ", ";
            dbg.nospace() << frequentItemset.itemset[i];
        }
        dbg.nospace() << "}, sup: " << frequentItemset.support
                      << " (" << frequentItemset.supportCount << "))";

        return dbg.nospace();
    }

    QDebug operator<<(QDebug dbg, const AssociationRule & associationRule) {
        dbg.nospace() << associationRule.antecedent
                      << " => "
                      << associationRule.consequent
                      << " (sup=" << associationRule.support
                      << ", conf=" << associationRule.confidence
                      << ", lift=" << associationRule.lift
                      << ")";

        return dbg.nospace();
    }
#endif

}
