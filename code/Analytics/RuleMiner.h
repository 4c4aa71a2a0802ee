#ifndef RULEMINER_H
#define RULEMINER_H

#include <QList>
#include <QHash>
#include <QDebug>

#include "Item.h"


namespace Analytics {

#ifdef DEBUG
//    #define RULEMINER_DEBUG 1
#endif

    class RuleMiner {
    public:
        static QList<AssociationRule> mineAssociationRules(const QList<FrequentItemset> & frequentItemsets,
                                                           Lift minimumLift,
                                                           Confidence minimumConfidence = 0.0);
        static QList<AssociationRule> rankAssociationRules(QList<AssociationRule> associationRules, int maximumRules);

    protected:
        static QList<AssociationRule> generateAssociationRulesForFrequentItemset(const FrequentItemset & frequentItemset,
                                                                                 const QHash<ItemIDList, Support> & supports,
                                                                                 Lift minimumLift,
                                                                                 Confidence minimumConfidence);
        static ItemIDList getAntecedent(const ItemIDList & frequentItemset, const ItemIDList & consequent);
        static bool ruleRanksHigher(const AssociationRule & a, const AssociationRule & b);
    };
}

#endif // RULEMINER_H
