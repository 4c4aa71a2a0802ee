#include "RuleMiner.h"

#include <algorithm>
#include <limits>

namespace Analytics {

    //------------------------------------------------------------------------
    // Public static methods.

    /**
     * Derive association rules from frequent itemsets. Every frequent itemset
     * of two or more items is split into a non-empty antecedent and a
     * non-empty consequent in every possible way; a rule is kept when its lift
     * (and, optionally, its confidence) is sufficiently high.
     *
     * @param frequentItemsets
     *   Frequent itemsets, as produced by Apriori. Since every subset of a
     *   frequent itemset is frequent, the support of every antecedent and
     *   consequent is available in this list as well.
     * @param minimumLift
     *   The minimum lift a rule must have.
     * @param minimumConfidence
     *   The minimum confidence a rule must have; 0 disables this filter.
     * @return
     *   The association rules, in order of generation.
     */
    QList<AssociationRule> RuleMiner::mineAssociationRules(const QList<FrequentItemset> & frequentItemsets,
                                                           Lift minimumLift,
                                                           Confidence minimumConfidence)
    {
        QList<AssociationRule> associationRules;

        QHash<ItemIDList, Support> supports;
        foreach (const FrequentItemset & frequentItemset, frequentItemsets)
            supports.insert(frequentItemset.itemset, frequentItemset.support);

        // Iterate over all frequent itemsets.
        foreach (const FrequentItemset & frequentItemset, frequentItemsets) {
            // It's only possible to generate an association rule if there are at
            // least two items in the frequent itemset.
            if (frequentItemset.itemset.size() >= 2) {
#ifdef RULEMINER_DEBUG
                qDebug() << "Generating rules for frequent itemset" << frequentItemset;
#endif
                associationRules.append(
                            RuleMiner::generateAssociationRulesForFrequentItemset(
                                frequentItemset,
                                supports,
                                minimumLift,
                                minimumConfidence
                            )
                );
            }
        }
        return associationRules;
    }

    /**
     * Sort association rules for presentation: descending by lift, then by
     * confidence, then by support. Rules that tie on all three keep their
     * relative order.
     *
     * @param maximumRules
     *   The number of rules to keep; 0 keeps all of them.
     */
    QList<AssociationRule> RuleMiner::rankAssociationRules(QList<AssociationRule> associationRules, int maximumRules) {
        std::stable_sort(associationRules.begin(), associationRules.end(), RuleMiner::ruleRanksHigher);

        if (maximumRules > 0 && associationRules.size() > maximumRules)
            associationRules = associationRules.mid(0, maximumRules);

        return associationRules;
    }


    //------------------------------------------------------------------------
    // Protected static methods.

    /**
     * Evaluate all 2^k - 2 bipartitions of a frequent k-itemset. Lift is not
     * anti-monotone in the consequent, so there is no pruning here: every
     * bipartition is evaluated.
     */
    QList<AssociationRule> RuleMiner::generateAssociationRulesForFrequentItemset(const FrequentItemset & frequentItemset,
                                                                                 const QHash<ItemIDList, Support> & supports,
                                                                                 Lift minimumLift,
                                                                                 Confidence minimumConfidence)
    {
        QList<AssociationRule> associationRules;
        const ItemIDList & itemset = frequentItemset.itemset;
        const int k = itemset.size(); // Size of the frequent itemset.
        Q_ASSERT_X(k >= 2 && k < 64, "RuleMiner::generateAssociationRulesForFrequentItemset", "Unsupported itemset size.");

        const quint64 numPartitions = (Q_UINT64_C(1) << k) - 1;
        for (quint64 mask = 1; mask < numPartitions; mask++) {
            // The bits of the mask select the consequent.
            ItemIDList consequent;
            for (int i = 0; i < k; i++)
                if (mask & (Q_UINT64_C(1) << i))
                    consequent.append(itemset[i]);
            ItemIDList antecedent = RuleMiner::getAntecedent(itemset, consequent);

            Q_ASSERT(supports.contains(antecedent) && supports.contains(consequent));
            Support antecedentSupport = supports.value(antecedent);
            Support consequentSupport = supports.value(consequent);

            AssociationRule rule;
            rule.antecedent        = antecedent;
            rule.consequent        = consequent;
            rule.support           = frequentItemset.support;
            rule.confidence        = frequentItemset.support / antecedentSupport;
            rule.lift              = rule.confidence / consequentSupport;
            rule.antecedentSupport = antecedentSupport;
            rule.consequentSupport = consequentSupport;
            rule.leverage          = rule.support - antecedentSupport * consequentSupport;
            if (rule.confidence >= 1.0)
                rule.conviction = std::numeric_limits<double>::infinity();
            else
                rule.conviction = (1.0 - consequentSupport) / (1.0 - rule.confidence);

#ifdef RULEMINER_DEBUG
            qDebug() << "\tcandidate" << rule;
#endif

            if (rule.lift >= minimumLift && rule.confidence >= minimumConfidence)
                associationRules.append(rule);
        }

        return associationRules;
    }

    /**
     * Build the antecedent for this candidate consequent, which are all items
     * in the frequent itemset except for those in the candidate consequent.
     */
    ItemIDList RuleMiner::getAntecedent(const ItemIDList & frequentItemset, const ItemIDList & consequent) {
        ItemIDList antecedent;
        foreach (ItemID itemID, frequentItemset)
            if (!consequent.contains(itemID))
                antecedent.append(itemID);
        return antecedent;
    }

    bool RuleMiner::ruleRanksHigher(const AssociationRule & a, const AssociationRule & b) {
        if (a.lift != b.lift)
            return a.lift > b.lift;
        if (a.confidence != b.confidence)
            return a.confidence > b.confidence;
        return a.support > b.support;
    }
}
