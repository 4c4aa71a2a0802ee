#include "Apriori.h"

#include <algorithm>

namespace Analytics {

    Apriori::Apriori(const QList<Basket> & baskets, double minSupport, int maxItemsetLength) {
        Q_ASSERT_X(minSupport > 0.0 && minSupport <= 1.0, "Apriori::Apriori", "Minimum support must be in (0,1].");

        this->baskets = baskets;
        this->minSupport = minSupport;
        this->maxItemsetLength = maxItemsetLength;
    }


    //------------------------------------------------------------------------
    // Public methods.

    /**
     * Mine all frequent itemsets.
     *
     * 1. Find the frequent 1-itemsets.
     * 2. For every k >= 2, join the frequent (k-1)-itemsets that share a
     *    (k-2)-prefix into k-candidates, prune the candidates that have an
     *    infrequent (k-1)-subset, then count the support of the surviving
     *    candidates and keep the frequent ones.
     * 3. Stop when a level yields no frequent itemsets (or the maximum itemset
     *    length has been reached).
     *
     * @return
     *   All frequent itemsets, ordered by size and then lexicographically.
     */
    QList<FrequentItemset> Apriori::mineFrequentItemsets() {
        QList<FrequentItemset> frequentItemsets;
        this->supportCounts.clear();

        if (this->baskets.isEmpty())
            return frequentItemsets;

        QList<FrequentItemset> level = this->mineFrequentItems();
        int k = 1;
        while (!level.isEmpty()) {
            frequentItemsets.append(level);

#ifdef APRIORI_DEBUG
            qDebug() << "level" << k << ":" << level.size() << "frequent itemsets";
#endif

            k++;
            if (this->maxItemsetLength > 0 && k > this->maxItemsetLength)
                break;

            QList<ItemIDList> frequentItemsubsets;
            foreach (const FrequentItemset & fis, level)
                frequentItemsubsets.append(fis.itemset);

            QList<ItemIDList> candidateItemsets = Apriori::generateCandidateItemsets(frequentItemsubsets);
            if (candidateItemsets.isEmpty())
                break;

            QHash<ItemIDList, SupportCount> candidateSupportCounts = this->calculateSupportCounts(candidateItemsets, k);

            // Candidates are generated in lexicographical order; keep it.
            level.clear();
            foreach (const ItemIDList & candidate, candidateItemsets) {
                SupportCount supportCount = candidateSupportCounts[candidate];
                if (this->isFrequent(supportCount)) {
                    level.append(FrequentItemset(candidate, supportCount, this->calculateSupport(supportCount)));
                    this->supportCounts.insert(candidate, supportCount);
                }
            }
        }

        return frequentItemsets;
    }


    //------------------------------------------------------------------------
    // Protected methods.

    QList<FrequentItemset> Apriori::mineFrequentItems() {
        QHash<ItemID, SupportCount> itemSupportCounts;
        foreach (const Basket & basket, this->baskets)
            foreach (ItemID itemID, basket)
                itemSupportCounts[itemID]++;

        QList<ItemID> itemIDs = itemSupportCounts.keys();
        std::sort(itemIDs.begin(), itemIDs.end());

        QList<FrequentItemset> frequentItems;
        foreach (ItemID itemID, itemIDs) {
            SupportCount supportCount = itemSupportCounts[itemID];
            if (this->isFrequent(supportCount)) {
                ItemIDList itemset;
                itemset.append(itemID);
                frequentItems.append(FrequentItemset(itemset, supportCount, this->calculateSupport(supportCount)));
                this->supportCounts.insert(itemset, supportCount);
            }
        }
        return frequentItems;
    }

    /**
     * Count in how many baskets each candidate k-itemset occurs.
     *
     * For small baskets, it's cheaper to enumerate the basket's own
     * k-subsets and look them up; for large baskets, every candidate is
     * tested for containment instead.
     */
    QHash<ItemIDList, SupportCount> Apriori::calculateSupportCounts(const QList<ItemIDList> & candidateItemsets, int k) const {
        QHash<ItemIDList, SupportCount> counts;
        foreach (const ItemIDList & candidate, candidateItemsets)
            counts.insert(candidate, 0);

        const quint64 numCandidates = candidateItemsets.size();
        QVector<int> indices(k);
        ItemIDList subset;

        foreach (const Basket & basket, this->baskets) {
            int n = basket.size();
            if (n < k)
                continue;

            if (Apriori::binomialCoefficient(n, k, numCandidates) <= numCandidates) {
                // Enumerate all k-subsets of the basket, in lexicographical
                // order of their indices.
                for (int i = 0; i < k; i++)
                    indices[i] = i;
                while (true) {
                    subset.clear();
                    for (int i = 0; i < k; i++)
                        subset.append(basket[indices[i]]);
                    QHash<ItemIDList, SupportCount>::iterator it = counts.find(subset);
                    if (it != counts.end())
                        it.value()++;

                    int i = k - 1;
                    while (i >= 0 && indices[i] == n - k + i)
                        i--;
                    if (i < 0)
                        break;
                    indices[i]++;
                    for (int j = i + 1; j < k; j++)
                        indices[j] = indices[j - 1] + 1;
                }
            }
            else {
                foreach (const ItemIDList & candidate, candidateItemsets)
                    if (basketContains(basket, candidate))
                        counts[candidate]++;
            }
        }

        return counts;
    }

    bool Apriori::isFrequent(SupportCount supportCount) const {
        return supportCount > 0 && this->calculateSupport(supportCount) >= this->minSupport;
    }

    Support Apriori::calculateSupport(SupportCount supportCount) const {
        return 1.0 * supportCount / this->baskets.size();
    }


    //------------------------------------------------------------------------
    // Protected static methods.

    /**
     * A.k.a. "apriori-gen".
     *
     * Phase 1: join every pair of frequent (k-1)-itemsets that share their
     * first k-2 items into a k-candidate. Phase 2: prune candidates of which
     * at least one (k-1)-subset is not frequent.
     *
     * @param frequentItemsubsets
     *   The frequent (k-1)-itemsets, each sorted, in lexicographical order.
     * @return
     *   The candidate k-itemsets, in lexicographical order.
     */
    QList<ItemIDList> Apriori::generateCandidateItemsets(const QList<ItemIDList> & frequentItemsubsets) {
        QList<ItemIDList> candidateItemsets;
        QSet<ItemIDList> frequent = frequentItemsubsets.toSet();
        ItemIDList prefixOfA, prefixOfB;

        for (int a = 0; a < frequentItemsubsets.size(); a++) {
            prefixOfA = frequentItemsubsets[a];
            ItemID lastOfA = prefixOfA.takeLast();

            for (int b = a + 1; b < frequentItemsubsets.size(); b++) {
                prefixOfB = frequentItemsubsets[b];
                ItemID lastOfB = prefixOfB.takeLast();

                // Itemsets with the same prefix are adjacent, so the first
                // mismatch ends the search for this prefix.
                if (prefixOfA != prefixOfB)
                    break;

                // Phase 1: candidate generation.
                ItemIDList candidateItemset = prefixOfA;
                candidateItemset.append(qMin(lastOfA, lastOfB));
                candidateItemset.append(qMax(lastOfA, lastOfB));

                // Phase 2: candidate pruning.
                // The two subsets that leave out one of the last two items
                // are a and b themselves; all others must be checked.
                bool allSubsetsFrequent = true;
                ItemIDList subset;
                for (int i = 0; allSubsetsFrequent && i < candidateItemset.size() - 2; i++) {
                    subset = candidateItemset;
                    subset.removeAt(i);
                    if (!frequent.contains(subset))
                        allSubsetsFrequent = false;
                }
                if (allSubsetsFrequent)
                    candidateItemsets.append(candidateItemset);
            }
        }

        return candidateItemsets;
    }

    /**
     * n choose k, saturating at cap + 1.
     */
    quint64 Apriori::binomialCoefficient(int n, int k, quint64 cap) {
        if (k < 0 || k > n)
            return 0;
        k = qMin(k, n - k);

        quint64 result = 1;
        for (int i = 1; i <= k; i++) {
            result = result * (n - k + i) / i;
            if (result > cap)
                return cap + 1;
        }
        return result;
    }
}
