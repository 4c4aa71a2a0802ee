#include "FrequentItemsetCache.h"

#include <algorithm>

namespace Analytics {

    /**
     * @param maxCost
     *   The maximum number of mining results to retain; 0 disables the cache.
     */
    FrequentItemsetCache::FrequentItemsetCache(int maxCost) {
        this->maxCost = maxCost;
        this->cache.setMaxCost(qMax(maxCost, 0));
    }

    bool FrequentItemsetCache::lookup(const QByteArray & key, QList<FrequentItemset> & frequentItemsets) const {
        QMutexLocker locker(&this->mutex);

        // QCache::object() updates the LRU order, hence the const_cast.
        QList<FrequentItemset> * cached = const_cast<QCache<QByteArray, QList<FrequentItemset> > &>(this->cache).object(key);
        if (cached == NULL)
            return false;

        frequentItemsets = *cached;
        return true;
    }

    void FrequentItemsetCache::insert(const QByteArray & key, const QList<FrequentItemset> & frequentItemsets) {
        if (!this->isEnabled())
            return;

        QMutexLocker locker(&this->mutex);
        this->cache.insert(key, new QList<FrequentItemset>(frequentItemsets), 1);
    }

    void FrequentItemsetCache::clear() {
        QMutexLocker locker(&this->mutex);
        this->cache.clear();
    }

    int FrequentItemsetCache::size() const {
        QMutexLocker locker(&this->mutex);
        return this->cache.size();
    }

    /**
     * Compute a fingerprint that identifies a basket set snapshot together
     * with the mining parameters. Item IDs are derived from sorted product
     * names, so the item names plus the sorted list of baskets identify the
     * snapshot, regardless of transaction IDs.
     */
    QByteArray FrequentItemsetCache::fingerprint(const BasketSet & basketSet, double minSupport, int maxItemsetLength) {
        QByteArray data;
        QDataStream stream(&data, QIODevice::WriteOnly);

        stream << minSupport << (qint32) maxItemsetLength;

        stream << (quint32) basketSet.itemIDNameHash.size();
        for (ItemID id = 0; id < (ItemID) basketSet.itemIDNameHash.size(); id++)
            stream << basketSet.itemIDNameHash.value(id);

        QList<Basket> baskets = basketSet.baskets;
        std::sort(baskets.begin(), baskets.end(), itemsetLessThan);
        stream << (quint32) baskets.size();
        foreach (const Basket & basket, baskets) {
            stream << (quint32) basket.size();
            foreach (ItemID id, basket)
                stream << id;
        }

        return QCryptographicHash::hash(data, QCryptographicHash::Sha1);
    }
}
