#ifndef FREQUENTITEMSETCACHE_H
#define FREQUENTITEMSETCACHE_H

#include <QCache>
#include <QByteArray>
#include <QCryptographicHash>
#include <QDataStream>
#include <QMutex>
#include <QMutexLocker>

#include "Item.h"
#include "BasketBuilder.h"


namespace Analytics {

    /**
     * Bounded LRU cache of mined frequent itemsets, keyed by a fingerprint of
     * the basket set and the mining parameters. Safe for concurrent use.
     */
    class FrequentItemsetCache {
    public:
        explicit FrequentItemsetCache(int maxCost);

        bool lookup(const QByteArray & key, QList<FrequentItemset> & frequentItemsets) const;
        void insert(const QByteArray & key, const QList<FrequentItemset> & frequentItemsets);
        void clear();

        bool isEnabled() const { return this->maxCost > 0; }
        int size() const;

        static QByteArray fingerprint(const BasketSet & basketSet, double minSupport, int maxItemsetLength);

    protected:
        int maxCost;
        mutable QMutex mutex;
        QCache<QByteArray, QList<FrequentItemset> > cache;
    };
}

#endif // FREQUENTITEMSETCACHE_H
