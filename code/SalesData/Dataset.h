#ifndef DATASET_H
#define DATASET_H

#include <QSharedPointer>
#include <QStringList>
#include <QSet>

#include "typedefs.h"


namespace SalesData {

    /**
     * Immutable, implicitly shared handle to a loaded data set. Copies are
     * cheap and share the same transaction lines; no copy can ever modify
     * them, so any number of queries may read a Dataset concurrently.
     */
    class Dataset {
    public:
        Dataset();
        explicit Dataset(const TransactionLineList & lines);

        // Accessors.
        const TransactionLineList & getLines() const { return this->d->lines; }
        int size() const { return this->d->lines.size(); }
        bool isEmpty() const { return this->d->lines.isEmpty(); }

        // Distinct values, in order of first encounter.
        const QStringList & getStoreLocations() const { return this->d->storeLocations; }
        const QStringList & getMonthBuckets() const { return this->d->monthBuckets; }
        QStringList getSortedMonthBuckets() const;

        // Queries.
        bool hasStoreLocation(const QString & location) const { return this->d->storeLocationSet.contains(location); }
        bool hasMonthBucket(const QString & month) const { return this->d->monthBucketSet.contains(month); }

    protected:
        struct Data {
            TransactionLineList lines;
            QStringList storeLocations;
            QStringList monthBuckets;
            QSet<QString> storeLocationSet;
            QSet<QString> monthBucketSet;
        };

        QSharedPointer<const Data> d;
    };
}

#endif // DATASET_H
