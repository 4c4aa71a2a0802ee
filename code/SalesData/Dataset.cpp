#include "Dataset.h"

namespace SalesData {

    Dataset::Dataset() {
        this->d = QSharedPointer<const Data>(new Data());
    }

    /**
     * Wrap the given transaction lines, whose derived fields must already be
     * populated, and index their distinct store locations and month buckets.
     */
    Dataset::Dataset(const TransactionLineList & lines) {
        Data * data = new Data();
        data->lines = lines;

        foreach (const TransactionLine & line, data->lines) {
            if (!data->storeLocationSet.contains(line.storeLocation)) {
                data->storeLocationSet.insert(line.storeLocation);
                data->storeLocations.append(line.storeLocation);
            }
            if (!data->monthBucketSet.contains(line.monthBucket)) {
                data->monthBucketSet.insert(line.monthBucket);
                data->monthBuckets.append(line.monthBucket);
            }
        }

        this->d = QSharedPointer<const Data>(data);
    }

    QStringList Dataset::getSortedMonthBuckets() const {
        QStringList months = this->d->monthBuckets;
        months.sort();
        return months;
    }
}
