#ifndef FILTER_H
#define FILTER_H

#include <QSet>
#include <QString>
#include <QStringList>
#include <QMetaType>

#include "../SalesData/Dataset.h"


namespace Analytics {

    // The store locations and month buckets a query is restricted to. Both
    // sets are combined with AND; an empty set selects nothing.
    struct FilterSelection {
        FilterSelection() {}
        FilterSelection(const QSet<QString> & storeLocations, const QSet<QString> & monthBuckets)
            : storeLocations(storeLocations), monthBuckets(monthBuckets) {}

        bool isEmpty() const { return this->storeLocations.isEmpty() || this->monthBuckets.isEmpty(); }

        QSet<QString> storeLocations;
        QSet<QString> monthBuckets;
    };
    inline bool operator==(const FilterSelection & s1, const FilterSelection & s2) {
        return s1.storeLocations == s2.storeLocations && s1.monthBuckets == s2.monthBuckets;
    }

    class Filter {
    public:
        static SalesData::TransactionLineList apply(const SalesData::Dataset & dataset, const FilterSelection & selection);
        static bool validate(const SalesData::Dataset & dataset, const FilterSelection & selection, QString * errorMessage = NULL);
        static FilterSelection selectAll(const SalesData::Dataset & dataset);
    };

#ifdef DEBUG
    QDebug operator<<(QDebug dbg, const FilterSelection & selection);
#endif
}

Q_DECLARE_METATYPE(Analytics::FilterSelection)

#endif // FILTER_H
