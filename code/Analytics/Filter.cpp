#include "Filter.h"

namespace Analytics {

    //------------------------------------------------------------------------
    // Public static methods.

    /**
     * Select the lines whose store location AND month bucket are both part of
     * the selection. Input order is preserved.
     */
    SalesData::TransactionLineList Filter::apply(const SalesData::Dataset & dataset, const FilterSelection & selection) {
        SalesData::TransactionLineList subset;

        if (selection.isEmpty())
            return subset;

        foreach (const SalesData::TransactionLine & line, dataset.getLines())
            if (selection.storeLocations.contains(line.storeLocation) && selection.monthBuckets.contains(line.monthBucket))
                subset.append(line);

        return subset;
    }

    /**
     * Verify that a selection only references store locations and month
     * buckets that exist in the data set. Empty selections are valid.
     *
     * @param errorMessage
     *   Optional; receives a description of the first unknown value.
     */
    bool Filter::validate(const SalesData::Dataset & dataset, const FilterSelection & selection, QString * errorMessage) {
        QStringList unknown;

        foreach (const QString & location, selection.storeLocations)
            if (!dataset.hasStoreLocation(location))
                unknown << QString("store location '%1'").arg(location);
        foreach (const QString & month, selection.monthBuckets)
            if (!dataset.hasMonthBucket(month))
                unknown << QString("month '%1'").arg(month);

        if (unknown.isEmpty())
            return true;

        if (errorMessage != NULL) {
            // Sort to keep the message stable regardless of QSet ordering.
            unknown.sort();
            *errorMessage = QString("The selection references unknown values: %1.").arg(unknown.join(", "));
        }
        return false;
    }

    /**
     * The selection that contains every store location and every month
     * bucket in the data set.
     */
    FilterSelection Filter::selectAll(const SalesData::Dataset & dataset) {
        return FilterSelection(dataset.getStoreLocations().toSet(), dataset.getMonthBuckets().toSet());
    }

#ifdef DEBUG
    QDebug operator<<(QDebug dbg, const FilterSelection & selection) {
        QStringList locations = selection.storeLocations.toList();
        QStringList months = selection.monthBuckets.toList();
        locations.sort();
        months.sort();
        dbg.nospace() << "{locations: " << locations << ", months: " << months << "}";
        return dbg.nospace();
    }
#endif
}
