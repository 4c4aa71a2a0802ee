#include "Aggregator.h"

#include <algorithm>

namespace Analytics {

    static bool revenueGreaterThan(const LabeledRevenue & a, const LabeledRevenue & b) {
        return a.second > b.second;
    }


    //------------------------------------------------------------------------
    // Public static methods: KPIs.

    Money Aggregator::totalRevenue(const SalesData::TransactionLineList & lines) {
        Money total = 0;
        foreach (const SalesData::TransactionLine & line, lines)
            total += line.revenue;
        return total;
    }

    int Aggregator::transactionCount(const SalesData::TransactionLineList & lines) {
        QSet<TransactionID> transactionIDs;
        foreach (const SalesData::TransactionLine & line, lines)
            transactionIDs.insert(line.transactionID);
        return transactionIDs.size();
    }

    /**
     * Average revenue per transaction; 0 when there are no transactions.
     */
    double Aggregator::averageTicket(const SalesData::TransactionLineList & lines) {
        return Aggregator::averageTicket(Aggregator::totalRevenue(lines), Aggregator::transactionCount(lines));
    }

    quint64 Aggregator::totalQuantity(const SalesData::TransactionLineList & lines) {
        quint64 total = 0;
        foreach (const SalesData::TransactionLine & line, lines)
            total += line.quantity;
        return total;
    }

    KPIs Aggregator::calculateKPIs(const SalesData::TransactionLineList & lines) {
        KPIs kpis;
        kpis.totalRevenue     = Aggregator::totalRevenue(lines);
        kpis.transactionCount = Aggregator::transactionCount(lines);
        kpis.averageTicket    = Aggregator::averageTicket(kpis.totalRevenue, kpis.transactionCount);
        kpis.totalQuantity    = Aggregator::totalQuantity(lines);
        return kpis;
    }


    //------------------------------------------------------------------------
    // Public static methods: series.

    /**
     * Revenue per month bucket, sorted ascending by month bucket. Only months
     * that occur in the given lines are listed.
     */
    RevenueSeries Aggregator::revenueByMonth(const SalesData::TransactionLineList & lines) {
        QMap<QString, Money> revenuePerMonth;
        foreach (const SalesData::TransactionLine & line, lines)
            revenuePerMonth[line.monthBucket] += line.revenue;

        RevenueSeries series;
        QMap<QString, Money>::const_iterator it;
        for (it = revenuePerMonth.constBegin(); it != revenuePerMonth.constEnd(); ++it)
            series.append(qMakePair(it.key(), it.value()));
        return series;
    }

    /**
     * Revenue per weekday, always seven entries from Monday to Sunday.
     * Weekdays without any lines have zero revenue.
     */
    RevenueSeries Aggregator::revenueByWeekday(const SalesData::TransactionLineList & lines) {
        QVector<Money> revenuePerWeekday(NUM_WEEKDAYS, 0);
        foreach (const SalesData::TransactionLine & line, lines)
            revenuePerWeekday[line.weekday] += line.revenue;

        RevenueSeries series;
        for (Weekday d = 0; d < NUM_WEEKDAYS; d++)
            series.append(qMakePair(weekdayName(d), revenuePerWeekday[d]));
        return series;
    }

    /**
     * Revenue per (weekday, hour) cell: seven rows from Monday to Sunday, 24
     * columns for the hours 0-23. Empty cells are zero.
     */
    RevenueMatrix Aggregator::revenueHeatmap(const SalesData::TransactionLineList & lines) {
        RevenueMatrix matrix(NUM_WEEKDAYS, QVector<Money>(NUM_HOURS, 0));
        foreach (const SalesData::TransactionLine & line, lines)
            matrix[line.weekday][line.hour] += line.revenue;
        return matrix;
    }

    /**
     * The n products with the highest total revenue, in descending order of
     * revenue. Products with equal revenue keep the order in which they were
     * first encountered.
     */
    RevenueSeries Aggregator::topProducts(const SalesData::TransactionLineList & lines, int n) {
        RevenueSeries products;
        if (n <= 0)
            return products;

        // Index of each product in the list, in order of first encounter.
        QHash<QString, int> productIndex;
        foreach (const SalesData::TransactionLine & line, lines) {
            QHash<QString, int>::const_iterator it = productIndex.constFind(line.productDetail);
            if (it == productIndex.constEnd()) {
                productIndex.insert(line.productDetail, products.size());
                products.append(qMakePair(line.productDetail, line.revenue));
            }
            else
                products[it.value()].second += line.revenue;
        }

        std::stable_sort(products.begin(), products.end(), revenueGreaterThan);

        if (products.size() > n)
            products = products.mid(0, n);
        return products;
    }


    //------------------------------------------------------------------------
    // Protected static methods.

    double Aggregator::averageTicket(Money totalRevenue, int transactionCount) {
        if (transactionCount == 0)
            return 0.0;
        return moneyToDouble(totalRevenue) / transactionCount;
    }
}
