#ifndef AGGREGATOR_H
#define AGGREGATOR_H

#include <QList>
#include <QVector>
#include <QPair>
#include <QMap>
#include <QHash>
#include <QSet>
#include <QString>

#include "../common/common.h"
#include "../SalesData/typedefs.h"


namespace Analytics {

    // (label, revenue) pairs: month buckets, weekday names or products.
    typedef QPair<QString, Money> LabeledRevenue;
    typedef QList<LabeledRevenue> RevenueSeries;
    // Indexed by [weekday][hour].
    typedef QVector<QVector<Money> > RevenueMatrix;

    struct KPIs {
        KPIs() : totalRevenue(0), transactionCount(0), averageTicket(0.0), totalQuantity(0) {}

        Money totalRevenue;
        int transactionCount;
        double averageTicket;
        quint64 totalQuantity;
    };

    class Aggregator {
    public:
        static Money totalRevenue(const SalesData::TransactionLineList & lines);
        static int transactionCount(const SalesData::TransactionLineList & lines);
        static double averageTicket(const SalesData::TransactionLineList & lines);
        static quint64 totalQuantity(const SalesData::TransactionLineList & lines);
        static KPIs calculateKPIs(const SalesData::TransactionLineList & lines);

        static RevenueSeries revenueByMonth(const SalesData::TransactionLineList & lines);
        static RevenueSeries revenueByWeekday(const SalesData::TransactionLineList & lines);
        static RevenueMatrix revenueHeatmap(const SalesData::TransactionLineList & lines);
        static RevenueSeries topProducts(const SalesData::TransactionLineList & lines, int n);

    protected:
        static double averageTicket(Money totalRevenue, int transactionCount);
    };
}

#endif // AGGREGATOR_H
