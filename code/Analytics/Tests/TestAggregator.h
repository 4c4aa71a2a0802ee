#ifndef TESTAGGREGATOR_H
#define TESTAGGREGATOR_H

#include <QtTest/QtTest>

#include "Fixtures.h"
#define protected public
#include "../Aggregator.h"
#undef protected


using namespace Analytics;

class TestAggregator : public QObject {
    Q_OBJECT

private slots:
    void kpis();
    void kpisEmpty();
    void revenueByMonth();
    void revenueByWeekday();
    void revenueHeatmap();
    void revenueConservation();
    void topProducts();
    void topProductsTies();
};

#endif // TESTAGGREGATOR_H
