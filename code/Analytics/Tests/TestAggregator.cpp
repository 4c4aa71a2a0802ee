#include "TestAggregator.h"

#include <algorithm>

void TestAggregator::kpis() {
    SalesData::TransactionLineList lines = Fixtures::coffeeShopLines();

    KPIs kpis = Aggregator::calculateKPIs(lines);
    QCOMPARE(kpis.totalRevenue, moneyFromDouble(31.0));
    QCOMPARE(kpis.transactionCount, 5);
    QCOMPARE(kpis.averageTicket, 6.2);
    QCOMPARE(kpis.totalQuantity, (quint64) 13);

    QCOMPARE(Aggregator::totalRevenue(lines), kpis.totalRevenue);
    QCOMPARE(Aggregator::transactionCount(lines), kpis.transactionCount);
    QCOMPARE(Aggregator::averageTicket(lines), kpis.averageTicket);
    QCOMPARE(Aggregator::totalQuantity(lines), kpis.totalQuantity);

    // Transactions are counted by distinct ID, not by line.
    lines = lines.mid(0, 3);
    QCOMPARE(Aggregator::transactionCount(lines), 2);
    QCOMPARE(Aggregator::averageTicket(lines), 5.75);
}

void TestAggregator::kpisEmpty() {
    KPIs kpis = Aggregator::calculateKPIs(SalesData::TransactionLineList());
    QCOMPARE(kpis.totalRevenue, (Money) 0);
    QCOMPARE(kpis.transactionCount, 0);
    QCOMPARE(kpis.averageTicket, 0.0);
    QCOMPARE(kpis.totalQuantity, (quint64) 0);

    QCOMPARE(Aggregator::averageTicket(moneyFromDouble(10.0), 0), 0.0);
}

void TestAggregator::revenueByMonth() {
    SalesData::TransactionLineList lines = Fixtures::coffeeShopLines();

    RevenueSeries expected;
    expected << qMakePair(QString("2023-01"), moneyFromDouble(18.5));
    expected << qMakePair(QString("2023-02"), moneyFromDouble(12.5));
    QCOMPARE(Aggregator::revenueByMonth(lines), expected);

    // Ascending regardless of line order.
    std::reverse(lines.begin(), lines.end());
    QCOMPARE(Aggregator::revenueByMonth(lines), expected);

    QVERIFY(Aggregator::revenueByMonth(SalesData::TransactionLineList()).isEmpty());
}

void TestAggregator::revenueByWeekday() {
    RevenueSeries series = Aggregator::revenueByWeekday(Fixtures::coffeeShopLines());
    QCOMPARE(series.size(), 7);

    QStringList names;
    foreach (const LabeledRevenue & entry, series)
        names << entry.first;
    QCOMPARE(names, QStringList() << "Monday" << "Tuesday" << "Wednesday" << "Thursday" << "Friday" << "Saturday" << "Sunday");

    QCOMPARE(series[0].second, moneyFromDouble(22.0));
    QCOMPARE(series[1].second, moneyFromDouble(4.5));
    QCOMPARE(series[2].second, (Money) 0);
    QCOMPARE(series[3].second, (Money) 0);
    QCOMPARE(series[4].second, (Money) 0);
    QCOMPARE(series[5].second, moneyFromDouble(4.5));
    QCOMPARE(series[6].second, (Money) 0);

    // Always seven entries, even without data.
    series = Aggregator::revenueByWeekday(SalesData::TransactionLineList());
    QCOMPARE(series.size(), 7);
    foreach (const LabeledRevenue & entry, series)
        QCOMPARE(entry.second, (Money) 0);
}

void TestAggregator::revenueHeatmap() {
    RevenueMatrix matrix = Aggregator::revenueHeatmap(Fixtures::coffeeShopLines());

    QCOMPARE(matrix.size(), 7);
    Money sum = 0;
    int nonZeroCells = 0;
    for (int d = 0; d < matrix.size(); d++) {
        QCOMPARE(matrix[d].size(), 24);
        foreach (Money revenue, matrix[d]) {
            sum += revenue;
            if (revenue != 0)
                nonZeroCells++;
        }
    }
    QCOMPARE(nonZeroCells, 5);
    QCOMPARE(sum, moneyFromDouble(31.0));

    QCOMPARE(matrix[0][7],  moneyFromDouble(8.5));
    QCOMPARE(matrix[0][8],  moneyFromDouble(5.5));
    QCOMPARE(matrix[0][9],  moneyFromDouble(8.0));
    QCOMPARE(matrix[1][13], moneyFromDouble(4.5));
    QCOMPARE(matrix[5][10], moneyFromDouble(4.5));
}

void TestAggregator::revenueConservation() {
    SalesData::TransactionLineList lines = Fixtures::coffeeShopLines();
    const Money total = Aggregator::totalRevenue(lines);

    Money byMonth = 0;
    foreach (const LabeledRevenue & entry, Aggregator::revenueByMonth(lines))
        byMonth += entry.second;
    QCOMPARE(byMonth, total);

    Money byWeekday = 0;
    foreach (const LabeledRevenue & entry, Aggregator::revenueByWeekday(lines))
        byWeekday += entry.second;
    QCOMPARE(byWeekday, total);

    Money byProduct = 0;
    foreach (const LabeledRevenue & entry, Aggregator::topProducts(lines, 1000))
        byProduct += entry.second;
    QCOMPARE(byProduct, total);
}

void TestAggregator::topProducts() {
    SalesData::TransactionLineList lines = Fixtures::coffeeShopLines();
    RevenueSeries expected;

    expected << qMakePair(QString("Croissant"), moneyFromDouble(12.5));
    expected << qMakePair(QString("Latte"),     moneyFromDouble(12.0));
    QCOMPARE(Aggregator::topProducts(lines, 2), expected);

    expected << qMakePair(QString("Tea"),       moneyFromDouble(4.5));
    expected << qMakePair(QString("Espresso"),  moneyFromDouble(2.0));
    QCOMPARE(Aggregator::topProducts(lines, 10), expected);

    QVERIFY(Aggregator::topProducts(lines, 0).isEmpty());
    QVERIFY(Aggregator::topProducts(lines, -1).isEmpty());
}

void TestAggregator::topProductsTies() {
    SalesData::TransactionLineList lines;
    lines << Fixtures::makeLine(1, "Astoria", "2023-01-02", "07:00:00", "Latte",  1, 100.0);
    lines << Fixtures::makeLine(2, "Astoria", "2023-01-02", "08:00:00", "Tea",    1,  50.0);
    lines << Fixtures::makeLine(3, "Astoria", "2023-01-02", "09:00:00", "Muffin", 1, 100.0);

    // Equal revenue: the first encountered product wins.
    RevenueSeries expected;
    expected << qMakePair(QString("Latte"),  moneyFromDouble(100.0));
    expected << qMakePair(QString("Muffin"), moneyFromDouble(100.0));
    QCOMPARE(Aggregator::topProducts(lines, 2), expected);
}
