#include "TestReport.h"

#include <limits>

void TestReport::init() {
    this->report = AnalyticsReport();

    this->report.kpis.totalRevenue = moneyFromDouble(31.0);
    this->report.kpis.transactionCount = 5;
    this->report.kpis.averageTicket = 6.2;
    this->report.kpis.totalQuantity = 13;

    this->report.revenueByMonth << qMakePair(QString("2023-01"), moneyFromDouble(18.5));
    this->report.revenueByMonth << qMakePair(QString("2023-02"), moneyFromDouble(12.5));
    for (Weekday d = 0; d < NUM_WEEKDAYS; d++)
        this->report.revenueByWeekday << qMakePair(weekdayName(d), (Money) 0);
    this->report.revenueHeatmap = RevenueMatrix(NUM_WEEKDAYS, QVector<Money>(NUM_HOURS, 0));
    this->report.revenueHeatmap[0][7] = moneyFromDouble(8.5);
    this->report.topProducts << qMakePair(QString("Croissant"), moneyFromDouble(12.5));

    this->report.itemIDNameHash.insert(0, "Croissant");
    this->report.itemIDNameHash.insert(1, "Espresso");
    this->report.itemIDNameHash.insert(2, "Latte");

    AssociationRule rule;
    rule.antecedent << 1 << 2;
    rule.consequent << 0;
    rule.support = 0.25;
    rule.confidence = 1.0;
    rule.lift = 1.25;
    rule.antecedentSupport = 0.25;
    rule.consequentSupport = 0.8;
    rule.leverage = 0.05;
    rule.conviction = std::numeric_limits<double>::infinity();
    this->report.associationRules << rule;

    rule = AssociationRule();
    rule.antecedent << 0;
    rule.consequent << 2;
    rule.support = 0.6;
    rule.confidence = 0.75;
    rule.lift = 1.25;
    rule.antecedentSupport = 0.8;
    rule.consequentSupport = 0.6;
    rule.leverage = 0.12;
    rule.conviction = 1.6;
    this->report.associationRules << rule;
}

void TestReport::formatRule() {
    QCOMPARE(this->report.itemsetIDsToNames(ItemIDList() << 1 << 2), (ItemNameList() << "Espresso" << "Latte"));
    QCOMPARE(this->report.formatRule(this->report.associationRules[0]),
             QString::fromUtf8("Espresso, Latte \xe2\x9e\x9c Croissant"));
}

void TestReport::toJson() {
    QJsonObject json = Report::toJson(this->report).object();

    QJsonObject kpis = json["kpis"].toObject();
    QCOMPARE(kpis["total revenue"].toDouble(), 31.0);
    QCOMPARE(kpis["transactions"].toInt(), 5);
    QCOMPARE(kpis["average ticket"].toDouble(), 6.2);
    QCOMPARE(kpis["total quantity"].toInt(), 13);

    QJsonArray months = json["revenue by month"].toArray();
    QCOMPARE(months.size(), 2);
    QCOMPARE(months[0].toObject()["month"].toString(), QString("2023-01"));
    QCOMPARE(months[0].toObject()["revenue"].toDouble(), 18.5);

    QJsonArray weekdays = json["revenue by weekday"].toArray();
    QCOMPARE(weekdays.size(), 7);
    QCOMPARE(weekdays[6].toObject()["weekday"].toString(), QString("Sunday"));

    QJsonObject heatmap = json["revenue heatmap"].toObject();
    QCOMPARE(heatmap["weekdays"].toArray().size(), 7);
    QJsonArray rows = heatmap["revenue"].toArray();
    QCOMPARE(rows.size(), 7);
    QCOMPARE(rows[0].toArray().size(), 24);
    QCOMPARE(rows[0].toArray()[7].toDouble(), 8.5);

    QJsonArray products = json["top products"].toArray();
    QCOMPARE(products.size(), 1);
    QCOMPARE(products[0].toObject()["product"].toString(), QString("Croissant"));

    QJsonArray rules = json["association rules"].toArray();
    QCOMPARE(rules.size(), 2);
    QJsonObject rule = rules[0].toObject();
    QCOMPARE(rule["antecedent"].toArray(), QJsonArray() << "Espresso" << "Latte");
    QCOMPARE(rule["consequent"].toArray(), QJsonArray() << "Croissant");
    QCOMPARE(rule["products"].toString(), QString::fromUtf8("Espresso, Latte \xe2\x9e\x9c Croissant"));
    QCOMPARE(rule["support"].toDouble(), 0.25);
    QCOMPARE(rule["confidence"].toDouble(), 1.0);
    QCOMPARE(rule["lift"].toDouble(), 1.25);
    // Infinite conviction has no JSON representation.
    QVERIFY(rule["conviction"].isNull());
    QCOMPARE(rules[1].toObject()["conviction"].toDouble(), 1.6);
}

void TestReport::toText() {
    QString text = Report::toText(this->report);

    QVERIFY(text.contains("Total revenue: 31\n"));
    QVERIFY(text.contains("Transactions: 5\n"));
    QVERIFY(text.contains("Average ticket: 6.20\n"));
    QVERIFY(text.contains("  Croissant: 12.50\n"));
    QVERIFY(text.contains(QString::fromUtf8("  Espresso, Latte \xe2\x9e\x9c Croissant (support=0.250, confidence=1.000, lift=1.250)\n")));
    QVERIFY(!text.contains("No association rules found."));

    this->report.associationRules.clear();
    text = Report::toText(this->report);
    QVERIFY(text.contains("No association rules found.\n"));
}
