#include "TestDataset.h"

static TransactionLine makeLine(TransactionID transactionID, const QString & storeLocation, const QDate & date) {
    TransactionLine line;
    line.transactionID = transactionID;
    line.storeLocation = storeLocation;
    line.date = date;
    line.time = QTime(12, 0);
    line.productDetail = "Latte";
    line.quantity = 1;
    line.unitPrice = moneyFromDouble(3.0);
    deriveFields(line);
    return line;
}

void TestDataset::basic() {
    TransactionLineList lines;
    lines << makeLine(1, "Lower Manhattan", QDate(2023, 3, 14));
    lines << makeLine(2, "Astoria",         QDate(2023, 1, 2));
    lines << makeLine(3, "Lower Manhattan", QDate(2023, 1, 31));
    lines << makeLine(4, "Hell's Kitchen",  QDate(2023, 3, 1));

    Dataset dataset(lines);
    QCOMPARE(dataset.size(), 4);
    QVERIFY(!dataset.isEmpty());

    // Categories in order of first encounter.
    QCOMPARE(dataset.getStoreLocations(), QStringList() << "Lower Manhattan" << "Astoria" << "Hell's Kitchen");
    QCOMPARE(dataset.getMonthBuckets(), QStringList() << "2023-03" << "2023-01");
    QCOMPARE(dataset.getSortedMonthBuckets(), QStringList() << "2023-01" << "2023-03");

    QVERIFY(dataset.hasStoreLocation("Astoria"));
    QVERIFY(!dataset.hasStoreLocation("astoria"));
    QVERIFY(dataset.hasMonthBucket("2023-01"));
    QVERIFY(!dataset.hasMonthBucket("2023-02"));

    // Derived fields.
    const TransactionLine & line = dataset.getLines()[1];
    QCOMPARE(line.monthBucket, QString("2023-01"));
    QCOMPARE(line.weekday, 0);
    QCOMPARE(line.weekdayName(), QString("Monday"));
    QCOMPARE(line.hour, 12);
    QCOMPARE(line.revenue, moneyFromDouble(3.0));
}

void TestDataset::empty() {
    Dataset dataset;
    QCOMPARE(dataset.size(), 0);
    QVERIFY(dataset.isEmpty());
    QVERIFY(dataset.getStoreLocations().isEmpty());
    QVERIFY(dataset.getMonthBuckets().isEmpty());
    QVERIFY(!dataset.hasStoreLocation(""));
}

void TestDataset::sharing() {
    TransactionLineList lines;
    lines << makeLine(1, "Astoria", QDate(2023, 1, 2));

    Dataset a(lines);
    Dataset b = a;
    // Copies share the same immutable data.
    QCOMPARE(&a.getLines(), &b.getLines());

    b = Dataset();
    QCOMPARE(a.size(), 1);
    QCOMPARE(b.size(), 0);
}
