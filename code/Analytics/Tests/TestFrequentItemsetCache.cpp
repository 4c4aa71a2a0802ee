#include "TestFrequentItemsetCache.h"

#include <algorithm>

void TestFrequentItemsetCache::basic() {
    FrequentItemsetCache cache(4);
    QVERIFY(cache.isEnabled());

    QList<FrequentItemset> frequentItemsets, result;
    frequentItemsets << FrequentItemset(ItemIDList() << 0,      4, 0.8);
    frequentItemsets << FrequentItemset(ItemIDList() << 0 << 1, 3, 0.6);

    QVERIFY(!cache.lookup("a", result));
    cache.insert("a", frequentItemsets);
    QCOMPARE(cache.size(), 1);
    QVERIFY(cache.lookup("a", result));
    QCOMPARE(result, frequentItemsets);

    // An empty mining result is a valid result, too.
    cache.insert("b", QList<FrequentItemset>());
    QVERIFY(cache.lookup("b", result));
    QVERIFY(result.isEmpty());

    cache.clear();
    QCOMPARE(cache.size(), 0);
    QVERIFY(!cache.lookup("a", result));
}

void TestFrequentItemsetCache::disabled() {
    FrequentItemsetCache cache(0);
    QVERIFY(!cache.isEnabled());

    QList<FrequentItemset> result;
    cache.insert("a", QList<FrequentItemset>() << FrequentItemset(ItemIDList() << 0, 1, 1.0));
    QCOMPARE(cache.size(), 0);
    QVERIFY(!cache.lookup("a", result));
}

void TestFrequentItemsetCache::eviction() {
    FrequentItemsetCache cache(2);
    QList<FrequentItemset> result;

    cache.insert("a", QList<FrequentItemset>());
    cache.insert("b", QList<FrequentItemset>());
    // Touch "a", so that "b" is the least recently used entry.
    QVERIFY(cache.lookup("a", result));
    cache.insert("c", QList<FrequentItemset>());

    QCOMPARE(cache.size(), 2);
    QVERIFY(cache.lookup("a", result));
    QVERIFY(!cache.lookup("b", result));
    QVERIFY(cache.lookup("c", result));
}

void TestFrequentItemsetCache::fingerprint() {
    SalesData::TransactionLineList lines = Fixtures::coffeeShopLines();
    BasketSet basketSet = BasketBuilder::buildBaskets(lines);

    QByteArray key = FrequentItemsetCache::fingerprint(basketSet, 0.02, 0);
    QCOMPARE(key.size(), 20);

    // Same baskets, different line order or transaction IDs: same key.
    std::reverse(lines.begin(), lines.end());
    for (int i = 0; i < lines.size(); i++)
        lines[i].transactionID += 100;
    QCOMPARE(FrequentItemsetCache::fingerprint(BasketBuilder::buildBaskets(lines), 0.02, 0), key);

    // Different parameters.
    QVERIFY(FrequentItemsetCache::fingerprint(basketSet, 0.05, 0) != key);
    QVERIFY(FrequentItemsetCache::fingerprint(basketSet, 0.02, 2) != key);

    // Different baskets.
    lines.removeLast();
    QVERIFY(FrequentItemsetCache::fingerprint(BasketBuilder::buildBaskets(lines), 0.02, 0) != key);
}
