#include "TestBasketBuilder.h"

#include <algorithm>

void TestBasketBuilder::basic() {
    BasketSet basketSet = BasketBuilder::buildBaskets(Fixtures::coffeeShopLines());

    // Item IDs follow the alphabetical order of the product names.
    QCOMPARE(basketSet.itemIDNameHash.size(), 4);
    QCOMPARE(basketSet.itemIDNameHash[0], QString("Croissant"));
    QCOMPARE(basketSet.itemIDNameHash[1], QString("Espresso"));
    QCOMPARE(basketSet.itemIDNameHash[2], QString("Latte"));
    QCOMPARE(basketSet.itemIDNameHash[3], QString("Tea"));
    QCOMPARE(basketSet.itemNameIDHash["Latte"], (ItemID) 2);

    // One basket per transaction, in order of transaction ID; quantities
    // don't matter.
    QCOMPARE(basketSet.size(), 5);
    QCOMPARE(basketSet.baskets[0], (Basket() << 0 << 2));
    QCOMPARE(basketSet.baskets[1], (Basket() << 0 << 2));
    QCOMPARE(basketSet.baskets[2], (Basket() << 0 << 1));
    QCOMPARE(basketSet.baskets[3], (Basket() << 0 << 2));
    QCOMPARE(basketSet.baskets[4], (Basket() << 3));
}

void TestBasketBuilder::lineOrderIndependence() {
    SalesData::TransactionLineList lines = Fixtures::coffeeShopLines();
    // The same product twice in one transaction still yields a single item.
    lines << Fixtures::makeLine(5, "Astoria", "2023-02-07", "13:45:00", "Tea", 1, 1.50);

    BasketSet a = BasketBuilder::buildBaskets(lines);
    std::reverse(lines.begin(), lines.end());
    BasketSet b = BasketBuilder::buildBaskets(lines);

    QCOMPARE(a.baskets, b.baskets);
    QCOMPARE(a.itemIDNameHash, b.itemIDNameHash);
    QCOMPARE(a.baskets[4], (Basket() << 3));
}

void TestBasketBuilder::empty() {
    BasketSet basketSet = BasketBuilder::buildBaskets(SalesData::TransactionLineList());
    QVERIFY(basketSet.isEmpty());
    QVERIFY(basketSet.itemIDNameHash.isEmpty());
}
