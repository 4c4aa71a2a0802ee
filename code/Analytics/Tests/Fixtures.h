#ifndef FIXTURES_H
#define FIXTURES_H

#include <QDate>
#include <QTime>
#include <QString>

#include "../../common/common.h"
#include "../../SalesData/typedefs.h"
#include "../../SalesData/Dataset.h"
#include "../Item.h"


namespace Fixtures {

inline SalesData::TransactionLine makeLine(TransactionID transactionID,
                                           const QString & storeLocation,
                                           const QString & date,
                                           const QString & time,
                                           const QString & productDetail,
                                           Quantity quantity,
                                           double unitPrice)
{
    SalesData::TransactionLine line;
    line.transactionID = transactionID;
    line.storeLocation = storeLocation;
    line.date          = QDate::fromString(date, "yyyy-MM-dd");
    line.time          = QTime::fromString(time, "hh:mm:ss");
    line.productDetail = productDetail;
    line.quantity      = quantity;
    line.unitPrice     = moneyFromDouble(unitPrice);
    SalesData::deriveFields(line);
    return line;
}

/**
 * Nine lines, five transactions, two store locations, two months.
 *
 * Revenue: 31.00 in total; 2023-01: 18.50, 2023-02: 12.50.
 * Weekdays: Monday 22.00, Tuesday 4.50, Saturday 4.50.
 * Products: Latte 12.00, Croissant 12.50, Espresso 2.00, Tea 4.50.
 */
inline SalesData::TransactionLineList coffeeShopLines() {
    SalesData::TransactionLineList lines;
    // Monday.
    lines << makeLine(1, "Astoria",         "2023-01-02", "07:15:00", "Latte",     2, 3.00);
    lines << makeLine(1, "Astoria",         "2023-01-02", "07:15:00", "Croissant", 1, 2.50);
    lines << makeLine(2, "Astoria",         "2023-01-02", "08:30:00", "Latte",     1, 3.00);
    lines << makeLine(2, "Astoria",         "2023-01-02", "08:30:00", "Croissant", 1, 2.50);
    // Saturday.
    lines << makeLine(3, "Lower Manhattan", "2023-01-07", "10:05:00", "Espresso",  1, 2.00);
    lines << makeLine(3, "Lower Manhattan", "2023-01-07", "10:05:00", "Croissant", 1, 2.50);
    // Monday.
    lines << makeLine(4, "Lower Manhattan", "2023-02-06", "09:00:00", "Latte",     1, 3.00);
    lines << makeLine(4, "Lower Manhattan", "2023-02-06", "09:00:00", "Croissant", 2, 2.50);
    // Tuesday.
    lines << makeLine(5, "Astoria",         "2023-02-07", "13:45:00", "Tea",       3, 1.50);
    return lines;
}

inline SalesData::Dataset coffeeShop() {
    return SalesData::Dataset(coffeeShopLines());
}

inline QList<Analytics::Basket> exampleBaskets() {
    // {A,B}, {A,B}, {A,C}, {B,C}, {A,B,C} with A = 0, B = 1, C = 2.
    QList<Analytics::Basket> baskets;
    baskets << (Analytics::Basket() << 0 << 1);
    baskets << (Analytics::Basket() << 0 << 1);
    baskets << (Analytics::Basket() << 0 << 2);
    baskets << (Analytics::Basket() << 1 << 2);
    baskets << (Analytics::Basket() << 0 << 1 << 2);
    return baskets;
}

}

#endif // FIXTURES_H
