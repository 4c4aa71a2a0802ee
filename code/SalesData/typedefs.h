#ifndef SALESDATA_TYPEDEFS_H
#define SALESDATA_TYPEDEFS_H

#include <QtGlobal>
#include <QMetaType>
#include <QVector>
#include <QString>
#include <QDate>
#include <QTime>
#include <QDebug>

#include "../common/common.h"


namespace SalesData {

// A single purchased line item. The last four fields are derived once, at
// load time.
struct TransactionLine {
    TransactionLine() : transactionID(0), quantity(0), unitPrice(0), revenue(0), hour(0), weekday(0) {}

    TransactionID transactionID;
    QString storeLocation;
    QDate date;
    QTime time;
    QString productDetail;
    Quantity quantity;
    Money unitPrice;

    // Derived.
    Money revenue;
    Hour hour;
    Weekday weekday;
    QString monthBucket;

    QString weekdayName() const { return ::weekdayName(this->weekday); }
};
typedef QVector<TransactionLine> TransactionLineList;

void deriveFields(TransactionLine & line);
QString monthBucketForDate(const QDate & date);

#ifdef DEBUG
// QDebug() streaming output operators.
QDebug operator<<(QDebug dbg, const TransactionLine & line);
#endif

}

#endif // SALESDATA_TYPEDEFS_H
