#ifndef COMMON_H
#define COMMON_H

#include <QList>
#include <QString>
#include <QStringList>
#include <QMetaType>

// Monetary amounts are stored as fixed-point integers: 1 unit equals
// 1/MONEY_SCALE of the currency. Sums over any grouping of lines are then
// exactly equal to each other.
typedef qint64 Money;
#define MONEY_SCALE 10000

typedef quint64 TransactionID;
typedef quint32 Quantity;

inline Money moneyFromDouble(double amount) {
    return qRound64(amount * MONEY_SCALE);
}

inline double moneyToDouble(Money amount) {
    return ((double) amount) / MONEY_SCALE;
}

// Canonical weekday order, Monday first (matches QDate::dayOfWeek() - 1).
#define NUM_WEEKDAYS 7
#define NUM_HOURS 24
typedef int Weekday;
typedef int Hour;

QString weekdayName(Weekday weekday);
QStringList weekdayNames();

void registerCommonMetaTypes();

#endif // COMMON_H
