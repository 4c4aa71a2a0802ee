#include "typedefs.h"


namespace SalesData {

/**
 * Compute the derived fields of a transaction line: revenue, hour, weekday
 * and month bucket. The date and time must be valid.
 */
void deriveFields(TransactionLine & line) {
    Q_ASSERT(line.date.isValid());
    Q_ASSERT(line.time.isValid());

    line.revenue     = line.unitPrice * line.quantity;
    line.hour        = line.time.hour();
    line.weekday     = line.date.dayOfWeek() - 1;
    line.monthBucket = monthBucketForDate(line.date);
}

QString monthBucketForDate(const QDate & date) {
    return date.toString("yyyy-MM");
}

#ifdef DEBUG
    QDebug operator<<(QDebug dbg, const TransactionLine & line) {
        const static char * eol = ", ";
        dbg.nospace() << "{"
                      << "transaction = " << line.transactionID << eol
                      << "store = " << line.storeLocation.toStdString().c_str() << eol
                      << "product = " << line.productDetail.toStdString().c_str() << eol
                      << "qty = " << line.quantity << eol
                      << "revenue = " << moneyToDouble(line.revenue) << eol
                      << "when = " << line.weekdayName().toStdString().c_str()
                      << " " << line.hour << "h"
                      << " (" << line.monthBucket.toStdString().c_str() << ")"
                      << "}";

        return dbg.nospace();
    }
#endif
}
