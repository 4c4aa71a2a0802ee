#include "common.h"

static const char * WEEKDAY_NAMES[NUM_WEEKDAYS] = {
    "Monday",
    "Tuesday",
    "Wednesday",
    "Thursday",
    "Friday",
    "Saturday",
    "Sunday"
};

QString weekdayName(Weekday weekday) {
    Q_ASSERT_X(weekday >= 0 && weekday < NUM_WEEKDAYS, "weekdayName", "Weekday out of range.");
    return QString(WEEKDAY_NAMES[weekday]);
}

QStringList weekdayNames() {
    QStringList names;
    for (Weekday d = 0; d < NUM_WEEKDAYS; d++)
        names << WEEKDAY_NAMES[d];
    return names;
}

void registerCommonMetaTypes() {
    qRegisterMetaType<Money>("Money");
    qRegisterMetaType<TransactionID>("TransactionID");
}
