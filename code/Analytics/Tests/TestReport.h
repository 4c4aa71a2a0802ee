#ifndef TESTREPORT_H
#define TESTREPORT_H

#include <QtTest/QtTest>

#include "Fixtures.h"
#include "../Report.h"


using namespace Analytics;

class TestReport : public QObject {
    Q_OBJECT

private slots:
    void init();
    void formatRule();
    void toJson();
    void toText();

private:
    AnalyticsReport report;
};

#endif // TESTREPORT_H
