#ifndef TESTDATASET_H
#define TESTDATASET_H

#include <QtTest/QtTest>

#include "../Dataset.h"


using namespace SalesData;

class TestDataset : public QObject {
    Q_OBJECT

private slots:
    void basic();
    void empty();
    void sharing();
};

#endif // TESTDATASET_H
