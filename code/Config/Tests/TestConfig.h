#ifndef TESTCONFIG_H
#define TESTCONFIG_H

#include <QtTest/QtTest>
#include <QTemporaryFile>

#include "../Config.h"


class TestConfig : public QObject {
    Q_OBJECT

private slots:
    void defaults();
    void parseJSON();
    void partial();
    void invalidJSON();
    void invalidValues_data();
    void invalidValues();
    void wrongTypes_data();
    void wrongTypes();
    void parseFile();
};

#endif // TESTCONFIG_H
