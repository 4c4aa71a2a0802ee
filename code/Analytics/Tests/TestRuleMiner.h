#ifndef TESTRULEMINER_H
#define TESTRULEMINER_H

#include <QtTest/QtTest>

#include "Fixtures.h"
#include "../Apriori.h"
#define protected public
#include "../RuleMiner.h"
#undef protected


using namespace Analytics;

class TestRuleMiner : public QObject {
    Q_OBJECT

private slots:
    void basic();
    void bipartitions();
    void minimumConfidence();
    void supplementaryMetrics();
    void rankAssociationRules();
    void getAntecedent();
};

#endif // TESTRULEMINER_H
