#ifndef REPORT_H
#define REPORT_H

#include <QString>
#include <QStringList>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QJsonValue>
#include <QTextStream>
#include <QMetaType>

#include "Item.h"
#include "Aggregator.h"


namespace Analytics {

    // Everything the presentation layer needs for one filter selection. Plain
    // data, without any rendering concerns.
    struct AnalyticsReport {
        AnalyticsReport() : numLines(0), numBaskets(0), numFrequentItemsets(0) {}

        ItemNameList itemsetIDsToNames(const ItemIDList & itemset) const;
        QString formatRule(const AssociationRule & rule) const;

        KPIs kpis;
        RevenueSeries revenueByMonth;
        RevenueSeries revenueByWeekday;
        RevenueMatrix revenueHeatmap;
        RevenueSeries topProducts;
        QList<AssociationRule> associationRules;
        ItemIDNameHash itemIDNameHash;

        // Stats.
        int numLines;
        int numBaskets;
        int numFrequentItemsets;
    };

    class Report {
    public:
        static QJsonDocument toJson(const AnalyticsReport & report);
        static QString toText(const AnalyticsReport & report);

    protected:
        static QJsonArray seriesToJson(const RevenueSeries & series, const QString & labelKey);
        static QJsonObject ruleToJson(const AnalyticsReport & report, const AssociationRule & rule);
    };
}

Q_DECLARE_METATYPE(Analytics::AnalyticsReport)

#endif // REPORT_H
