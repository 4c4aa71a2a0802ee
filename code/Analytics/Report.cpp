#include "Report.h"

#include <cmath>

namespace Analytics {

    //------------------------------------------------------------------------
    // AnalyticsReport.

    /**
     * Convert all item IDs in an itemset to item names.
     */
    ItemNameList AnalyticsReport::itemsetIDsToNames(const ItemIDList & itemset) const {
        ItemNameList itemNames;

        foreach (ItemID id, itemset)
            itemNames.append(this->itemIDNameHash.value(id));

        return itemNames;
    }

    /**
     * Render a rule the way the dashboard's association table does, e.g.
     * "Croissant, Latte ➜ Espresso".
     */
    QString AnalyticsReport::formatRule(const AssociationRule & rule) const {
        return QStringList(this->itemsetIDsToNames(rule.antecedent)).join(", ")
               + QString::fromUtf8(" \xe2\x9e\x9c ")
               + QStringList(this->itemsetIDsToNames(rule.consequent)).join(", ");
    }


    //------------------------------------------------------------------------
    // Public static methods.

    QJsonDocument Report::toJson(const AnalyticsReport & report) {
        QJsonObject json;

        QJsonObject kpisJSON;
        kpisJSON.insert("total revenue", moneyToDouble(report.kpis.totalRevenue));
        kpisJSON.insert("transactions", report.kpis.transactionCount);
        kpisJSON.insert("average ticket", report.kpis.averageTicket);
        kpisJSON.insert("total quantity", (double) report.kpis.totalQuantity);
        json.insert("kpis", kpisJSON);

        json.insert("revenue by month", Report::seriesToJson(report.revenueByMonth, "month"));
        json.insert("revenue by weekday", Report::seriesToJson(report.revenueByWeekday, "weekday"));

        QJsonObject heatmapJSON;
        QJsonArray rowsJSON;
        for (int d = 0; d < report.revenueHeatmap.size(); d++) {
            QJsonArray cellsJSON;
            foreach (Money revenue, report.revenueHeatmap[d])
                cellsJSON.append(moneyToDouble(revenue));
            rowsJSON.append(cellsJSON);
        }
        heatmapJSON.insert("weekdays", QJsonArray::fromStringList(weekdayNames()));
        heatmapJSON.insert("revenue", rowsJSON);
        json.insert("revenue heatmap", heatmapJSON);

        json.insert("top products", Report::seriesToJson(report.topProducts, "product"));

        QJsonArray rulesJSON;
        foreach (const AssociationRule & rule, report.associationRules)
            rulesJSON.append(Report::ruleToJson(report, rule));
        json.insert("association rules", rulesJSON);

        return QJsonDocument(json);
    }

    /**
     * Human-readable rendering: the KPI cards plus the association table,
     * with metrics rounded to three decimals.
     */
    QString Report::toText(const AnalyticsReport & report) {
        QString text;
        QTextStream out(&text);

        out << "Total revenue: " << QString::number(moneyToDouble(report.kpis.totalRevenue), 'f', 0) << "\n";
        out << "Transactions: " << report.kpis.transactionCount << "\n";
        out << "Average ticket: " << QString::number(report.kpis.averageTicket, 'f', 2) << "\n";
        out << "Quantity sold: " << report.kpis.totalQuantity << "\n";
        out << "\n";

        out << "Top products:\n";
        foreach (const LabeledRevenue & product, report.topProducts)
            out << "  " << product.first << ": " << QString::number(moneyToDouble(product.second), 'f', 2) << "\n";
        out << "\n";

        if (report.associationRules.isEmpty())
            out << "No association rules found.\n";
        else {
            out << "Top product associations:\n";
            foreach (const AssociationRule & rule, report.associationRules) {
                out << "  " << report.formatRule(rule)
                    << " (support=" << QString::number(rule.support, 'f', 3)
                    << ", confidence=" << QString::number(rule.confidence, 'f', 3)
                    << ", lift=" << QString::number(rule.lift, 'f', 3)
                    << ")\n";
            }
        }

        out.flush();
        return text;
    }


    //------------------------------------------------------------------------
    // Protected static methods.

    QJsonArray Report::seriesToJson(const RevenueSeries & series, const QString & labelKey) {
        QJsonArray seriesJSON;
        foreach (const LabeledRevenue & entry, series) {
            QJsonObject entryJSON;
            entryJSON.insert(labelKey, entry.first);
            entryJSON.insert("revenue", moneyToDouble(entry.second));
            seriesJSON.append(entryJSON);
        }
        return seriesJSON;
    }

    QJsonObject Report::ruleToJson(const AnalyticsReport & report, const AssociationRule & rule) {
        QJsonObject ruleJSON;
        ruleJSON.insert("antecedent", QJsonArray::fromStringList(report.itemsetIDsToNames(rule.antecedent)));
        ruleJSON.insert("consequent", QJsonArray::fromStringList(report.itemsetIDsToNames(rule.consequent)));
        ruleJSON.insert("products", report.formatRule(rule));
        ruleJSON.insert("support", rule.support);
        ruleJSON.insert("confidence", rule.confidence);
        ruleJSON.insert("lift", rule.lift);
        ruleJSON.insert("antecedent support", rule.antecedentSupport);
        ruleJSON.insert("consequent support", rule.consequentSupport);
        ruleJSON.insert("leverage", rule.leverage);
        // JSON has no representation for infinity.
        if (std::isinf(rule.conviction))
            ruleJSON.insert("conviction", QJsonValue(QJsonValue::Null));
        else
            ruleJSON.insert("conviction", rule.conviction);
        return ruleJSON;
    }
}
