#ifndef ANALYST_H
#define ANALYST_H

#include <QObject>
#include <QTime>
#include <QList>
#include <QString>

#include "../SalesData/Dataset.h"
#include "Item.h"
#include "QueryParameters.h"
#include "Filter.h"
#include "Aggregator.h"
#include "BasketBuilder.h"
#include "Apriori.h"
#include "RuleMiner.h"
#include "FrequentItemsetCache.h"
#include "Report.h"


namespace Analytics {

#ifdef DEBUG
//    #define ANALYST_DEBUG 1
#endif

    /**
     * The query interface of the analytics engine: a pure function of the
     * (immutable) data set and a filter selection. The only state besides
     * the data set and the parameters is the optional frequent itemset
     * cache, which never changes the results.
     */
    class Analyst : public QObject {
        Q_OBJECT

    public:
        Analyst(const SalesData::Dataset & dataset, const QueryParameters & parameters, int frequentItemsetCacheSize = 0);

        // Parameters must not be changed while a query is running.
        void setParameters(const QueryParameters & parameters) { this->parameters = parameters; }
        const QueryParameters & getParameters() const { return this->parameters; }
        const SalesData::Dataset & getDataset() const { return this->dataset; }
        const FrequentItemsetCache & getFrequentItemsetCache() const { return this->frequentItemsetCache; }

        FilterSelection defaultSelection() const;
        bool runAnalytics(const FilterSelection & selection, AnalyticsReport & report, QString * errorMessage = NULL) const;

    signals:
        // Signals for UI.
        void analyzing(bool analyzing);
        void stats(int duration, quint64 lines, quint64 baskets, quint64 frequentItemsets, quint64 associationRules);

        // Signals for calculations.
        void analyzed(const Analytics::FilterSelection & selection, const Analytics::AnalyticsReport & report);
        void failed(const Analytics::FilterSelection & selection, const QString & errorMessage);

    public slots:
        void analyze(const Analytics::FilterSelection & selection);

    protected:
        QList<FrequentItemset> mineFrequentItemsets(const BasketSet & basketSet) const;

        SalesData::Dataset dataset;
        QueryParameters parameters;
        mutable FrequentItemsetCache frequentItemsetCache;
    };

    void registerMetaTypes();
}

#endif // ANALYST_H
