#include "Analyst.h"

namespace Analytics {

    Analyst::Analyst(const SalesData::Dataset & dataset, const QueryParameters & parameters, int frequentItemsetCacheSize)
        : frequentItemsetCache(frequentItemsetCacheSize)
    {
        this->dataset = dataset;
        this->parameters = parameters;
    }

    /**
     * The selection the dashboard starts out with: all store locations and
     * all months.
     */
    FilterSelection Analyst::defaultSelection() const {
        return Filter::selectAll(this->dataset);
    }

    /**
     * Compute all aggregates and association rules for a filter selection.
     *
     * An empty selection, or one that matches zero lines, is not an error: it
     * yields zero KPIs, empty series (the weekday series and the heatmap are
     * all zeroes) and no rules. A selection that references unknown store
     * locations or months is rejected.
     *
     * Safe to call concurrently from multiple threads.
     *
     * @param selection
     *   The store locations and month buckets to restrict the query to.
     * @param report
     *   Receives the results.
     * @param errorMessage
     *   Optional; receives a description of the problem when the selection is
     *   invalid.
     * @return
     *   false if the selection is invalid, true otherwise.
     */
    bool Analyst::runAnalytics(const FilterSelection & selection, AnalyticsReport & report, QString * errorMessage) const {
        if (!Filter::validate(this->dataset, selection, errorMessage))
            return false;

        const SalesData::TransactionLineList lines = Filter::apply(this->dataset, selection);

        report = AnalyticsReport();
        report.numLines = lines.size();

        // Aggregates.
        report.kpis             = Aggregator::calculateKPIs(lines);
        report.revenueByMonth   = Aggregator::revenueByMonth(lines);
        report.revenueByWeekday = Aggregator::revenueByWeekday(lines);
        report.revenueHeatmap   = Aggregator::revenueHeatmap(lines);
        report.topProducts      = Aggregator::topProducts(lines, this->parameters.topProducts);

        // Market basket analysis.
        BasketSet basketSet = BasketBuilder::buildBaskets(lines);
        report.numBaskets = basketSet.size();
        report.itemIDNameHash = basketSet.itemIDNameHash;

        QList<FrequentItemset> frequentItemsets = this->mineFrequentItemsets(basketSet);
        report.numFrequentItemsets = frequentItemsets.size();

        QList<AssociationRule> associationRules = RuleMiner::mineAssociationRules(frequentItemsets,
                                                                                  this->parameters.minLift,
                                                                                  this->parameters.minConfidence);
        report.associationRules = RuleMiner::rankAssociationRules(associationRules, this->parameters.maxRules);

#ifdef ANALYST_DEBUG
        qDebug() << "lines:" << report.numLines
                 << "baskets:" << report.numBaskets
                 << "frequent itemsets:" << report.numFrequentItemsets
                 << "rules:" << associationRules.size() << "(" << report.associationRules.size() << "reported)";
#endif

        return true;
    }


    //------------------------------------------------------------------------
    // Public slots.

    void Analyst::analyze(const Analytics::FilterSelection & selection) {
        QTime timer;
        timer.start();

        // Notify the UI.
        emit analyzing(true);

        AnalyticsReport report;
        QString errorMessage;
        if (this->runAnalytics(selection, report, &errorMessage)) {
            emit stats(timer.elapsed(), report.numLines, report.numBaskets, report.numFrequentItemsets, report.associationRules.size());
            emit analyzed(selection, report);
        }
        else {
            qWarning("Query rejected: %s", qPrintable(errorMessage));
            emit failed(selection, errorMessage);
        }

        // Notify the UI.
        emit analyzing(false);
    }


    //------------------------------------------------------------------------
    // Protected methods.

    QList<FrequentItemset> Analyst::mineFrequentItemsets(const BasketSet & basketSet) const {
        QList<FrequentItemset> frequentItemsets;

        if (basketSet.isEmpty())
            return frequentItemsets;

        QByteArray key;
        if (this->frequentItemsetCache.isEnabled()) {
            key = FrequentItemsetCache::fingerprint(basketSet, this->parameters.minSupport, this->parameters.maxItemsetLength);
            if (this->frequentItemsetCache.lookup(key, frequentItemsets)) {
#ifdef ANALYST_DEBUG
                qDebug() << "frequent itemset cache hit:" << key.toHex();
#endif
                return frequentItemsets;
            }
        }

        Apriori apriori(basketSet.baskets, this->parameters.minSupport, this->parameters.maxItemsetLength);
        frequentItemsets = apriori.mineFrequentItemsets();

        if (this->frequentItemsetCache.isEnabled())
            this->frequentItemsetCache.insert(key, frequentItemsets);

        return frequentItemsets;
    }


    //------------------------------------------------------------------------
    // Other.

    void registerMetaTypes() {
        registerBasicMetaTypes();
        qRegisterMetaType<Analytics::FilterSelection>("Analytics::FilterSelection");
        qRegisterMetaType<Analytics::AnalyticsReport>("Analytics::AnalyticsReport");
    }
}
