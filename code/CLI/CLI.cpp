#include "CLI.h"


//---------------------------------------------------------------------------
// Public methods.

CLI::CLI() {
    this->config = NULL;
    this->analyst = NULL;

    // Options for which defaults are needed.
    this->optionVerbosity = 0;
    this->optionVerifyConfig = false;
    this->optionList = false;
    this->optionOutputStdout = true;
    this->optionFormat = "json";

    registerCommonMetaTypes();
    Analytics::registerMetaTypes();
}

CLI::~CLI() {
    if (this->analystThread.isRunning()) {
        this->analystThread.quit();
        this->analystThread.wait();
    }

    if (this->config != NULL)
        delete this->config;
    if (this->analyst != NULL)
        delete this->analyst;
}

/**
 * Parse the command line and the config file, then schedule the actual work
 * to run as soon as the event loop has started.
 *
 * @return
 *   false when the command line or config file are invalid.
 */
bool CLI::start() {
    if (!this->parseCommandOptions())
        return false;

    this->out("CLI", "Starting...", 1);
    if (!this->initConfig())
        return false;

    QTimer::singleShot(0, this, SLOT(run()));
    return true;
}


//---------------------------------------------------------------------------
// Public slots.

void CLI::updateAnalyzingStatus(bool analyzing) {
    if (analyzing)
        this->out("Analyst", "Analyzing...", 0);
    else
        this->out("Analyst", "Done.", 0);
}

void CLI::updateAnalystStats(int duration, quint64 lines, quint64 baskets, quint64 frequentItemsets, quint64 associationRules) {
    this->out(
                "Analyst",
                QString(" |- %1 lines -> %2 baskets (%3 s)")
                .arg(lines)
                .arg(baskets)
                .arg(QString::number(duration / 1000.0, 'f', 2)),
                1
    );
    this->out(
                "Analyst",
                QString(" \\- %1 frequent itemsets, %2 association rules")
                .arg(frequentItemsets)
                .arg(associationRules),
                1
    );
}

void CLI::analyzed(const Analytics::FilterSelection & selection, const Analytics::AnalyticsReport & report) {
    Q_UNUSED(selection)

    this->out(
                "Analyst",
                QString("Revenue %1 over %2 transactions (average ticket %3).")
                .arg(QString::number(moneyToDouble(report.kpis.totalRevenue), 'f', 2))
                .arg(report.kpis.transactionCount)
                .arg(QString::number(report.kpis.averageTicket, 'f', 2)),
                1
    );

    this->exit(this->writeReport(report) ? 0 : 1);
}

void CLI::failed(const Analytics::FilterSelection & selection, const QString & errorMessage) {
    Q_UNUSED(selection)

    this->out("ERROR", errorMessage, 0);
    this->exit(1);
}


//---------------------------------------------------------------------------
// Private slots.

void CLI::run() {
    // One-off task: config verification.
    if (this->optionVerifyConfig) {
        this->out("CLI", "Verifying config file.", 0);
        this->verifyConfig();
        this->exit(0);
        return;
    }

    if (!this->loadDataset()) {
        this->exit(1);
        return;
    }

    if (this->optionList) {
        this->listCategories();
        this->exit(0);
        return;
    }

    Analytics::FilterSelection selection;
    if (!this->buildSelection(selection)) {
        this->exit(1);
        return;
    }

    this->initLogic();
    this->connectLogic();
    this->assignThreads();

    this->out(
                "CLI",
                QString("Querying %1 store location(s) over %2 month(s).")
                .arg(selection.storeLocations.size())
                .arg(selection.monthBuckets.size()),
                0
    );
    emit analyze(selection);
}


//---------------------------------------------------------------------------
// Private methods (CLI functionality).

bool CLI::parseCommandOptions() {
    QCommandLineParser options;
    options.setApplicationDescription("Sales analytics and market basket analysis for transactional retail data.");
    options.addHelpOption();
    // Config.
    options.addOption(QCommandLineOption("config", "Config file (optional; defaults are used otherwise).", "file"));
    options.addOption(QCommandLineOption("verify-config", "Verify a config file."));
    // Data.
    options.addOption(QCommandLineOption(QStringList() << "i" << "input", "Transactions CSV file (required).", "file"));
    options.addOption(QCommandLineOption("list", "List the available store locations and months, then quit."));
    // Filter.
    options.addOption(QCommandLineOption(QStringList() << "l" << "location", "Restrict to this store location; may be repeated. Defaults to all.", "name"));
    options.addOption(QCommandLineOption(QStringList() << "m" << "month", "Restrict to this month (yyyy-MM); may be repeated. Defaults to all.", "month"));
    // Output.
    options.addOption(QCommandLineOption(QStringList() << "o" << "output", "Output file for the results.", "file"));
    options.addOption(QCommandLineOption("output-stdout", "Use stdout as output for the results (the default; overrides --output)."));
    options.addOption(QCommandLineOption("format", "Output format: json or text.", "format", "json"));
    // Other.
    options.addOption(QCommandLineOption(QStringList() << "q" << "quiet", "Zero output about the current state."));
    options.addOption(QCommandLineOption(QStringList() << "v" << "verbose", "Show more information about the process; specify twice for more detail."));

    if (!options.parse(QCoreApplication::arguments())) {
        this->out("ERROR", options.errorText(), 0);
        QTextStream(stderr) << options.helpText();
        return false;
    }
    if (options.isSet("help")) {
        QTextStream(stdout) << options.helpText();
        return false;
    }

    // Validate & parse general usage.
    this->optionVerifyConfig = options.isSet("verify-config");
    if (!this->optionVerifyConfig && !options.isSet("input")) {
        this->out("ERROR", "--input is required.", 0);
        QTextStream(stderr) << options.helpText();
        return false;
    }
    this->optionConfigFile = options.value("config");
    this->optionInputFile = options.value("input");
    this->optionList = options.isSet("list");

    // Filter.
    this->optionLocations = options.values("location");
    this->optionMonths = options.values("month");

    // Output.
    this->optionFormat = options.value("format");
    if (this->optionFormat != "json" && this->optionFormat != "text") {
        this->out("ERROR", QString("--format must be 'json' or 'text', got '%1'.").arg(this->optionFormat), 0);
        return false;
    }
    this->optionOutputStdout = options.isSet("output-stdout") || !options.isSet("output");
    if (!this->optionOutputStdout)
        this->optionOutputFile = options.value("output");

    // Verbosity.
    if (options.isSet("quiet"))
        this->optionVerbosity = -1;
    else {
        this->optionVerbosity = 0;
        foreach (const QString & name, options.optionNames())
            if (name == "v" || name == "verbose")
                this->optionVerbosity++;
    }

    return true;
}

void CLI::verifyConfig() {
    const Analytics::QueryParameters & p = this->config->getQueryParameters();

    this->out("Config", QString("source: %1").arg(this->config->getFileName().isEmpty() ? "(defaults)" : this->config->getFileName()), 0);
    this->out("Config", QString(" |- separator: '%1'").arg(this->config->getSeparator()), 0);
    this->out("Config", QString(" |- date formats: %1").arg(this->config->getDateFormats().join(", ")), 0);
    this->out("Config", QString(" |- time formats: %1").arg(this->config->getTimeFormats().join(", ")), 0);
    this->out("Config", QString(" |- top products: %1").arg(p.topProducts), 0);
    this->out("Config", QString(" |- minimum support: %1, maximum itemset length: %2").arg(p.minSupport).arg(p.maxItemsetLength), 0);
    this->out("Config", QString(" |- minimum lift: %1, minimum confidence: %2, maximum rules: %3").arg(p.minLift).arg(p.minConfidence).arg(p.maxRules), 0);
    this->out("Config", QString(" \\- frequent itemset cache: %1").arg(this->config->getFrequentItemsetCacheSize()), 0);
}

void CLI::listCategories() {
    QTextStream out(stdout);

    out << "Store locations:\n";
    foreach (const QString & location, this->dataset.getStoreLocations())
        out << "  " << location << "\n";
    out << "Months:\n";
    foreach (const QString & month, this->dataset.getSortedMonthBuckets())
        out << "  " << month << "\n";

    out.flush();
}


//---------------------------------------------------------------------------
// Private methods (helpers).

bool CLI::writeReport(const Analytics::AnalyticsReport & report) {
    QFile file;
    bool opened = false;

    const QString target = CLI::outputTarget(this->optionOutputStdout, this->optionOutputFile);

    if (this->optionOutputStdout) {
        this->out("CLI", QString("Saving results to %1.").arg(target), 1);
        opened = file.open(stdout, QIODevice::WriteOnly | QIODevice::Text);
    }
    else {
        this->out("CLI", QString("Saving results to %1.").arg(target), 0);
        file.setFileName(this->optionOutputFile);
        opened = file.open(QIODevice::WriteOnly | QIODevice::Text);
    }

    if (!opened) {
        qCritical("Could not open %s for writing.", qPrintable(target));
        return false;
    }

    QTextStream out(&file);
    out.setCodec("UTF-8");
    if (this->optionFormat == "text")
        out << Analytics::Report::toText(report);
    else
        out << Analytics::Report::toJson(report).toJson(QJsonDocument::Indented);
    out.flush();

    file.close();
    return true;
}

/**
 * Human-readable name of the destination of the report, for messages.
 */
QString CLI::outputTarget(bool outputStdout, const QString & outputFile) {
    if (outputStdout)
        return "stdout";
    else
        return QString("'%1'").arg(outputFile);
}

void CLI::out(const QString & module, const QString & output, int verbosity) {
    static QTextStream out(stderr);
    static QString startBold = "\033[7m";
    static QString stopBold = "\033[0m";
    static QString startRedBG = "\033[0;41m";
    static QString stopRedBG = "\033[0m";


    // Ignore too verbose messages; errors are always shown.
    bool isError = (module == "WARNING" || module == "ERROR");
    if (verbosity > this->optionVerbosity && !isError)
        return;

    // Blink the output if it's a warning or an error!
    QString message = output;
    if (isError)
        message = startRedBG + output + stopRedBG;

    out << QString(startBold + "[%1]" + stopBold + " ").arg(module, -7) << message << "\n";
    out.flush();
}

void CLI::exit(int returnCode) {
    if (this->analystThread.isRunning()) {
        this->analystThread.quit();
        this->analystThread.wait();
    }

    QCoreApplication::instance()->exit(returnCode);
}


//---------------------------------------------------------------------------
// Private methods (logic).

bool CLI::initConfig() {
    this->config = new Config::Config();

    if (this->optionConfigFile.isEmpty())
        return true;

    QString errorMessage;
    if (!this->config->parse(this->optionConfigFile, &errorMessage)) {
        qCritical("Failed to parse the config file '%s': %s", qPrintable(this->optionConfigFile), qPrintable(errorMessage));
        return false;
    }
    return true;
}

/**
 * Load the data set, once. A failure here is fatal.
 */
bool CLI::loadDataset() {
    QTime timer;
    timer.start();

    this->out("Loader", QString("Loading '%1'...").arg(this->optionInputFile), 0);

    SalesData::Loader loader(*this->config);
    SalesData::LoadError error;
    if (!loader.load(this->optionInputFile, this->dataset, &error)) {
        qCritical("Failed to load '%s': %s", qPrintable(this->optionInputFile), qPrintable(error.toString()));
        return false;
    }

    this->out(
                "Loader",
                QString(" \\- %1 lines, %2 store locations, %3 months (%4 s)")
                .arg(this->dataset.size())
                .arg(this->dataset.getStoreLocations().size())
                .arg(this->dataset.getMonthBuckets().size())
                .arg(QString::number(timer.elapsed() / 1000.0, 'f', 2)),
                1
    );
    return true;
}

/**
 * Build the filter selection from the --location and --month options; each
 * of them defaults to all values in the data set.
 */
bool CLI::buildSelection(Analytics::FilterSelection & selection) {
    selection = Analytics::Filter::selectAll(this->dataset);
    if (!this->optionLocations.isEmpty())
        selection.storeLocations = this->optionLocations.toSet();
    if (!this->optionMonths.isEmpty())
        selection.monthBuckets = this->optionMonths.toSet();

    QString errorMessage;
    if (!Analytics::Filter::validate(this->dataset, selection, &errorMessage)) {
        this->out("ERROR", errorMessage, 0);
        return false;
    }
    return true;
}

void CLI::initLogic() {
    this->analyst = new Analytics::Analyst(this->dataset,
                                           this->config->getQueryParameters(),
                                           this->config->getFrequentItemsetCacheSize());
}

void CLI::connectLogic() {
    // Logic -> UI.
    connect(this->analyst, SIGNAL(analyzing(bool)), SLOT(updateAnalyzingStatus(bool)));
    connect(this->analyst, SIGNAL(stats(int,quint64,quint64,quint64,quint64)), SLOT(updateAnalystStats(int,quint64,quint64,quint64,quint64)));
    connect(this->analyst, SIGNAL(analyzed(Analytics::FilterSelection,Analytics::AnalyticsReport)), SLOT(analyzed(Analytics::FilterSelection,Analytics::AnalyticsReport)));
    connect(this->analyst, SIGNAL(failed(Analytics::FilterSelection,QString)), SLOT(failed(Analytics::FilterSelection,QString)));

    // UI -> logic.
    connect(this, SIGNAL(analyze(Analytics::FilterSelection)), this->analyst, SLOT(analyze(Analytics::FilterSelection)));
}

void CLI::assignThreads() {
    this->analyst->moveToThread(&this->analystThread);
    this->analystThread.start();
}
