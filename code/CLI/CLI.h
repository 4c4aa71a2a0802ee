#ifndef CLI_H
#define CLI_H

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include <QThread>
#include <QTimer>
#include <QFile>
#include <QTime>
#include <QSet>

#include "../common/common.h"
#include "../Config/Config.h"
#include "../SalesData/Loader.h"
#include "../Analytics/Analyst.h"

class CLI : public QObject {
    Q_OBJECT

public:
    CLI();
    ~CLI();

    bool start();

    static QString outputTarget(bool outputStdout, const QString & outputFile);

signals:
    // For cross-thread communication.
    void analyze(const Analytics::FilterSelection & selection);

public slots:
    // Analyst.
    void updateAnalyzingStatus(bool analyzing);
    void updateAnalystStats(int duration, quint64 lines, quint64 baskets, quint64 frequentItemsets, quint64 associationRules);
    void analyzed(const Analytics::FilterSelection & selection, const Analytics::AnalyticsReport & report);
    void failed(const Analytics::FilterSelection & selection, const QString & errorMessage);

private slots:
    void run();

private:
    // CLI functionality.
    bool parseCommandOptions();
    void verifyConfig();
    void listCategories();

    // Helpers.
    bool writeReport(const Analytics::AnalyticsReport & report);
    void out(const QString & module, const QString & output, int verbosity);
    void exit(int returnCode);

    // Logic.
    bool initConfig();
    bool loadDataset();
    bool buildSelection(Analytics::FilterSelection & selection);
    void initLogic();
    void connectLogic();
    void assignThreads();

    // CLI options.
    int optionVerbosity;
    QString optionConfigFile;
    bool optionVerifyConfig;
    QString optionInputFile;
    QStringList optionLocations;
    QStringList optionMonths;
    bool optionList;
    bool optionOutputStdout;
    QString optionOutputFile;
    QString optionFormat;

    // Threads.
    QThread analystThread;

    // Core components.
    Config::Config * config;
    SalesData::Dataset dataset;
    Analytics::Analyst * analyst;
};

#endif // CLI_H
