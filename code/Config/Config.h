#ifndef CONFIG_H
#define CONFIG_H

#include <QString>
#include <QStringList>
#include <QByteArray>
#include <QChar>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QJsonValue>
#include <QDebug>

#include "../Analytics/QueryParameters.h"

namespace Config {

    class Config {
    public:
        Config();
        bool parse(const QString & fileName, QString * errorMessage = NULL);
        bool parseJSON(const QByteArray & rawJSON, QString * errorMessage = NULL);
        bool validate(QString * errorMessage = NULL) const;

        const QString & getFileName() const { return this->fileName; }

        // Getters (dataset).
        QChar getSeparator() const { return this->separator; }
        const QStringList & getDateFormats() const { return this->dateFormats; }
        const QStringList & getTimeFormats() const { return this->timeFormats; }

        // Getters (query).
        const Analytics::QueryParameters & getQueryParameters() const { return this->queryParameters; }

        // Getters (cache).
        int getFrequentItemsetCacheSize() const { return this->frequentItemsetCacheSize; }

    protected:
        // Parsing helper methods (all static).
        static void setTypeError(QString * typeError, const QString & path, const QString & key, const QString & expected);
        static QJsonObject parseObject(const QJsonObject & json, const QString & path, const QString & key, QString * typeError);
        static double parseDouble(const QJsonObject & json, const QString & path, const QString & key, double defaultValue, QString * typeError);
        static int parseInt(const QJsonObject & json, const QString & path, const QString & key, int defaultValue, QString * typeError);
        static QString parseString(const QJsonObject & json, const QString & path, const QString & key, const QString & defaultValue, QString * typeError);
        static QStringList parseStringList(const QJsonObject & json, const QString & path, const QString & key, const QStringList & defaultValue, QString * typeError);

        QString fileName;

        // Dataset.
        QChar separator;
        QStringList dateFormats;
        QStringList timeFormats;

        // Query.
        Analytics::QueryParameters queryParameters;

        // Cache.
        int frequentItemsetCacheSize;

#ifdef DEBUG
    friend QDebug operator<<(QDebug dbg, const Config & config);
#endif
    };

#ifdef DEBUG
    // QDebug() streaming output operators.
    QDebug operator<<(QDebug dbg, const Config & config);
#endif

}


#endif // CONFIG_H
