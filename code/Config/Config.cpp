#include "Config.h"

#include <cmath>
#include <limits>

namespace Config {
    Config::Config() {
        this->separator = ',';
        this->dateFormats << "yyyy-MM-dd" << "M/d/yyyy" << "d-M-yyyy";
        this->timeFormats << "hh:mm:ss" << "h:mm:ss" << "hh:mm";
        this->frequentItemsetCacheSize = 16;
    }

    /**
     * Parse the given config file. Keys that are absent keep their default
     * value.
     *
     * @param fileName
     *   The full path to a JSON config file.
     * @param errorMessage
     *   Optional; receives a description of the problem when parsing fails.
     * @return
     *   true when the file was read, parsed and validated successfully.
     */
    bool Config::parse(const QString & fileName, QString * errorMessage) {
        this->fileName = fileName;

        QFile file;

        file.setFileName(fileName);
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            if (errorMessage != NULL)
                *errorMessage = QString("Could not open the config file '%1' for reading.").arg(fileName);
            return false;
        }
        else {
            QByteArray rawJSON = file.readAll();
            return this->parseJSON(rawJSON, errorMessage);
        }
    }

    bool Config::parseJSON(const QByteArray & rawJSON, QString * errorMessage) {
        QJsonParseError parseError;
        QJsonDocument document = QJsonDocument::fromJson(rawJSON, &parseError);
        if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
            if (errorMessage != NULL) {
                if (parseError.error != QJsonParseError::NoError)
                    *errorMessage = QString("Invalid JSON at offset %1: %2.").arg(parseError.offset).arg(parseError.errorString());
                else
                    *errorMessage = "The config must be a JSON object.";
            }
            return false;
        }
        const QJsonObject json = document.object();
        // The first value of the wrong JSON type; parsing continues with the
        // defaults and fails at the end.
        QString typeError;

        // Dataset.
        const QJsonObject datasetJSON = Config::parseObject(json, "", "dataset", &typeError);
        QString separator = Config::parseString(datasetJSON, "dataset/", "separator", QString(this->separator), &typeError);
        if (separator.size() != 1) {
            if (errorMessage != NULL)
                *errorMessage = QString("dataset/separator must be a single character, got '%1'.").arg(separator);
            return false;
        }
        this->separator   = separator.at(0);
        this->dateFormats = Config::parseStringList(datasetJSON, "dataset/", "date formats", this->dateFormats, &typeError);
        this->timeFormats = Config::parseStringList(datasetJSON, "dataset/", "time formats", this->timeFormats, &typeError);

        // Query.
        const QJsonObject queryJSON = Config::parseObject(json, "", "query", &typeError);
        Analytics::QueryParameters & p = this->queryParameters;
        // Query: aggregation.
        const QJsonObject aggregationJSON = Config::parseObject(queryJSON, "query/", "aggregation", &typeError);
        p.topProducts      = Config::parseInt(aggregationJSON, "query/aggregation/", "top products", p.topProducts, &typeError);
        // Query: patterns.
        const QJsonObject patternsJSON = Config::parseObject(queryJSON, "query/", "patterns", &typeError);
        p.minSupport       = Config::parseDouble(patternsJSON, "query/patterns/", "minimum support", p.minSupport, &typeError);
        p.maxItemsetLength = Config::parseInt(patternsJSON, "query/patterns/", "maximum itemset length", p.maxItemsetLength, &typeError);
        // Query: association rules.
        const QJsonObject associationRulesJSON = Config::parseObject(queryJSON, "query/", "association rules", &typeError);
        p.minLift          = Config::parseDouble(associationRulesJSON, "query/association rules/", "minimum lift", p.minLift, &typeError);
        p.minConfidence    = Config::parseDouble(associationRulesJSON, "query/association rules/", "minimum confidence", p.minConfidence, &typeError);
        p.maxRules         = Config::parseInt(associationRulesJSON, "query/association rules/", "maximum rules", p.maxRules, &typeError);

        // Cache.
        const QJsonObject cacheJSON = Config::parseObject(json, "", "cache", &typeError);
        this->frequentItemsetCacheSize = Config::parseInt(cacheJSON, "cache/", "frequent itemsets", this->frequentItemsetCacheSize, &typeError);

        if (!typeError.isNull()) {
            if (errorMessage != NULL)
                *errorMessage = typeError;
            return false;
        }

        return this->validate(errorMessage);
    }

    /**
     * Verify that all settings are within their valid range.
     *
     * @param errorMessage
     *   Optional; receives a description of the first invalid setting.
     * @return
     *   true when all settings are valid.
     */
    bool Config::validate(QString * errorMessage) const {
        QString error;
        const Analytics::QueryParameters & p = this->queryParameters;

        if (this->dateFormats.isEmpty())
            error = "dataset/date formats may not be empty.";
        else if (this->timeFormats.isEmpty())
            error = "dataset/time formats may not be empty.";
        else if (p.topProducts < 0)
            error = QString("query/aggregation/top products must be >= 0, got %1.").arg(p.topProducts);
        else if (!(p.minSupport > 0.0 && p.minSupport <= 1.0))
            error = QString("query/patterns/minimum support must be in (0,1], got %1.").arg(p.minSupport);
        else if (p.maxItemsetLength < 0)
            error = QString("query/patterns/maximum itemset length must be >= 0, got %1.").arg(p.maxItemsetLength);
        else if (p.minLift < 0.0)
            error = QString("query/association rules/minimum lift must be >= 0, got %1.").arg(p.minLift);
        else if (!(p.minConfidence >= 0.0 && p.minConfidence <= 1.0))
            error = QString("query/association rules/minimum confidence must be in [0,1], got %1.").arg(p.minConfidence);
        else if (p.maxRules < 0)
            error = QString("query/association rules/maximum rules must be >= 0, got %1.").arg(p.maxRules);
        else if (this->frequentItemsetCacheSize < 0)
            error = QString("cache/frequent itemsets must be >= 0, got %1.").arg(this->frequentItemsetCacheSize);

        if (error.isNull())
            return true;

        if (errorMessage != NULL)
            *errorMessage = error;
        return false;
    }


    //------------------------------------------------------------------------
    // Static protected methods.

    /**
     * Helpers to read a single, optional key. When the key is present but
     * holds a value of the wrong type, the default value is returned and
     * typeError is set, unless an earlier error was already stored in it.
     *
     * @param path
     *   The path of the enclosing object, used in the error message.
     */
    void Config::setTypeError(QString * typeError, const QString & path, const QString & key, const QString & expected) {
        if (typeError->isNull())
            *typeError = QString("%1%2 must be %3.").arg(path).arg(key).arg(expected);
    }

    QJsonObject Config::parseObject(const QJsonObject & json, const QString & path, const QString & key, QString * typeError) {
        if (!json.contains(key))
            return QJsonObject();
        if (!json[key].isObject()) {
            Config::setTypeError(typeError, path, key, "an object");
            return QJsonObject();
        }
        return json[key].toObject();
    }

    double Config::parseDouble(const QJsonObject & json, const QString & path, const QString & key, double defaultValue, QString * typeError) {
        if (!json.contains(key))
            return defaultValue;
        if (!json[key].isDouble()) {
            Config::setTypeError(typeError, path, key, "a number");
            return defaultValue;
        }
        return json[key].toDouble();
    }

    int Config::parseInt(const QJsonObject & json, const QString & path, const QString & key, int defaultValue, QString * typeError) {
        if (!json.contains(key))
            return defaultValue;

        // JSON numbers are doubles; only accept integral values within range.
        double d = json[key].toDouble();
        if (!json[key].isDouble() || d != std::floor(d)
            || d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max())
        {
            Config::setTypeError(typeError, path, key, "an integer");
            return defaultValue;
        }
        return (int) d;
    }

    QString Config::parseString(const QJsonObject & json, const QString & path, const QString & key, const QString & defaultValue, QString * typeError) {
        if (!json.contains(key))
            return defaultValue;
        if (!json[key].isString()) {
            Config::setTypeError(typeError, path, key, "a string");
            return defaultValue;
        }
        return json[key].toString();
    }

    QStringList Config::parseStringList(const QJsonObject & json, const QString & path, const QString & key, const QStringList & defaultValue, QString * typeError) {
        if (!json.contains(key))
            return defaultValue;

        QStringList list;
        if (json[key].isArray()) {
            foreach (const QJsonValue & v, json[key].toArray()) {
                if (!v.isString())
                    break;
                list.append(v.toString());
            }
            if (list.size() == json[key].toArray().size())
                return list;
        }
        Config::setTypeError(typeError, path, key, "an array of strings");
        return defaultValue;
    }


#ifdef DEBUG
    QDebug operator<<(QDebug dbg, const Config & config) {
        const Analytics::QueryParameters & p = config.queryParameters;

        dbg.nospace() << "dataset:" << "\n"
                      << "\t- separator: " << QString(config.separator) << "\n"
                      << "\t- date formats: " << config.dateFormats << "\n"
                      << "\t- time formats: " << config.timeFormats << "\n";

        dbg.nospace() << "query:" << "\n"
                      << "\t- top products: " << p.topProducts << "\n"
                      << "\t- minimum support: " << p.minSupport << "\n"
                      << "\t- maximum itemset length: " << p.maxItemsetLength << "\n"
                      << "\t- minimum lift: " << p.minLift << "\n"
                      << "\t- minimum confidence: " << p.minConfidence << "\n"
                      << "\t- maximum rules: " << p.maxRules << "\n";

        dbg.nospace() << "cache:" << "\n"
                      << "\t- frequent itemsets: " << config.frequentItemsetCacheSize << "\n";

        return dbg.nospace();
    }
#endif

}
