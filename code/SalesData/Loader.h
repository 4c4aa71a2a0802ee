#ifndef LOADER_H
#define LOADER_H

#include <QFile>
#include <QIODevice>
#include <QTextStream>
#include <QStringList>
#include <QHash>
#include <QtConcurrentMap>
#include <QTime>

#include "../Config/Config.h"
#include "typedefs.h"
#include "Dataset.h"


namespace SalesData {

#ifdef DEBUG
//    #define LOADER_DEBUG 1
#endif

    #define PARSE_CHUNK_SIZE 4000

    // Unit prices above this amount are rejected, which keeps every unit
    // price representable as Money.
    #define MAX_UNIT_PRICE 1e12

    struct LoadError {
        enum Code {
            NoError,
            FileUnreadable,
            EmptyFile,
            MissingColumn,
            MalformedRow,
            InvalidTransactionID,
            InvalidDate,
            InvalidTime,
            InvalidQuantity,
            InvalidPrice
        };

        LoadError() : code(NoError), line(0) {}
        LoadError(Code code, int line, const QString & message)
            : code(code), line(line), message(message) {}

        bool isError() const { return this->code != NoError; }
        QString toString() const;

        Code code;
        int line; // 1-based; 0 when the error is not tied to a single line.
        QString message;

        static const char * CodeName[10];
    };

    // Position of each required column in the header row.
    struct ColumnLayout {
        ColumnLayout()
            : transactionID(-1), date(-1), time(-1), quantity(-1),
              unitPrice(-1), storeLocation(-1), productDetail(-1) {}

        int maxIndex() const;

        int transactionID;
        int date;
        int time;
        int quantity;
        int unitPrice;
        int storeLocation;
        int productDetail;
    };

    struct RawRow {
        RawRow() : lineNumber(0) {}
        RawRow(int lineNumber, const QString & text) : lineNumber(lineNumber), text(text) {}

        int lineNumber;
        QString text;
    };

    struct ParsedRow {
        TransactionLine line;
        LoadError error;
    };

    /**
     * One-shot loader for the transactional CSV file. Produces an immutable
     * Dataset with all derived fields populated, or a LoadError describing
     * the first problem encountered (in file order).
     */
    class Loader {
    public:
        explicit Loader(const Config::Config & config);

        bool load(const QString & fileName, Dataset & dataset, LoadError * error) const;
        bool load(QIODevice * device, Dataset & dataset, LoadError * error) const;

        // Processing logic.
        static QStringList splitLine(const QString & line, QChar separator, bool * ok);
        static bool mapHeader(const QStringList & header, ColumnLayout & layout, QString * missingColumn);
        static ParsedRow parseRow(const RawRow & row, const ColumnLayout & layout, const Config::Config * const config);

        static const char * RequiredColumns[7];

    protected:
        bool processChunk(const QList<RawRow> & chunk,
                          const ColumnLayout & layout,
                          TransactionLineList & lines,
                          QHash<QString, QString> & stringPool,
                          LoadError * error) const;

        static QDate parseDate(const QString & value, const QStringList & formats);
        static QTime parseTime(const QString & value, const QStringList & formats);
        static QString intern(QHash<QString, QString> & stringPool, const QString & value);

        Config::Config config;
    };

    struct ParseRowMapper {
        ParseRowMapper(const ColumnLayout & layout, const Config::Config * const config)
            : layout(layout), config(config) {}

        typedef ParsedRow result_type;

        ParsedRow operator()(const RawRow & row) {
            return Loader::parseRow(row, this->layout, this->config);
        }

        ColumnLayout layout;
        const Config::Config * config;
    };
}

#endif // LOADER_H
