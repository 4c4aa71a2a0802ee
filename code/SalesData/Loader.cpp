#include "Loader.h"

#include <cmath>
#include <limits>

namespace SalesData {

    const char * LoadError::CodeName[10] = {
        "NoError",
        "FileUnreadable",
        "EmptyFile",
        "MissingColumn",
        "MalformedRow",
        "InvalidTransactionID",
        "InvalidDate",
        "InvalidTime",
        "InvalidQuantity",
        "InvalidPrice"
    };

    const char * Loader::RequiredColumns[7] = {
        "transaction_id",
        "transaction_date",
        "transaction_time",
        "transaction_qty",
        "unit_price",
        "store_location",
        "product_detail"
    };

    QString LoadError::toString() const {
        if (this->line > 0)
            return QString("%1 (line %2): %3").arg(LoadError::CodeName[this->code]).arg(this->line).arg(this->message);
        else
            return QString("%1: %2").arg(LoadError::CodeName[this->code]).arg(this->message);
    }

    int ColumnLayout::maxIndex() const {
        return qMax(qMax(qMax(this->transactionID, this->date),
                         qMax(this->time, this->quantity)),
                    qMax(qMax(this->unitPrice, this->storeLocation),
                         this->productDetail));
    }

    Loader::Loader(const Config::Config & config) {
        this->config = config;
    }


    //---------------------------------------------------------------------------
    // Public methods.

    /**
     * Load the given CSV file.
     *
     * @param fileName
     *   The full path to a CSV file with a header row.
     * @param dataset
     *   Receives the loaded data set; left untouched on failure.
     * @param error
     *   Receives the first problem that was encountered. May not be NULL.
     * @return
     *   true on success.
     */
    bool Loader::load(const QString & fileName, Dataset & dataset, LoadError * error) const {
        QFile file;
        file.setFileName(fileName);
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            *error = LoadError(LoadError::FileUnreadable, 0,
                               QString("Could not open '%1' for reading: %2.").arg(fileName).arg(file.errorString()));
            return false;
        }

        bool success = this->load(&file, dataset, error);
        file.close();
        return success;
    }

    /**
     * Load CSV data from an already opened device.
     *
     * Lines are gathered in chunks of PARSE_CHUNK_SIZE lines; every chunk is
     * parsed concurrently (by using QtConcurrent) and then checked in file
     * order, so the reported error is always the first one in the file.
     */
    bool Loader::load(QIODevice * device, Dataset & dataset, LoadError * error) const {
        Q_ASSERT(error != NULL);

#ifdef LOADER_DEBUG
        QTime timer;
        timer.start();
#endif

        QTextStream in(device);
        in.setCodec("UTF-8");

        // Header.
        QString line;
        int lineNumber = 0;
        while (!in.atEnd() && line.trimmed().isEmpty()) {
            line = in.readLine();
            lineNumber++;
        }
        if (line.trimmed().isEmpty()) {
            *error = LoadError(LoadError::EmptyFile, 0, "The file does not contain a header row.");
            return false;
        }
        // Strip a byte order mark that was not consumed by the codec.
        if (line.at(0) == QChar(0xFEFF))
            line.remove(0, 1);

        bool ok;
        QStringList header = Loader::splitLine(line, this->config.getSeparator(), &ok);
        if (!ok) {
            *error = LoadError(LoadError::MalformedRow, lineNumber, "Unterminated quoted field in the header row.");
            return false;
        }
        ColumnLayout layout;
        QString missingColumn;
        if (!Loader::mapHeader(header, layout, &missingColumn)) {
            *error = LoadError(LoadError::MissingColumn, lineNumber,
                               QString("Required column '%1' is absent.").arg(missingColumn));
            return false;
        }

        // Rows.
        TransactionLineList lines;
        QHash<QString, QString> stringPool;
        QList<RawRow> chunk;
        while (!in.atEnd()) {
            line = in.readLine();
            lineNumber++;

            if (line.trimmed().isEmpty())
                continue;

            chunk.append(RawRow(lineNumber, line));
            if (chunk.size() == PARSE_CHUNK_SIZE) {
                if (!this->processChunk(chunk, layout, lines, stringPool, error))
                    return false;
                chunk.clear();
            }
        }
        if (!chunk.isEmpty() && !this->processChunk(chunk, layout, lines, stringPool, error))
            return false;

#ifdef LOADER_DEBUG
        qDebug() << "Loaded" << lines.size() << "lines in" << timer.elapsed() << "ms.";
#endif

        *error = LoadError();
        dataset = Dataset(lines);
        return true;
    }


    //---------------------------------------------------------------------------
    // Public static methods.

    /**
     * Split a single CSV line into its fields. Fields may be double-quoted, in
     * which case they may contain the separator; a doubled quote inside a
     * quoted field represents a literal quote.
     *
     * @param line
     *   A single line of text.
     * @param separator
     *   The field separator.
     * @param ok
     *   Set to false when the line contains an unterminated quoted field.
     * @return
     *   The fields, with surrounding whitespace removed.
     */
    QStringList Loader::splitLine(const QString & line, QChar separator, bool * ok) {
        QStringList fields;
        QString field;
        bool quoted = false;

        for (int i = 0; i < line.size(); i++) {
            QChar c = line.at(i);
            if (quoted) {
                if (c == '"') {
                    if (i + 1 < line.size() && line.at(i + 1) == '"') {
                        field.append('"');
                        i++;
                    }
                    else
                        quoted = false;
                }
                else
                    field.append(c);
            }
            else if (c == '"')
                quoted = true;
            else if (c == separator) {
                fields.append(field.trimmed());
                field.clear();
            }
            else
                field.append(c);
        }
        fields.append(field.trimmed());

        *ok = !quoted;
        return fields;
    }

    /**
     * Find the position of every required column in the header row. Column
     * order is free and additional columns are ignored.
     *
     * @return
     *   false when a required column is absent; its name is then stored in
     *   missingColumn.
     */
    bool Loader::mapHeader(const QStringList & header, ColumnLayout & layout, QString * missingColumn) {
        int * positions[7] = {
            &layout.transactionID,
            &layout.date,
            &layout.time,
            &layout.quantity,
            &layout.unitPrice,
            &layout.storeLocation,
            &layout.productDetail
        };

        for (int i = 0; i < 7; i++) {
            *positions[i] = header.indexOf(Loader::RequiredColumns[i]);
            if (*positions[i] == -1) {
                *missingColumn = Loader::RequiredColumns[i];
                return false;
            }
        }
        return true;
    }

    /**
     * Map a raw CSV row to a TransactionLine with its derived fields.
     *
     * Thread-safe: only reads its arguments, hence it is used through
     * QtConcurrent.
     *
     * @return
     *   A ParsedRow; its error is set if the row could not be parsed.
     */
    ParsedRow Loader::parseRow(const RawRow & row, const ColumnLayout & layout, const Config::Config * const config) {
        ParsedRow result;
        TransactionLine & line = result.line;
        bool ok;

        QStringList fields = Loader::splitLine(row.text, config->getSeparator(), &ok);
        if (!ok) {
            result.error = LoadError(LoadError::MalformedRow, row.lineNumber, "Unterminated quoted field.");
            return result;
        }
        if (fields.size() <= layout.maxIndex()) {
            result.error = LoadError(LoadError::MalformedRow, row.lineNumber,
                                     QString("Expected at least %1 fields, found %2.").arg(layout.maxIndex() + 1).arg(fields.size()));
            return result;
        }

        line.transactionID = fields[layout.transactionID].toULongLong(&ok);
        if (!ok) {
            result.error = LoadError(LoadError::InvalidTransactionID, row.lineNumber,
                                     QString("'%1' is not a valid transaction id.").arg(fields[layout.transactionID]));
            return result;
        }

        line.date = Loader::parseDate(fields[layout.date], config->getDateFormats());
        if (!line.date.isValid()) {
            result.error = LoadError(LoadError::InvalidDate, row.lineNumber,
                                     QString("'%1' is not a valid date.").arg(fields[layout.date]));
            return result;
        }

        line.time = Loader::parseTime(fields[layout.time], config->getTimeFormats());
        if (!line.time.isValid()) {
            result.error = LoadError(LoadError::InvalidTime, row.lineNumber,
                                     QString("'%1' is not a valid time.").arg(fields[layout.time]));
            return result;
        }

        // Quantities must be positive integers; spreadsheet exports sometimes
        // render them as "2.0", which is accepted as well.
        const QString & rawQuantity = fields[layout.quantity];
        uint quantity = rawQuantity.toUInt(&ok);
        if (!ok) {
            double d = rawQuantity.toDouble(&ok);
            ok = ok && d >= 1.0 && d == std::floor(d) && d <= 4294967295.0;
            quantity = ok ? (uint) d : 0;
        }
        if (!ok || quantity == 0) {
            result.error = LoadError(LoadError::InvalidQuantity, row.lineNumber,
                                     QString("'%1' is not a positive integer quantity.").arg(rawQuantity));
            return result;
        }
        line.quantity = quantity;

        // toDouble() accepts "inf" and "nan".
        double unitPrice = fields[layout.unitPrice].toDouble(&ok);
        if (!ok || !std::isfinite(unitPrice) || unitPrice < 0.0) {
            result.error = LoadError(LoadError::InvalidPrice, row.lineNumber,
                                     QString("'%1' is not a valid non-negative unit price.").arg(fields[layout.unitPrice]));
            return result;
        }
        if (unitPrice > MAX_UNIT_PRICE) {
            result.error = LoadError(LoadError::InvalidPrice, row.lineNumber,
                                     QString("'%1' exceeds the maximum unit price of %2.").arg(fields[layout.unitPrice]).arg(MAX_UNIT_PRICE));
            return result;
        }
        line.unitPrice = moneyFromDouble(unitPrice);

        // The revenue of the line must fit in a Money as well.
        if (line.unitPrice > std::numeric_limits<Money>::max() / (Money) line.quantity) {
            result.error = LoadError(LoadError::InvalidPrice, row.lineNumber,
                                     QString("The revenue of %1 x '%2' is out of range.").arg(line.quantity).arg(fields[layout.unitPrice]));
            return result;
        }

        line.storeLocation = fields[layout.storeLocation];
        line.productDetail = fields[layout.productDetail];

        deriveFields(line);

        return result;
    }


    //---------------------------------------------------------------------------
    // Protected methods.

    bool Loader::processChunk(const QList<RawRow> & chunk,
                              const ColumnLayout & layout,
                              TransactionLineList & lines,
                              QHash<QString, QString> & stringPool,
                              LoadError * error) const
    {
        // Perform the mapping from raw rows to TransactionLines concurrently.
        QList<ParsedRow> parsedRows = QtConcurrent::blockingMapped(chunk, ParseRowMapper(layout, &this->config));

        foreach (const ParsedRow & parsed, parsedRows) {
            if (parsed.error.isError()) {
                *error = parsed.error;
                return false;
            }

            // Share the string data of repeated categorical values, to
            // minimize memory usage.
            TransactionLine line = parsed.line;
            line.storeLocation = Loader::intern(stringPool, line.storeLocation);
            line.productDetail = Loader::intern(stringPool, line.productDetail);
            line.monthBucket   = Loader::intern(stringPool, line.monthBucket);
            lines.append(line);
        }

        return true;
    }

    QDate Loader::parseDate(const QString & value, const QStringList & formats) {
        QDate date;
        foreach (const QString & format, formats) {
            date = QDate::fromString(value, format);
            if (date.isValid())
                return date;
        }
        return QDate();
    }

    QTime Loader::parseTime(const QString & value, const QStringList & formats) {
        QTime time;
        foreach (const QString & format, formats) {
            time = QTime::fromString(value, format);
            if (time.isValid())
                return time;
        }
        return QTime();
    }

    QString Loader::intern(QHash<QString, QString> & stringPool, const QString & value) {
        QHash<QString, QString>::const_iterator it = stringPool.constFind(value);
        if (it != stringPool.constEnd())
            return it.value();
        stringPool.insert(value, value);
        return value;
    }
}
