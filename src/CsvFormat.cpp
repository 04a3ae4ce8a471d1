#include "CsvFormat.h"

namespace Csv {

const QStringList& header() {
    static const QStringList columns = {"date", "category", "amount", "note"};
    return columns;
}

QString escapeField(const QString& field) {
    bool needsQuotes = field.contains(',') || field.contains('"') ||
                       field.contains('\n') || field.contains('\r');
    if (!needsQuotes) {
        return field;
    }
    QString escaped = field;
    escaped.replace("\"", "\"\"");
    return "\"" + escaped + "\"";
}

QString formatLine(const QStringList& fields) {
    QStringList escaped;
    escaped.reserve(fields.size());
    for (const QString& field : fields) {
        escaped << escapeField(field);
    }
    return escaped.join(',');
}

QVector<Row> parseDocument(const QString& text) {
    QVector<Row> rows;
    Row current;
    QString field;
    bool inQuotes = false;
    bool rowHasContent = false;

    auto endField = [&]() {
        current << field;
        field.clear();
    };
    auto endRow = [&]() {
        endField();
        if (rowHasContent) {
            rows.push_back(current);
        }
        current.clear();
        rowHasContent = false;
    };

    const int length = text.size();
    for (int i = 0; i < length; ++i) {
        const QChar c = text.at(i);

        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < length && text.at(i + 1) == '"') {
                    field += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == '"') {
            inQuotes = true;
            rowHasContent = true;
        } else if (c == ',') {
            endField();
            rowHasContent = true;
        } else if (c == '\r') {
            if (i + 1 < length && text.at(i + 1) == '\n') {
                ++i;
            }
            endRow();
        } else if (c == '\n') {
            endRow();
        } else {
            field += c;
            if (!c.isSpace()) {
                rowHasContent = true;
            }
        }
    }

    // Final line without a trailing newline
    if (rowHasContent || !field.trimmed().isEmpty()) {
        rowHasContent = true;
        endRow();
    }
    return rows;
}

ColumnMap ColumnMap::fromHeader(const Row& headerRow) {
    ColumnMap map;
    for (int i = 0; i < headerRow.size(); ++i) {
        QString name = headerRow.at(i).trimmed().toLower();
        if (i == 0 && name.startsWith(QChar(0xFEFF))) {
            name.remove(0, 1);
        }
        int column = header().indexOf(name);
        if (column >= 0 && map.positions_[column] < 0) {
            map.positions_[column] = i;
        }
    }
    return map;
}

QString ColumnMap::field(const Row& row, Column column) const {
    int position = positions_[column];
    if (position < 0 || position >= row.size()) {
        return QString();
    }
    return row.at(position);
}

} // namespace Csv
