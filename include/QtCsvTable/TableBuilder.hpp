/** \file TableBuilder.hpp
 *  Tokenizer turning delimited text into a Table.
 *  Quoting is not interpreted: the separator and line breaks are always boundaries.
 */
#pragma once
#include "QtCsvTable/Export.hpp"
#include "QtCsvTable/Table.hpp"
#include <QString>
#include <QStringList>
#include <optional>

namespace QtCsvTable {

/** Parsing options. */
struct BuildOptions {
    /** Field separator (may be longer than one character). */
    QString separator{QStringLiteral(",")};
    /** Data fields longer than this keep this many characters followed by "...". */
    std::optional<int> maxFieldLength;
    /** Explicit seed for style assignment; derived from the header names when unset. */
    std::optional<quint32> styleSeed;
    /** Ignore styleSeed and draw styles from the process-wide generator. */
    bool randomStyles{false};
};

/** Marker appended to truncated fields. */
inline QString ellipsisMarker() { return QStringLiteral("..."); }

/** Split on every '\r' or '\n', dropping empty lines. */
QTCSVTABLE_EXPORT QStringList splitLines(const QString &rawText);
/** Split on separator keeping empty leading/trailing/inner fields. */
QTCSVTABLE_EXPORT QStringList splitFields(const QString &line, const QString &separator);
/** Apply the maxFieldLength rule to one field, counting grapheme clusters. */
QTCSVTABLE_EXPORT QString truncateField(const QString &field, std::optional<int> maxLength);

/** Build a table: first line becomes the columns, the following lines the rows.
 *  A single line gets numeric column names "0".."N-1" and becomes the only row.
 *  Same input and options always give an equal table (unless randomStyles is set).
 */
QTCSVTABLE_EXPORT Table buildTable(const QString &rawText, const BuildOptions &options = {});

} // namespace QtCsvTable
