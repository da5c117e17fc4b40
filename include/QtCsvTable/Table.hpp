/** \file Table.hpp
 *  Parsed table model: separator, styled columns and indexed rows.
 */
#pragma once
#include "QtCsvTable/Export.hpp"
#include "QtCsvTable/Style.hpp"
#include <QString>
#include <QStringList>
#include <vector>

namespace QtCsvTable {

/** Column header. Identity is the position within the table. */
struct Column {
    QString name;
    Style style{Style::Gray};

    bool operator==(const Column &o) const { return name == o.name && style == o.style; }
    bool operator!=(const Column &o) const { return !(*this == o); }
};

/** Data row. index is the 1-based position among the non-empty source lines
 *  (the header line being 0). values may be longer or shorter than the column
 *  count; see Table::valueAt.
 */
struct Row {
    int index{0};
    QStringList values;

    bool operator==(const Row &o) const { return index == o.index && values == o.values; }
    bool operator!=(const Row &o) const { return !(*this == o); }
};

/** Aggregate of columns and rows. Columns and rows are only replaced in bulk. */
class QTCSVTABLE_EXPORT Table {
public:
    Table() = default;
    Table(QString separator, std::vector<Column> columns, std::vector<Row> rows);

    const QString & separator() const { return m_separator; }
    const std::vector<Column> & columns() const { return m_columns; }
    const std::vector<Row> & rows() const { return m_rows; }

    int columnCount() const { return static_cast<int>(m_columns.size()); }
    int rowCount() const { return static_cast<int>(m_rows.size()); }

    /** True when there is nothing to lay out (no columns or no rows). */
    bool isEmpty() const { return m_columns.empty() || m_rows.empty(); }

    /** Column names in order. */
    QStringList columnNames() const;
    /** Styles of the columns in order. */
    std::vector<Style> columnStyles() const;

    /** Value of row at column; empty string for a missing value. */
    static QString valueAt(const Row &row, int column);

    void setColumns(std::vector<Column> columns) { m_columns = std::move(columns); }
    void setRows(std::vector<Row> rows) { m_rows = std::move(rows); }

    bool operator==(const Table &o) const;
    bool operator!=(const Table &o) const { return !(*this == o); }

private:
    QString m_separator{QStringLiteral(",")};
    std::vector<Column> m_columns;
    std::vector<Row> m_rows;
};

} // namespace QtCsvTable
