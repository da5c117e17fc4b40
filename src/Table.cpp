#include "QtCsvTable/Table.hpp"

namespace QtCsvTable {

Table::Table(QString separator, std::vector<Column> columns, std::vector<Row> rows)
    : m_separator(std::move(separator)), m_columns(std::move(columns)), m_rows(std::move(rows)) {}

QStringList Table::columnNames() const {
    QStringList names;
    names.reserve(static_cast<int>(m_columns.size()));
    for(const auto &c : m_columns) names << c.name;
    return names;
}

std::vector<Style> Table::columnStyles() const {
    std::vector<Style> styles;
    styles.reserve(m_columns.size());
    for(const auto &c : m_columns) styles.push_back(c.style);
    return styles;
}

QString Table::valueAt(const Row &row, int column) {
    if(column < 0 || column >= row.values.size()) return QString();
    return row.values.at(column);
}

bool Table::operator==(const Table &o) const {
    return m_separator == o.m_separator && m_columns == o.m_columns && m_rows == o.m_rows;
}

} // namespace QtCsvTable
