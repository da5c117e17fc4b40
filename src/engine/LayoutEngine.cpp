#include "engine/LayoutEngine.hpp"
#include <QHash>
#include <QtMath>
#include <algorithm>
#include <cmath>

namespace QtCsvTable { namespace engine {

namespace {

void setError(QString *error, const QString &message) { if(error) *error = message; }

bool validSize(const QSizeF &s) {
    return std::isfinite(s.width()) && std::isfinite(s.height()) && s.width() >= 0 && s.height() >= 0;
}

} // namespace

int LayoutPlan::rowCount() const {
    int n = 0;
    for(const auto &u : units) n += static_cast<int>(u.rows.size());
    return n;
}

QSizeF LayoutPlan::stackedSize() const {
    qreal w = 0, h = 0;
    for(const auto &u : units) { w = qMax(w, u.size.width()); h += u.size.height(); }
    return {w, h};
}

LayoutEngine::LayoutEngine(std::shared_ptr<const TextMeasurer> measurer)
    : m_measurer(std::move(measurer)) {}

std::optional<LayoutPlan> LayoutEngine::layout(const Table &table,
                                               const std::vector<Style> &styles,
                                               qreal fontSize,
                                               std::optional<int> maxRowsPerUnit,
                                               QString *error) const {
    if(!m_measurer) { setError(error, QStringLiteral("no text measurer configured")); return std::nullopt; }
    if(table.columns().empty()) { setError(error, QStringLiteral("table has no columns")); return std::nullopt; }
    if(table.rows().empty()) { setError(error, QStringLiteral("table has no rows")); return std::nullopt; }
    if(styles.size() != table.columns().size()) {
        setError(error, QStringLiteral("%1 styles for %2 columns").arg(styles.size()).arg(table.columns().size()));
        return std::nullopt;
    }
    if(!(fontSize > 0) || !std::isfinite(fontSize)) {
        setError(error, QStringLiteral("invalid font size %1").arg(fontSize));
        return std::nullopt;
    }
    if(maxRowsPerUnit && *maxRowsPerUnit <= 0) {
        setError(error, QStringLiteral("invalid rows per unit %1").arg(*maxRowsPerUnit));
        return std::nullopt;
    }

    const int columnCount = table.columnCount();
    LayoutPlan plan;
    plan.fontSize = fontSize;
    plan.margin = fontSize;
    plan.paddingX = fontSize * 0.75;
    plan.paddingY = fontSize * 0.4;

    // Widest text per column (header included) and tallest line overall.
    // Cell values repeat a lot in practice, so each distinct string is measured once.
    QHash<QString, QSizeF> measured;
    std::vector<qreal> textWidths(static_cast<size_t>(columnCount), 0);
    qreal lineHeight = 0;
    auto account = [&](int column, const QString &text) -> bool {
        auto it = measured.constFind(text);
        QSizeF size;
        if(it != measured.constEnd()) {
            size = *it;
        } else {
            auto m = m_measurer->measure(text, fontSize);
            if(!m || !validSize(*m)) {
                setError(error, QStringLiteral("could not measure \"%1\" at %2 pt").arg(text).arg(fontSize));
                return false;
            }
            size = *m;
            measured.insert(text, size);
        }
        textWidths[column] = qMax(textWidths[column], size.width());
        lineHeight = qMax(lineHeight, size.height());
        return true;
    };
    for(int c = 0; c < columnCount; ++c) {
        if(!account(c, table.columns()[c].name)) return std::nullopt;
    }
    for(const auto &row : table.rows()) {
        for(int c = 0; c < columnCount; ++c) {
            if(!account(c, Table::valueAt(row, c))) return std::nullopt;
        }
    }

    plan.rowHeight = qCeil(lineHeight) + 2 * plan.paddingY;
    qreal x = plan.margin;
    plan.columns.reserve(columnCount);
    for(int c = 0; c < columnCount; ++c) {
        ColumnBox box;
        box.name = table.columns()[c].name;
        box.style = styles[c];
        box.x = x;
        box.width = qCeil(textWidths[c]) + 2 * plan.paddingX;
        x += box.width;
        plan.columns.push_back(box);
    }
    // Unit sizes are whole points, the granularity of PDF page sizes
    const qreal unitWidth = qCeil(x + plan.margin);

    auto placeRow = [&](int index, qreal y, const QStringList &values) {
        RowBox r;
        r.index = index;
        r.y = y;
        r.height = plan.rowHeight;
        r.cells.reserve(columnCount);
        for(int c = 0; c < columnCount; ++c) {
            const auto &col = plan.columns[c];
            // values past the column count are dropped, missing ones stay empty
            r.cells.push_back({QRectF(col.x, y, col.width, plan.rowHeight), c < values.size() ? values[c] : QString()});
        }
        return r;
    };

    const QStringList names = table.columnNames();
    const int total = table.rowCount();
    const int groupSize = maxRowsPerUnit ? *maxRowsPerUnit : total;
    for(int start = 0; start < total; start += groupSize) {
        LayoutUnit unit;
        unit.header = placeRow(0, plan.margin, names);
        qreal y = plan.margin + plan.rowHeight;
        const int end = std::min(total, start + groupSize);
        unit.rows.reserve(end - start);
        for(int i = start; i < end; ++i) {
            const Row &row = table.rows()[i];
            unit.rows.push_back(placeRow(row.index, y, row.values));
            y += plan.rowHeight;
        }
        unit.size = QSizeF(unitWidth, qCeil(y + plan.margin));
        plan.units.push_back(std::move(unit));
    }
    return plan;
}

}} // namespace QtCsvTable::engine
