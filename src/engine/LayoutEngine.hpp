/** \file LayoutEngine.hpp
 *  Table geometry: column widths, row height and the split into units
 *  (pages for PDF, vertical strips for PNG). All lengths are in points.
 */
#pragma once
#include "QtCsvTable/Export.hpp"
#include "QtCsvTable/Style.hpp"
#include "QtCsvTable/Table.hpp"
#include "QtCsvTable/TextMeasurer.hpp"
#include <QRectF>
#include <QSizeF>
#include <memory>
#include <optional>
#include <vector>

namespace QtCsvTable { namespace engine {

struct ColumnBox {
    QString name;
    Style style{Style::Gray};
    qreal x{0};
    qreal width{0};
};

struct CellBox {
    QRectF rect; // absolute within the unit
    QString text;
};

/** Header (index 0) or data row placed inside a unit. */
struct RowBox {
    int index{0};
    qreal y{0};
    qreal height{0};
    std::vector<CellBox> cells; // exactly one per column
};

struct LayoutUnit {
    QSizeF size; // rounded up to whole points
    RowBox header;
    std::vector<RowBox> rows;
};

struct LayoutPlan {
    qreal fontSize{0};
    qreal margin{0};
    qreal paddingX{0};
    qreal paddingY{0};
    qreal rowHeight{0};
    std::vector<ColumnBox> columns;
    std::vector<LayoutUnit> units;

    /** Data rows over all units. */
    int rowCount() const;
    /** Size of all units stacked vertically (max width, summed height). */
    QSizeF stackedSize() const;
};

/** Pure geometry computation; safe to call from any thread if the measurer is. */
class QTCSVTABLE_EXPORT LayoutEngine {
public:
    explicit LayoutEngine(std::shared_ptr<const TextMeasurer> measurer);

    /** Lay out table with explicit styles (one per column). maxRowsPerUnit splits
     *  the rows into consecutive groups; unset keeps all rows in one unit.
     *  Returns std::nullopt and fills error on invalid input or measurement failure.
     */
    std::optional<LayoutPlan> layout(const Table &table,
                                     const std::vector<Style> &styles,
                                     qreal fontSize,
                                     std::optional<int> maxRowsPerUnit,
                                     QString *error = nullptr) const;

    /** Same, using the styles stored on the columns. */
    std::optional<LayoutPlan> layout(const Table &table,
                                     qreal fontSize,
                                     std::optional<int> maxRowsPerUnit,
                                     QString *error = nullptr) const {
        return layout(table, table.columnStyles(), fontSize, maxRowsPerUnit, error);
    }

private:
    std::shared_ptr<const TextMeasurer> m_measurer;
};

}} // namespace QtCsvTable::engine
