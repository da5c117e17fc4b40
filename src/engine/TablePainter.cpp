#include "engine/TablePainter.hpp"
#include "QtCsvTable/Style.hpp"
#include <QPen>

namespace QtCsvTable { namespace engine {

namespace { const QColor kGridColor(0x9e, 0x9e, 0x9e); }

void TablePainter::beginUnit(const LayoutUnit &unit, const QPointF &origin) {
    m_painter.fillRect(QRectF(origin, unit.size), Qt::white);
    paintCells(unit.header, origin, true);
}

void TablePainter::paintRow(const RowBox &row, const QPointF &origin) {
    paintCells(row, origin, false);
}

void TablePainter::paintCells(const RowBox &row, const QPointF &origin, bool header) {
    m_painter.setFont(m_font);
    QPen gridPen(kGridColor);
    gridPen.setWidthF(1.0);
    const int flags = Qt::AlignLeft | Qt::AlignVCenter | Qt::TextSingleLine;
    for(size_t c = 0; c < row.cells.size() && c < m_plan.columns.size(); ++c) {
        const CellBox &cell = row.cells[c];
        const Style style = m_plan.columns[c].style;
        const QRectF rect = cell.rect.translated(origin);
        m_painter.fillRect(rect, header ? headerColor(style) : tintColor(style));
        m_painter.setPen(gridPen);
        m_painter.setBrush(Qt::NoBrush);
        m_painter.drawRect(rect);
        if(cell.text.isEmpty()) continue;
        m_painter.setPen(textColor(style));
        m_painter.drawText(rect.adjusted(m_plan.paddingX, 0, -m_plan.paddingX, 0), flags, cell.text);
    }
}

}} // namespace QtCsvTable::engine
