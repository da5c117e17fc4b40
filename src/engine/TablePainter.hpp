/** \file TablePainter.hpp
 *  Drawing of laid-out rows onto any QPainter (image or PDF page).
 */
#pragma once
#include "engine/LayoutEngine.hpp"
#include <QFont>
#include <QPainter>
#include <QPointF>

namespace QtCsvTable { namespace engine {

class TablePainter {
public:
    TablePainter(QPainter &painter, const LayoutPlan &plan, QFont font)
        : m_painter(painter), m_plan(plan), m_font(std::move(font)) {}

    /** Fill the unit area white and draw its header row; origin is the unit's top-left. */
    void beginUnit(const LayoutUnit &unit, const QPointF &origin);
    /** Draw one data row of the current unit. */
    void paintRow(const RowBox &row, const QPointF &origin);

private:
    void paintCells(const RowBox &row, const QPointF &origin, bool header);

    QPainter &m_painter;
    const LayoutPlan &m_plan;
    QFont m_font;
};

}} // namespace QtCsvTable::engine
