/** \file Renderer.hpp
 *  Base of the PNG and PDF renderers. A renderer owns its configuration
 *  (font size, rows per unit, metrics provider) and turns a table into an
 *  Artifact on the calling thread; CsvDocument runs it on its worker pool.
 */
#pragma once
#include "QtCsvTable/Artifact.hpp"
#include "QtCsvTable/ExportTarget.hpp"
#include "QtCsvTable/Table.hpp"
#include "QtCsvTable/TextMeasurer.hpp"
#include "engine/LayoutEngine.hpp"
#include <functional>
#include <memory>
#include <optional>

namespace QtCsvTable { namespace engine {

/** Receives completed/total after each unit (or each row of a single-unit plan). */
using ProgressCallback = std::function<void(double)>;

class QTCSVTABLE_EXPORT Renderer {
public:
    virtual ~Renderer() = default;

    ExportTarget target() const { return m_target; }

    qreal fontSize() const { return m_fontSize; }
    void setFontSize(qreal size) { m_fontSize = size; }

    std::optional<int> maximumRowsPerUnit() const { return m_maxRowsPerUnit; }
    void setMaximumRowsPerUnit(std::optional<int> rows) { m_maxRowsPerUnit = rows; }

    const std::shared_ptr<const TextMeasurer> & textMeasurer() const { return m_measurer; }
    void setTextMeasurer(std::shared_ptr<const TextMeasurer> measurer) { m_measurer = std::move(measurer); }

    /** Font family used for drawing; should match the measurer's. Empty = system font. */
    const QString & fontFamily() const { return m_fontFamily; }
    void setFontFamily(const QString &family) { m_fontFamily = family; }

    /** Independent copy with the same configuration (the measurer is shared). */
    virtual std::shared_ptr<Renderer> clone() const = 0;

    /** Lay out table with the current configuration, then render(). */
    std::optional<Artifact> make(const Table &table, const ProgressCallback &onProgress, QString *error = nullptr) const;

    /** Draw a computed plan. Returns std::nullopt (error filled) on any drawing failure;
     *  nothing partially drawn is returned. The last progress value reported is exactly 1.0.
     */
    virtual std::optional<Artifact> render(const LayoutPlan &plan, const ProgressCallback &onProgress, QString *error = nullptr) const = 0;

protected:
    Renderer(ExportTarget target, qreal fontSize, std::optional<int> maxRowsPerUnit)
        : m_target(target), m_fontSize(fontSize), m_maxRowsPerUnit(maxRowsPerUnit) {}

    /** Number of progress steps of a plan and whether they are rows rather than units. */
    static int progressSteps(const LayoutPlan &plan, bool &perRow);
    /** Report done/total, exactly 1.0 on the last step. */
    static void reportProgress(const ProgressCallback &onProgress, int done, int total);

private:
    ExportTarget m_target;
    qreal m_fontSize;
    std::optional<int> m_maxRowsPerUnit;
    std::shared_ptr<const TextMeasurer> m_measurer;
    QString m_fontFamily;
};

}} // namespace QtCsvTable::engine
