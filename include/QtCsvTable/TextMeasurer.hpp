/** \file TextMeasurer.hpp
 *  Font metrics provider used by the layout engine.
 */
#pragma once
#include "QtCsvTable/Export.hpp"
#include <QFont>
#include <QSizeF>
#include <QString>
#include <optional>

namespace QtCsvTable {

/** Measures one line of text. Implementations must be callable from the render thread. */
class QTCSVTABLE_EXPORT TextMeasurer {
public:
    virtual ~TextMeasurer() = default;
    /** Advance width and line height in points; std::nullopt if the text cannot be measured. */
    virtual std::optional<QSizeF> measure(const QString &text, qreal fontSize) const = 0;
};

/** Default provider backed by QFontMetricsF at 72 dpi (one point per pixel).
 *  Requires a QGuiApplication.
 */
class QTCSVTABLE_EXPORT FontMetricsMeasurer : public TextMeasurer {
public:
    /** Empty family selects the system general font. */
    explicit FontMetricsMeasurer(QString family = QString()) : m_family(std::move(family)) {}

    std::optional<QSizeF> measure(const QString &text, qreal fontSize) const override;

    const QString & family() const { return m_family; }

private:
    QString m_family;
};

/** Font used for both measuring and drawing cells. */
QTCSVTABLE_EXPORT QFont tableFont(const QString &family, qreal pointSize);

} // namespace QtCsvTable
