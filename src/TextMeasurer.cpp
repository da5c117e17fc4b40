#include "QtCsvTable/TextMeasurer.hpp"
#include <QFontDatabase>
#include <QFontMetricsF>
#include <QImage>
#include <cmath>

namespace QtCsvTable {

QFont tableFont(const QString &family, qreal pointSize) {
    QFont font = family.isEmpty() ? QFontDatabase::systemFont(QFontDatabase::GeneralFont) : QFont(family);
    font.setPointSizeF(pointSize);
    return font;
}

std::optional<QSizeF> FontMetricsMeasurer::measure(const QString &text, qreal fontSize) const {
    if(!(fontSize > 0) || !std::isfinite(fontSize)) return std::nullopt;
    // Reference device at the QImage default of 72 dpi, the resolution both renderers draw at
    QImage reference(1, 1, QImage::Format_ARGB32_Premultiplied);
    reference.setDotsPerMeterX(2835);
    reference.setDotsPerMeterY(2835);
    QFontMetricsF fm(tableFont(m_family, fontSize), &reference);
    return QSizeF(fm.horizontalAdvance(text), fm.height());
}

} // namespace QtCsvTable
