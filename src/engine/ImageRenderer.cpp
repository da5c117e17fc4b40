#include "engine/ImageRenderer.hpp"
#include "engine/TablePainter.hpp"
#include <QImage>
#include <QPainter>
#include <QtMath>

namespace QtCsvTable { namespace engine {

std::optional<Artifact> ImageRenderer::render(const LayoutPlan &plan, const ProgressCallback &onProgress, QString *error) const {
    auto fail = [error](const QString &message) -> std::optional<Artifact> {
        if(error) *error = message;
        return std::nullopt;
    };
    if(plan.units.empty()) return fail(QStringLiteral("layout has no units"));

    const QSizeF stacked = plan.stackedSize();
    const QSize pixels(qCeil(stacked.width()), qCeil(stacked.height()));
    QImage image(pixels, QImage::Format_ARGB32_Premultiplied);
    if(image.isNull()) return fail(QStringLiteral("could not allocate a %1x%2 image").arg(pixels.width()).arg(pixels.height()));
    // 72 dpi so that point sizes map one-to-one onto pixels, as in FontMetricsMeasurer
    image.setDotsPerMeterX(2835);
    image.setDotsPerMeterY(2835);
    image.fill(Qt::white);

    QPainter painter;
    if(!painter.begin(&image)) return fail(QStringLiteral("could not start painting on the image"));
    painter.setRenderHint(QPainter::TextAntialiasing);
    TablePainter table(painter, plan, tableFont(fontFamily(), plan.fontSize));

    bool perRow = false;
    const int steps = progressSteps(plan, perRow);
    int done = 0;
    qreal y = 0;
    for(const auto &unit : plan.units) {
        const QPointF origin(0, y);
        table.beginUnit(unit, origin);
        for(const auto &row : unit.rows) {
            table.paintRow(row, origin);
            if(perRow) reportProgress(onProgress, ++done, steps);
        }
        if(!perRow) reportProgress(onProgress, ++done, steps);
        y += unit.size.height();
    }
    if(!painter.end()) return fail(QStringLiteral("painting the image failed"));
    return Artifact(std::move(image));
}

}} // namespace QtCsvTable::engine
