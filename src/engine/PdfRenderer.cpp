#include "engine/PdfRenderer.hpp"
#include "engine/TablePainter.hpp"
#include <QBuffer>
#include <QMarginsF>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>

namespace QtCsvTable { namespace engine {

namespace {
QPageSize pageSizeFor(const LayoutUnit &unit) {
    return QPageSize(unit.size, QPageSize::Point, QString(), QPageSize::ExactMatch);
}
} // namespace

std::optional<Artifact> PdfRenderer::render(const LayoutPlan &plan, const ProgressCallback &onProgress, QString *error) const {
    auto fail = [error](const QString &message) -> std::optional<Artifact> {
        if(error) *error = message;
        return std::nullopt;
    };
    if(plan.units.empty()) return fail(QStringLiteral("layout has no units"));

    QByteArray bytes;
    QBuffer buffer(&bytes);
    if(!buffer.open(QIODevice::WriteOnly)) return fail(QStringLiteral("could not open the PDF buffer"));

    PdfDocument doc;
    doc.title = m_metadata.title;
    doc.author = m_metadata.author;
    {
        QPdfWriter writer(&buffer);
        // one device unit per point: layout coordinates are used as-is
        writer.setResolution(72);
        writer.setTitle(m_metadata.title);
        writer.setCreator(m_metadata.author);
        if(!writer.setPageMargins(QMarginsF(0, 0, 0, 0), QPageLayout::Point)) return fail(QStringLiteral("could not clear page margins"));
        if(!writer.setPageSize(pageSizeFor(plan.units.front()))) return fail(QStringLiteral("invalid page size"));

        QPainter painter;
        if(!painter.begin(&writer)) return fail(QStringLiteral("could not start painting the PDF"));
        painter.setRenderHint(QPainter::TextAntialiasing);
        TablePainter table(painter, plan, tableFont(fontFamily(), plan.fontSize));

        bool perRow = false;
        const int steps = progressSteps(plan, perRow);
        int done = 0;
        for(size_t i = 0; i < plan.units.size(); ++i) {
            const LayoutUnit &unit = plan.units[i];
            if(i > 0) {
                // the page size applies to the page started by newPage()
                if(!writer.setPageSize(pageSizeFor(unit)) || !writer.newPage()) {
                    painter.end();
                    return fail(QStringLiteral("could not start page %1").arg(i + 1));
                }
            }
            table.beginUnit(unit, QPointF(0, 0));
            for(const auto &row : unit.rows) {
                table.paintRow(row, QPointF(0, 0));
                if(perRow) reportProgress(onProgress, ++done, steps);
            }
            doc.pageSizes.push_back(unit.size);
            if(!perRow) reportProgress(onProgress, ++done, steps);
        }
        if(!painter.end()) return fail(QStringLiteral("writing the PDF failed"));
    }
    buffer.close();
    doc.data = bytes;
    return Artifact(std::move(doc));
}

}} // namespace QtCsvTable::engine
