// PNG renderer: stacked size, per-column colors, progress reporting
#include "QtCsvTable/TableBuilder.hpp"
#include "engine/ImageRenderer.hpp"
#include "TestSupport.hpp"
#include <QGuiApplication>
#include <QtMath>
#include <cassert>
#include <iostream>
#include <vector>

using namespace QtCsvTable; using namespace QtCsvTable::engine;

int main(int argc, char **argv){
    testsupport::useOffscreenPlatform();
    QGuiApplication app(argc, argv);

    BuildOptions opt; opt.styleSeed = 3;
    Table table = buildTable("city,country,population\nOsaka,Japan,2750000\nLyon,France,522000\nPorto,Portugal,232000", opt);
    auto measurer = std::make_shared<FontMetricsMeasurer>();

    // Single unit: progress per row, ends at exactly 1.0
    {
        LayoutEngine engine(measurer);
        auto plan = engine.layout(table, 14, std::nullopt);
        assert(plan.has_value());
        ImageRenderer renderer(14);
        std::vector<double> seen;
        QString err;
        auto artifact = renderer.render(*plan, [&](double p){ seen.push_back(p); }, &err);
        assert(artifact.has_value()); assert(err.isEmpty());
        assert(artifact->target() == ExportTarget::Png);
        assert(artifact->document() == nullptr);
        const QImage *img = artifact->image();
        assert(img && !img->isNull());
        assert(img->width() == qCeil(plan->stackedSize().width()));
        assert(img->height() == qCeil(plan->stackedSize().height()));
        assert(seen.size() == 3);
        for(size_t i=1;i<seen.size();++i) assert(seen[i] >= seen[i-1]);
        assert(seen.back() == 1.0);

        // padding area of the first header cell carries the column's header color,
        // the first data cell the column's tint, the margin stays white
        const auto &header = plan->units[0].header.cells[0].rect;
        const auto &body = plan->units[0].rows[0].cells[0].rect;
        const Style style = plan->columns[0].style;
        assert(img->pixel(qFloor(header.x()) + 3, qFloor(header.y()) + 3) == headerColor(style).rgb());
        assert(img->pixel(qFloor(body.x()) + 3, qFloor(body.y()) + 3) == tintColor(style).rgb());
        assert(img->pixel(1, 1) == QColor(Qt::white).rgb());
        QByteArray png = artifact->toBytes();
        assert(png.startsWith("\x89PNG"));
    }
    // Several units are stacked vertically; progress per unit
    {
        ImageRenderer renderer(10, 1);
        renderer.setTextMeasurer(measurer);
        std::vector<double> seen;
        auto artifact = renderer.make(table, [&](double p){ seen.push_back(p); });
        assert(artifact.has_value());
        auto plan = LayoutEngine(measurer).layout(table, 10, 1);
        assert(plan->units.size() == 3);
        assert(artifact->image()->height() == qCeil(plan->stackedSize().height()));
        assert(seen.size() == 3);
        assert(seen[0] > 0 && seen[0] < seen[1] && seen.back() == 1.0);
    }
    // Layout failures surface as render failures without an image
    {
        ImageRenderer renderer(10);
        renderer.setTextMeasurer(std::make_shared<testsupport::FailingMeasurer>("Lyon"));
        QString err; bool called = false;
        auto artifact = renderer.make(table, [&](double){ called = true; }, &err);
        assert(!artifact.has_value());
        assert(err.contains("Lyon"));
        assert(!called);
    }
    std::cout << "image_render_test passed" << std::endl; return 0;
}
