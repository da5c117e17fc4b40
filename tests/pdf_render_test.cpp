// PDF renderer: one page per unit, page geometry, metadata, progress
#include "QtCsvTable/TableBuilder.hpp"
#include "engine/PdfRenderer.hpp"
#include "TestSupport.hpp"
#include <QGuiApplication>
#include <QtMath>
#include <cassert>
#include <iostream>
#include <vector>

using namespace QtCsvTable; using namespace QtCsvTable::engine;

// PDF text string as QPdfWriter encodes it: UTF-16BE with a byte order mark
static QByteArray pdfTextString(const QString &s){
    QByteArray out("(\xfe\xff", 3);
    for(QChar c : s) { out.append(char(c.unicode() >> 8)); out.append(char(c.unicode() & 0xff)); }
    return out + ')';
}

int main(int argc, char **argv){
    testsupport::useOffscreenPlatform();
    QGuiApplication app(argc, argv);

    QString raw = "sku,qty,price";
    for(int i=1;i<=10;++i) raw += QString("\nA-%1,%2,%3.99").arg(i).arg(i*3).arg(i);
    Table table = buildTable(raw);
    auto measurer = std::make_shared<FontMetricsMeasurer>();

    // Ten rows, four per page: three pages sized to their units
    {
        PdfRenderer renderer(11, 4, PdfMetadata{"Jane Roe", "Inventory"});
        renderer.setTextMeasurer(measurer);
        std::vector<double> seen;
        QString err;
        auto artifact = renderer.make(table, [&](double p){ seen.push_back(p); }, &err);
        assert(artifact.has_value()); assert(err.isEmpty());
        assert(artifact->target() == ExportTarget::Pdf);
        const PdfDocument *doc = artifact->document();
        assert(doc && artifact->image() == nullptr);
        assert(doc->data.startsWith("%PDF-"));
        assert(doc->pageCount() == 3);
        assert(doc->title == "Inventory" && doc->author == "Jane Roe");
        assert(doc->data.contains("/Title " + pdfTextString("Inventory")));
        assert(doc->data.contains("/Creator " + pdfTextString("Jane Roe")));
        auto plan = LayoutEngine(measurer).layout(table, 11, 4);
        for(int i=0;i<3;++i) {
            assert(doc->pageSizes[i] == plan->units[i].size);
            assert(doc->pageSizes[i].width() == qCeil(doc->pageSizes[i].width()));
            assert(doc->pageSizes[i].height() == qCeil(doc->pageSizes[i].height()));
        }
        assert(doc->pageSizes[2].height() < doc->pageSizes[0].height());
        assert(seen == std::vector<double>({1.0/3, 2.0/3, 1.0}));
        assert(artifact->toBytes() == doc->data);
    }
    // Without a limit everything fits on one page; progress is reported per row
    {
        PdfRenderer renderer;
        renderer.setTextMeasurer(measurer);
        assert(renderer.fontSize() == 12);
        assert(renderer.metadata().title == "Title" && renderer.metadata().author == "Author");
        std::vector<double> seen;
        auto artifact = renderer.make(table, [&](double p){ seen.push_back(p); });
        assert(artifact && artifact->document()->pageCount() == 1);
        assert(seen.size() == 10 && seen.back() == 1.0);
    }
    std::cout << "pdf_render_test passed" << std::endl; return 0;
}
