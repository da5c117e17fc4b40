#include "engine/Renderer.hpp"

namespace QtCsvTable { namespace engine {

std::optional<Artifact> Renderer::make(const Table &table, const ProgressCallback &onProgress, QString *error) const {
    std::shared_ptr<const TextMeasurer> measurer = m_measurer;
    if(!measurer) measurer = std::make_shared<FontMetricsMeasurer>(m_fontFamily);
    LayoutEngine engine(measurer);
    auto plan = engine.layout(table, m_fontSize, m_maxRowsPerUnit, error);
    if(!plan) return std::nullopt;
    return render(*plan, onProgress, error);
}

int Renderer::progressSteps(const LayoutPlan &plan, bool &perRow) {
    perRow = plan.units.size() == 1;
    int steps = perRow ? static_cast<int>(plan.units.front().rows.size()) : static_cast<int>(plan.units.size());
    if(steps == 0) {
        // header-only single unit: report once when it is drawn
        perRow = false;
        steps = static_cast<int>(plan.units.size());
    }
    return steps;
}

void Renderer::reportProgress(const ProgressCallback &onProgress, int done, int total) {
    if(!onProgress || total <= 0) return;
    onProgress(done >= total ? 1.0 : static_cast<double>(done) / total);
}

}} // namespace QtCsvTable::engine
