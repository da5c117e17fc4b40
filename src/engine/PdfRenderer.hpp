/** \file PdfRenderer.hpp
 *  Paginated variant: one PDF page per unit, each page sized to its unit.
 */
#pragma once
#include "engine/Renderer.hpp"

namespace QtCsvTable { namespace engine {

class QTCSVTABLE_EXPORT PdfRenderer : public Renderer {
public:
    explicit PdfRenderer(qreal fontSize = 12, std::optional<int> maxRowsPerUnit = std::nullopt, PdfMetadata metadata = {})
        : Renderer(ExportTarget::Pdf, fontSize, maxRowsPerUnit), m_metadata(std::move(metadata)) {}

    const PdfMetadata & metadata() const { return m_metadata; }
    void setMetadata(const PdfMetadata &metadata) { m_metadata = metadata; }

    std::shared_ptr<Renderer> clone() const override { return std::make_shared<PdfRenderer>(*this); }

    std::optional<Artifact> render(const LayoutPlan &plan, const ProgressCallback &onProgress, QString *error = nullptr) const override;

private:
    PdfMetadata m_metadata;
};

}} // namespace QtCsvTable::engine
