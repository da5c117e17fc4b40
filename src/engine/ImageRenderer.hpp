/** \file ImageRenderer.hpp
 *  Raster variant: all units stacked into one QImage.
 */
#pragma once
#include "engine/Renderer.hpp"

namespace QtCsvTable { namespace engine {

class QTCSVTABLE_EXPORT ImageRenderer : public Renderer {
public:
    explicit ImageRenderer(qreal fontSize = 12, std::optional<int> maxRowsPerUnit = std::nullopt)
        : Renderer(ExportTarget::Png, fontSize, maxRowsPerUnit) {}

    std::shared_ptr<Renderer> clone() const override { return std::make_shared<ImageRenderer>(*this); }

    std::optional<Artifact> render(const LayoutPlan &plan, const ProgressCallback &onProgress, QString *error = nullptr) const override;
};

}} // namespace QtCsvTable::engine
