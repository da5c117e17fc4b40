/** \file Artifact.hpp
 *  Rendered output: either a raster image or a paginated PDF document.
 */
#pragma once
#include "QtCsvTable/Export.hpp"
#include "QtCsvTable/ExportTarget.hpp"
#include <QByteArray>
#include <QImage>
#include <QSizeF>
#include <QString>
#include <variant>
#include <vector>

namespace QtCsvTable {

/** Document information written into generated PDFs. */
struct PdfMetadata {
    QString author{QStringLiteral("Author")};
    QString title{QStringLiteral("Title")};
};

/** Serialized PDF with the geometry of each page (in points). */
struct PdfDocument {
    QByteArray data;
    std::vector<QSizeF> pageSizes;
    QString title;
    QString author;

    int pageCount() const { return static_cast<int>(pageSizes.size()); }
};

/** Tagged result of a generation. */
class QTCSVTABLE_EXPORT Artifact {
public:
    explicit Artifact(QImage image) : m_content(std::move(image)) {}
    explicit Artifact(PdfDocument document) : m_content(std::move(document)) {}

    ExportTarget target() const { return std::holds_alternative<QImage>(m_content) ? ExportTarget::Png : ExportTarget::Pdf; }

    /** Image payload or nullptr for a document artifact. */
    const QImage * image() const { return std::get_if<QImage>(&m_content); }
    /** Document payload or nullptr for an image artifact. */
    const PdfDocument * document() const { return std::get_if<PdfDocument>(&m_content); }

    /** PNG encoding of the image, or the PDF bytes. Empty if PNG encoding fails. */
    QByteArray toBytes() const;

private:
    std::variant<QImage, PdfDocument> m_content;
};

} // namespace QtCsvTable
