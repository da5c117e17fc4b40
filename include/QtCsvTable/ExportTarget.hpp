/** \file ExportTarget.hpp
 *  Output kinds and their file/type identities.
 */
#pragma once
#include "QtCsvTable/Export.hpp"
#include <QString>
#include <optional>

namespace QtCsvTable {

enum class ExportTarget {
    Png, ///< single raster image, units stacked vertically
    Pdf  ///< paginated document, one page per unit
};

/** "png" or "pdf". */
QTCSVTABLE_EXPORT QString fileExtension(ExportTarget target);
/** "image/png" or "application/pdf". */
QTCSVTABLE_EXPORT QString mimeType(ExportTarget target);
/** Uniform type identifier ("public.png", "com.adobe.pdf"). */
QTCSVTABLE_EXPORT QString typeIdentifier(ExportTarget target);
/** Reverse of fileExtension (case-insensitive, leading dot allowed). */
QTCSVTABLE_EXPORT std::optional<ExportTarget> exportTargetFromExtension(const QString &extension);

} // namespace QtCsvTable
