/** \file Error.hpp
 *  Error codes shared by ingestion, generation and persistence.
 */
#pragma once
#include "QtCsvTable/Export.hpp"
#include <QByteArray>
#include <QString>

namespace QtCsvTable {

enum class ErrorCode {
    EmptyData,               ///< no columns or no rows at generation time
    GenerationInProgress,    ///< generate() while another generation runs
    UnsupportedExportTarget, ///< no renderer for the requested target
    SourceAccessFailure,     ///< source could not be read or decoded
    RenderFailure,           ///< measurement or drawing failed
    NothingToPersist,        ///< write() before any generation for the current target
    WriteFailed              ///< destination could not be written
};

/** Failure record filled by functions taking an Error* out-parameter. */
struct Error {
    ErrorCode code{ErrorCode::SourceAccessFailure};
    QString message;
    /** Path or URL of the source, when the failure concerns one. */
    QString source;
    /** Raw bytes read before the failure (undecodable sources). */
    QByteArray data;
};

QTCSVTABLE_EXPORT QString errorCodeName(ErrorCode code);

} // namespace QtCsvTable
