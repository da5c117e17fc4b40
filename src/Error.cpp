#include "QtCsvTable/Error.hpp"

namespace QtCsvTable {

QString errorCodeName(ErrorCode code) {
    switch(code) {
    case ErrorCode::EmptyData: return QStringLiteral("EmptyData");
    case ErrorCode::GenerationInProgress: return QStringLiteral("GenerationInProgress");
    case ErrorCode::UnsupportedExportTarget: return QStringLiteral("UnsupportedExportTarget");
    case ErrorCode::SourceAccessFailure: return QStringLiteral("SourceAccessFailure");
    case ErrorCode::RenderFailure: return QStringLiteral("RenderFailure");
    case ErrorCode::NothingToPersist: return QStringLiteral("NothingToPersist");
    case ErrorCode::WriteFailed: return QStringLiteral("WriteFailed");
    }
    return QStringLiteral("Unknown");
}

} // namespace QtCsvTable
