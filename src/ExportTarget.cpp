#include "QtCsvTable/ExportTarget.hpp"

namespace QtCsvTable {

QString fileExtension(ExportTarget target) {
    switch(target) {
    case ExportTarget::Png: return QStringLiteral("png");
    case ExportTarget::Pdf: return QStringLiteral("pdf");
    }
    return QString();
}

QString mimeType(ExportTarget target) {
    switch(target) {
    case ExportTarget::Png: return QStringLiteral("image/png");
    case ExportTarget::Pdf: return QStringLiteral("application/pdf");
    }
    return QString();
}

QString typeIdentifier(ExportTarget target) {
    switch(target) {
    case ExportTarget::Png: return QStringLiteral("public.png");
    case ExportTarget::Pdf: return QStringLiteral("com.adobe.pdf");
    }
    return QString();
}

std::optional<ExportTarget> exportTargetFromExtension(const QString &extension) {
    QString ext = extension.trimmed().toLower();
    if(ext.startsWith(QLatin1Char('.'))) ext.remove(0, 1);
    if(ext == QLatin1String("png")) return ExportTarget::Png;
    if(ext == QLatin1String("pdf")) return ExportTarget::Pdf;
    return std::nullopt;
}

} // namespace QtCsvTable
