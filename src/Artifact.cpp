#include "QtCsvTable/Artifact.hpp"
#include <QBuffer>
#include <QDebug>

namespace QtCsvTable {

QByteArray Artifact::toBytes() const {
    if(const auto *doc = document()) return doc->data;
    QByteArray png;
    QBuffer buf(&png);
    if(!buf.open(QIODevice::WriteOnly) || !image()->save(&buf, "PNG")) {
        qWarning() << "Artifact: PNG encoding failed for image of size" << image()->size();
        return QByteArray();
    }
    return png;
}

} // namespace QtCsvTable
