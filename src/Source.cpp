#include "QtCsvTable/Source.hpp"
#include <QDebug>
#include <QEventLoop>
#include <QFile>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QStringDecoder>
#include <memory>

namespace QtCsvTable {

namespace {

void fillError(Error *error, const QString &message, const QString &source, const QByteArray &data = QByteArray()) {
    qWarning("Source: %s (%s)", qUtf8Printable(message), qUtf8Printable(source));
    if(!error) return;
    error->code = ErrorCode::SourceAccessFailure;
    error->message = message;
    error->source = source;
    error->data = data;
}

std::optional<QString> decodeOrFail(const QByteArray &bytes, const QString &source, Error *error) {
    auto text = decodeText(bytes);
    if(!text) fillError(error, QStringLiteral("no usable text encoding"), source, bytes);
    return text;
}

} // namespace

std::optional<QString> decodeText(const QByteArray &bytes) {
    const QStringConverter::Encoding encodings[] = {
        QStringConverter::Utf8, QStringConverter::Utf16, QStringConverter::Utf32};
    for(auto encoding : encodings) {
        QStringDecoder decoder(encoding, QStringConverter::Flag::Stateless);
        QString text = decoder.decode(bytes);
        if(!decoder.hasError()) return text;
    }
    for(char c : bytes) {
        if(static_cast<unsigned char>(c) > 0x7f) return std::nullopt;
    }
    return QString::fromLatin1(bytes);
}

std::optional<QString> readLocalText(const QString &path, Error *error) {
    QFile file(path);
    if(!file.open(QIODevice::ReadOnly)) {
        fillError(error, QStringLiteral("cannot access file: %1").arg(file.errorString()), path);
        return std::nullopt;
    }
    return decodeOrFail(file.readAll(), path, error);
}

std::optional<QString> readNetworkText(const QUrl &url, Error *error, int timeoutMs) {
    const QString source = url.toString();
    if(!url.isValid()) {
        fillError(error, QStringLiteral("invalid url: %1").arg(url.errorString()), source);
        return std::nullopt;
    }
    QNetworkAccessManager manager;
    QNetworkRequest request(url);
    request.setTransferTimeout(timeoutMs);
    std::unique_ptr<QNetworkReply> reply(manager.get(request));
    if(!reply->isFinished()) {
        QEventLoop loop;
        QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }
    if(reply->error() != QNetworkReply::NoError) {
        fillError(error, QStringLiteral("cannot access url: %1").arg(reply->errorString()), source);
        return std::nullopt;
    }
    return decodeOrFail(reply->readAll(), source, error);
}

} // namespace QtCsvTable
