/** \file Source.hpp
 *  Reading raw delimited text from disk or a URL.
 */
#pragma once
#include "QtCsvTable/Export.hpp"
#include "QtCsvTable/Error.hpp"
#include <QByteArray>
#include <QString>
#include <QUrl>
#include <optional>

namespace QtCsvTable {

/** Decode trying UTF-8, UTF-16, UTF-32 and ASCII in that order. */
QTCSVTABLE_EXPORT std::optional<QString> decodeText(const QByteArray &bytes);

/** Read and decode a local file. On failure fills error (SourceAccessFailure) when given. */
QTCSVTABLE_EXPORT std::optional<QString> readLocalText(const QString &path, Error *error = nullptr);

/** Fetch and decode a URL (any scheme QNetworkAccessManager handles, file: included).
 *  Blocks the calling thread in a local event loop until finished or timed out.
 */
QTCSVTABLE_EXPORT std::optional<QString> readNetworkText(const QUrl &url, Error *error = nullptr, int timeoutMs = 30000);

} // namespace QtCsvTable
