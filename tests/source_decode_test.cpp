// Ingestion: decoding fallbacks, local files, URLs and factory errors
#include "QtCsvTable/CsvDocument.hpp"
#include "QtCsvTable/Source.hpp"
#include <QCoreApplication>
#include <QFile>
#include <QTemporaryDir>
#include <QUrl>
#include <cassert>
#include <iostream>

using namespace QtCsvTable;

static QString writeFile(const QTemporaryDir &dir, const QString &name, const QByteArray &bytes){
    QString p = dir.path()+"/"+name; QFile f(p); bool ok = f.open(QIODevice::WriteOnly); assert(ok); f.write(bytes); f.close(); return p;
}

int main(int argc, char **argv){
    QCoreApplication app(argc, argv);
    QTemporaryDir tmp; assert(tmp.isValid());
    const QString accented = QString::fromUtf8("caf\xC3\xA9,na\xC3\xAFve\n1,2");

    // UTF-8 first
    {
        auto text = decodeText(accented.toUtf8());
        assert(text && *text == accented);
        auto empty = decodeText(QByteArray());
        assert(empty && empty->isEmpty());
    }
    // Not UTF-8 (BOM bytes are invalid there), decoded as UTF-16
    {
        QByteArray utf16("\xFF\xFE", 2);
        for(QChar c : accented) { char16_t u = c.unicode(); utf16.append(char(u & 0xff)); utf16.append(char(u >> 8)); }
        auto text = decodeText(utf16);
        assert(text && *text == accented);
    }
    // Local file
    {
        QString p = writeFile(tmp, "ok.csv", accented.toUtf8());
        Error err;
        auto text = readLocalText(p, &err);
        assert(text && *text == accented);
        auto doc = CsvDocument::fromFile(p);
        assert(doc && doc->table().columnNames() == QStringList({QString::fromUtf8("caf\xC3\xA9"), QString::fromUtf8("na\xC3\xAFve")}));
        assert(doc->rawText() == accented);
        assert(doc->exportTarget() == ExportTarget::Png);
    }
    // Missing file: SourceAccessFailure naming the path
    {
        const QString missing = tmp.path()+"/missing.csv";
        Error err;
        assert(!readLocalText(missing, &err));
        assert(err.code == ErrorCode::SourceAccessFailure);
        assert(err.source == missing && !err.message.isEmpty());
        Error ferr;
        assert(CsvDocument::fromFile(missing, {}, &ferr) == nullptr);
        assert(ferr.code == ErrorCode::SourceAccessFailure && ferr.source == missing);
        assert(!readLocalText(missing)); // null error pointer is allowed
    }
    // URL source through the network access manager (file scheme)
    {
        QString p = writeFile(tmp, "net.csv", QByteArray("x;y\n5;6\n7;8"));
        BuildOptions opt; opt.separator = ";";
        Error err;
        auto doc = CsvDocument::fromUrl(QUrl::fromLocalFile(p), opt, &err);
        assert(doc && doc->table().rowCount() == 2);
        assert(doc->table().rows()[1].values == QStringList({"7","8"}));
        Error missingErr;
        assert(!readNetworkText(QUrl::fromLocalFile(tmp.path()+"/nope.csv"), &missingErr));
        assert(missingErr.code == ErrorCode::SourceAccessFailure && missingErr.source.endsWith("nope.csv"));
    }
    assert(errorCodeName(ErrorCode::SourceAccessFailure) == "SourceAccessFailure");
    std::cout << "source_decode_test passed" << std::endl; return 0;
}
