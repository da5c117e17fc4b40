#include <QtCsvTable/CsvDocument.hpp>
#include <QGuiApplication>
#include <QFileInfo>
#include <iostream>

// Renders a CSV file to <name>.png and <name>.pdf next to it.
// Usage: csv_export <file.csv> [separator] [font size]

using namespace QtCsvTable;

int main(int argc, char **argv){
    QGuiApplication app(argc, argv);
    const QStringList args = app.arguments();
    if(args.size() < 2) { std::cerr << "usage: csv_export <file.csv> [separator] [font size]" << std::endl; return 2; }

    BuildOptions options;
    if(args.size() > 2) options.separator = args.at(2);
    std::optional<qreal> fontSize;
    if(args.size() > 3) fontSize = args.at(3).toDouble();

    Error error;
    auto doc = CsvDocument::fromFile(args.at(1), options, &error);
    if(!doc) { std::cerr << qPrintable(error.message) << std::endl; return 1; }
    QObject::connect(doc.get(), &CsvDocument::progressChanged, [](double p){ std::cout << "\r" << int(p*100) << "%" << std::flush; });

    const QFileInfo input(args.at(1));
    for(ExportTarget target : {ExportTarget::Png, ExportTarget::Pdf}) {
        if(!doc->generate(fontSize, target)) { std::cerr << "\n" << qPrintable(doc->errorString()) << std::endl; return 1; }
        const QString out = input.absolutePath()+"/"+input.completeBaseName()+"."+fileExtension(target);
        if(!doc->write(out)) { std::cerr << "\n" << qPrintable(doc->errorString()) << std::endl; return 1; }
        std::cout << "\r" << qPrintable(out) << std::endl;
    }
    std::cout << "csv_export example complete" << std::endl;
    return 0;
}
