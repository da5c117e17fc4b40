#include "QtCsvTable/TableBuilder.hpp"
#include <QRegularExpression>
#include <QTextBoundaryFinder>

namespace QtCsvTable {

QStringList splitLines(const QString &rawText) {
    static const QRegularExpression lineBreak(QStringLiteral("[\\r\\n]"));
    return rawText.split(lineBreak, Qt::SkipEmptyParts);
}

QStringList splitFields(const QString &line, const QString &separator) {
    if(separator.isEmpty()) return QStringList{line};
    return line.split(separator, Qt::KeepEmptyParts);
}

QString truncateField(const QString &field, std::optional<int> maxLength) {
    if(!maxLength || *maxLength < 0 || field.size() <= *maxLength) return field;
    // Lengths count user-perceived characters, so a cut never splits a
    // surrogate pair or a base character from its combining marks.
    QTextBoundaryFinder graphemes(QTextBoundaryFinder::Grapheme, field);
    int count = 0;
    qsizetype cut = 0;
    while(graphemes.toNextBoundary() != -1) {
        if(++count == *maxLength) cut = graphemes.position();
    }
    if(count <= *maxLength) return field;
    return field.left(cut) + ellipsisMarker();
}

Table buildTable(const QString &rawText, const BuildOptions &options) {
    QStringList lines = splitLines(rawText);
    if(lines.size() == 1) {
        // Header-less input: synthesize "0".."N-1" and keep the line as the only row
        const int count = splitFields(lines.front(), options.separator).size();
        QStringList names;
        for(int i = 0; i < count; ++i) names << QString::number(i);
        lines.prepend(names.join(options.separator));
    }

    std::vector<Column> columns;
    std::vector<Row> rows;
    for(int i = 0; i < lines.size(); ++i) {
        QStringList items = splitFields(lines.at(i), options.separator);
        if(i == 0) {
            std::vector<Style> styles;
            if(options.randomStyles) styles = assignStyles(items.size());
            else styles = assignStyles(items.size(), options.styleSeed ? *options.styleSeed : deriveStyleSeed(items));
            columns.reserve(static_cast<size_t>(items.size()));
            for(int c = 0; c < items.size(); ++c) columns.push_back({items.at(c), styles[c]});
            continue;
        }
        for(auto &item : items) item = truncateField(item, options.maxFieldLength);
        rows.push_back({i, items});
    }
    return Table(options.separator, std::move(columns), std::move(rows));
}

} // namespace QtCsvTable
