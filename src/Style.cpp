#include "QtCsvTable/Style.hpp"
#include <QCryptographicHash>
#include <QRandomGenerator>
#include <QtEndian>
#include <algorithm>

namespace QtCsvTable {

namespace {

struct Swatch { QRgb header; QRgb text; const char *name; };

// indexed by Style
const Swatch kSwatches[] = {
    {0xEF9A9A, 0xB71C1C, "red"},
    {0xFFCC80, 0xE65100, "orange"},
    {0xFFF59D, 0xF57F17, "yellow"},
    {0xA5D6A7, 0x1B5E20, "green"},
    {0x80CBC4, 0x004D40, "teal"},
    {0x90CAF9, 0x0D47A1, "blue"},
    {0xCE93D8, 0x4A148C, "purple"},
    {0xE0E0E0, 0x212121, "gray"},
};

const Swatch & swatch(Style s) { return kSwatches[static_cast<int>(s)]; }

template <typename Generator>
std::vector<Style> drawStyles(int columnCount, Generator &gen) {
    std::vector<Style> out;
    if(columnCount <= 0) return out;
    out.reserve(static_cast<size_t>(columnCount));
    std::vector<Style> cycle = stylePalette();
    while(static_cast<int>(out.size()) < columnCount) {
        std::shuffle(cycle.begin(), cycle.end(), gen);
        for(Style s : cycle) {
            if(static_cast<int>(out.size()) == columnCount) break;
            out.push_back(s);
        }
    }
    return out;
}

} // namespace

const std::vector<Style> & stylePalette() {
    static const std::vector<Style> palette{
        Style::Red, Style::Orange, Style::Yellow, Style::Green,
        Style::Teal, Style::Blue, Style::Purple, Style::Gray};
    return palette;
}

QColor headerColor(Style style) { return QColor(swatch(style).header); }

QColor tintColor(Style style) {
    // 65% towards white
    const QColor h = headerColor(style);
    auto mix = [](int c){ return c + (255 - c) * 65 / 100; };
    return QColor(mix(h.red()), mix(h.green()), mix(h.blue()));
}

QColor textColor(Style style) { return QColor(swatch(style).text); }

QString styleName(Style style) { return QString::fromLatin1(swatch(style).name); }

std::vector<Style> assignStyles(int columnCount, std::optional<quint32> seed) {
    if(seed) {
        QRandomGenerator gen(*seed);
        return drawStyles(columnCount, gen);
    }
    return drawStyles(columnCount, *QRandomGenerator::global());
}

quint32 deriveStyleSeed(const QStringList &columnNames) {
    QCryptographicHash hash(QCryptographicHash::Sha1);
    hash.addData(QByteArray::number(columnNames.size()));
    for(const auto &name : columnNames) {
        hash.addData(name.toUtf8());
        hash.addData(QByteArray(1, '\0'));
    }
    const QByteArray digest = hash.result();
    return qFromLittleEndian<quint32>(digest.constData());
}

} // namespace QtCsvTable
