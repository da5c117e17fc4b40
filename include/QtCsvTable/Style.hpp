/** \file Style.hpp
 *  Column visual treatments and their assignment to table columns.
 */
#pragma once
#include "QtCsvTable/Export.hpp"
#include <QColor>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

namespace QtCsvTable {

/** Finite palette of column treatments. */
enum class Style {
    Red,
    Orange,
    Yellow,
    Green,
    Teal,
    Blue,
    Purple,
    Gray
};

/** All palette entries in declaration order. */
QTCSVTABLE_EXPORT const std::vector<Style> & stylePalette();

/** Background of the column header cell. */
QTCSVTABLE_EXPORT QColor headerColor(Style style);
/** Background of the column body cells (a light tint of the header color). */
QTCSVTABLE_EXPORT QColor tintColor(Style style);
/** Text color used for header and body cells of the column. */
QTCSVTABLE_EXPORT QColor textColor(Style style);
QTCSVTABLE_EXPORT QString styleName(Style style);

/** Assign one style per column. The palette is shuffled and consumed cyclically
 *  (reshuffled on every cycle), so styles only repeat once columnCount exceeds
 *  the palette size. With a seed the result is reproducible; without one the
 *  process-wide generator is used.
 */
QTCSVTABLE_EXPORT std::vector<Style> assignStyles(int columnCount, std::optional<quint32> seed = std::nullopt);

/** Stable seed computed from the column names (independent of process and platform). */
QTCSVTABLE_EXPORT quint32 deriveStyleSeed(const QStringList &columnNames);

} // namespace QtCsvTable
