// Style assignment: coverage, reproducibility under a seed, palette cycling
#include "QtCsvTable/Style.hpp"
#include "QtCsvTable/TableBuilder.hpp"
#include <cassert>
#include <iostream>
#include <set>

using namespace QtCsvTable;

int main(){
    const int paletteSize = static_cast<int>(stylePalette().size());
    assert(paletteSize == 8);

    // One style per column; no repeats while the palette suffices
    {
        auto styles = assignStyles(paletteSize, 7u);
        assert(static_cast<int>(styles.size()) == paletteSize);
        std::set<Style> distinct(styles.begin(), styles.end());
        assert(static_cast<int>(distinct.size()) == paletteSize);
        assert(assignStyles(0).empty());
        assert(assignStyles(-3, 1u).empty());
    }
    // Same seed, same styles
    {
        assert(assignStyles(20, 1234u) == assignStyles(20, 1234u));
        assert(assignStyles(5).size() == 5);
    }
    // Past the palette size every cycle is a full permutation
    {
        auto styles = assignStyles(paletteSize * 2 + 3, 99u);
        assert(static_cast<int>(styles.size()) == paletteSize * 2 + 3);
        std::set<Style> first(styles.begin(), styles.begin() + paletteSize);
        std::set<Style> second(styles.begin() + paletteSize, styles.begin() + 2 * paletteSize);
        assert(static_cast<int>(first.size()) == paletteSize && static_cast<int>(second.size()) == paletteSize);
    }
    // Derived seed depends only on the names
    {
        assert(deriveStyleSeed({"a","b"}) == deriveStyleSeed({"a","b"}));
        assert(deriveStyleSeed({"a","b"}) != deriveStyleSeed({"ab"}));
        Table t1 = buildTable("q,r,s\n1,2,3");
        Table t2 = buildTable("q,r,s\n7,8,9\n10,11,12");
        assert(t1.columnStyles() == t2.columnStyles());
        BuildOptions seeded; seeded.styleSeed = 5;
        assert(buildTable("q,r,s\n1,2,3", seeded).columnStyles() == assignStyles(3, 5u));
    }
    // Palette colors: tint is lighter than the header, every entry is named
    {
        for(Style s : stylePalette()) {
            assert(tintColor(s).lightness() >= headerColor(s).lightness());
            assert(!styleName(s).isEmpty());
            assert(textColor(s).isValid());
        }
    }
    std::cout << "style_assign_test passed" << std::endl; return 0;
}
