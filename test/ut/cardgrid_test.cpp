//=============================================================================
// CardGrid Pipeline Tests
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include <cardgrid/cardgrid.h>
#include <cardgrid/config.h>
#include <cardgrid/svg-writer.h>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace cardgrid;

namespace {

std::vector<Record> teams() {
    auto parsed = parseRecords(R"(
- {section: B, title: b0, image: b0.png}
- {section: A, title: a0, image: a0.png}
- {section: A, title: a1, image: a1.png}
- {section: B, title: b1, image: b1.png}
- {section: A, title: a2, image: a2.png}
- {section: C, title: c0, image: c0.png}
)", InputColumns{});
    return *parsed;
}

const scene::GroupNode& drawArea(const scene::Scene& s) {
    return *s.root.children[1].as<scene::GroupNode>();
}

std::vector<std::string> labels(const scene::Scene& s) {
    std::vector<std::string> out;
    for (const auto& node : drawArea(s).children) {
        if (const auto* text = node.as<scene::TextNode>()) out.push_back(text->text);
    }
    return out;
}

} // namespace

suite cardgrid_tests = [] {
    "records become a scene"_test = [] {
        LayoutConfig config;
        config.page.width = 520.0f;
        config.head.showTotals = true;
        auto grid = CardGrid::create(config);
        expect(grid.has_value() >> fatal);

        auto page = (*grid)->layout(teams());
        expect(page.has_value() >> fatal);
        expect(labels(*page) == std::vector<std::string>{"A: 3", "B: 2", "C: 1"});
        // three top heads of 35 and three rows of 50 plus margins
        expect(page->height == 3 * 35.0f + 3 * 50.0f + 20.0f);
        // 3 heads, 3 labels, 6 cards
        expect(drawArea(*page).children.size() == 12u);
    };

    "same input lays out identically"_test = [] {
        LayoutConfig config;
        auto grid = CardGrid::create(config);
        expect(grid.has_value() >> fatal);
        auto records = teams();
        auto first = (*grid)->layout(records);
        std::reverse(records.begin(), records.end());
        auto second = (*grid)->layout(records);
        expect(first.has_value() >> fatal);
        expect(second.has_value() >> fatal);

        auto writer = scene::SvgWriter::create();
        expect(writer.has_value() >> fatal);
        auto a = (*writer)->write(*first);
        auto b = (*writer)->write(*second);
        expect(a.has_value() && b.has_value());
        expect(*a == *b);
    };

    "invalid configuration is refused up front"_test = [] {
        LayoutConfig config;
        config.grid.elementsPerRow = 0;
        auto grid = CardGrid::create(config);
        expect(!grid.has_value() >> fatal);
        expect(grid.error().code() == ErrorCode::InvalidConfig);
    };

    "stage errors keep their code"_test = [] {
        LayoutConfig config;
        config.grid.order = SectionOrder::explicitly({"A", "B"});
        auto grid = CardGrid::create(config);
        expect(grid.has_value() >> fatal);
        auto page = (*grid)->layout(teams());
        expect(!page.has_value() >> fatal);
        expect(page.error().code() == ErrorCode::SectionOrderMismatch);
        expect(error_msg(page).find("'C'") != std::string::npos);

        LayoutConfig merging;
        merging.grid.mergeSections = {"B", "C"};
        merging.grid.elementsPerRow = 2;
        auto mergeGrid = CardGrid::create(merging);
        expect(mergeGrid.has_value() >> fatal);
        auto overflow = (*mergeGrid)->layout(teams());
        expect(!overflow.has_value() >> fatal);
        expect(overflow.error().code() == ErrorCode::MergeOverflow);

        auto records = teams();
        records[0].sectionKey.reset();
        auto missing = (*grid)->layout(records);
        expect(!missing.has_value() >> fatal);
        expect(missing.error().code() == ErrorCode::MissingSectionKey);
    };

    "configuration drives the pipeline"_test = [] {
        auto config = Config::fromString(R"(
page: {width: 420}
grid: {elements-per-row: 2, flow: offset, section-order: name}
section-head: {orientation: left, size: 20}
)");
        expect(config.has_value() >> fatal);
        auto layout = (*config)->layoutConfig();
        expect(layout.has_value() >> fatal);
        auto grid = CardGrid::create(*layout);
        expect(grid.has_value() >> fatal);
        auto page = (*grid)->layout(teams());
        expect(page.has_value() >> fatal);
        // A:3 -> 2 rows, B:2 -> 1 row, C:1 -> 1 row; left heads add no height
        expect(page->height == 4 * 50.0f + 20.0f);
        expect(labels(*page) == std::vector<std::string>{"A", "B", "C"});
    };
};
