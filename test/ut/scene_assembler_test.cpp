//=============================================================================
// Scene Assembler Tests
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include "cardgrid/grid/grid-layout.h"
#include "cardgrid/grid/grouper.h"
#include "cardgrid/grid/row-planner.h"
#include "cardgrid/scene/scene-assembler.h"
#include <string>
#include <vector>

using namespace boost::ut;
using namespace cardgrid;
using namespace cardgrid::scene;

namespace {

LayoutConfig testConfig() {
    LayoutConfig config;
    config.page.width = 520.0f;
    config.page.margin = Edges{12, 10, 8, 10};
    config.page.backgroundColor = "ivory";
    config.page.fontFamily = "Lato";
    config.head.size = 30.0f;
    config.head.backgroundColor = "#eeeeee";
    config.head.showTotals = true;
    return config;
}

struct Pipeline {
    grid::Grouping grouping;
    grid::GridGeometry geometry;
};

Pipeline runLayout(const LayoutConfig& config, const std::vector<Record>& records) {
    auto grouping = grid::groupRecords(records, config.grid.order);
    grid::planRows(*grouping, config.grid.flow, config.grid.elementsPerRow);
    auto layout = grid::GridLayout::create(grid::GridLayout::Params::fromConfig(config));
    auto geometry = (*layout)->layout(*grouping);
    return Pipeline{std::move(*grouping), std::move(*geometry)};
}

std::vector<Record> records(const std::string& section, int count, size_t firstRow) {
    std::vector<Record> out;
    for (int i = 0; i < count; i++) {
        Record r;
        r.rowIndex = firstRow + i;
        r.sectionKey = section;
        r.title = section + std::to_string(i);
        r.imagePath = "img/" + r.title + ".png";
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace

suite scene_assembler_tests = [] {
    "scene wraps the drawing area in the page margin"_test = [] {
        auto config = testConfig();
        auto input = records("A", 7, 0);
        auto more = records("B", 5, 7);
        input.insert(input.end(), more.begin(), more.end());
        auto run = runLayout(config, input);

        auto assembler = SceneAssembler::create(config);
        expect(assembler.has_value() >> fatal);
        auto scene = (*assembler)->assemble(run.geometry, run.grouping);
        expect(scene.has_value() >> fatal);

        expect(scene->width == 520.0f);
        expect(scene->height == run.geometry.pageHeight);
        expect((scene->fonts.size() == 1u) >> fatal);
        expect(scene->fonts[0].family == "Lato");

        const auto& root = scene->root.children;
        expect((root.size() == 2u) >> fatal);
        const auto* page = root[0].as<RectNode>();
        expect((page != nullptr) >> fatal);
        expect(page->x == 0.0f && page->y == 0.0f);
        expect(page->width == 520.0f && page->height == scene->height);
        expect(page->fill == "ivory");

        const auto* area = root[1].as<GroupNode>();
        expect((area != nullptr) >> fatal);
        expect(area->transform.has_value() >> fatal);
        expect(area->transform->dx == 10.0f && area->transform->dy == 12.0f);

        // head + label + 7 cards, head + label + 5 cards
        expect(area->children.size() == 16u);
    };

    "sections emit head, label and cards"_test = [] {
        auto config = testConfig();
        auto run = runLayout(config, records("Ops", 2, 0));
        auto assembler = SceneAssembler::create(config);
        expect(assembler.has_value() >> fatal);
        auto scene = (*assembler)->assemble(run.geometry, run.grouping);
        expect(scene.has_value() >> fatal);

        const auto* area = scene->root.children[1].as<GroupNode>();
        expect((area != nullptr) >> fatal);
        expect((area->children.size() == 4u) >> fatal);

        const auto* head = area->children[0].as<RectNode>();
        expect((head != nullptr) >> fatal);
        expect(head->fill == "#eeeeee");
        expect(head->height == 30.0f);

        const auto* label = area->children[1].as<TextNode>();
        expect((label != nullptr) >> fatal);
        expect(label->text == "Ops: 2");
        expect(label->anchor == TextAnchor::Start);
        expect(label->baseline == Baseline::Auto);
        expect(label->fontFamily == "Lato");
        expect(label->fontSize == 20.0f);
        expect(label->fontWeight == 600);

        const auto* card = area->children[2].as<GroupNode>();
        expect((card != nullptr) >> fatal);
        expect(card->children[2].as<ClippedImageNode>() != nullptr);
        expect(card->children[3].as<TextNode>()->text == "Ops0");
    };

    "undersized cards fail the whole scene"_test = [] {
        auto config = testConfig();
        config.card.height = 20.0f;
        auto run = runLayout(config, records("Ops", 2, 0));
        auto assembler = SceneAssembler::create(config);
        expect(assembler.has_value() >> fatal);
        auto scene = (*assembler)->assemble(run.geometry, run.grouping);
        expect(!scene.has_value() >> fatal);
        expect(scene.error().code() == ErrorCode::InvalidGeometry);
    };
};
