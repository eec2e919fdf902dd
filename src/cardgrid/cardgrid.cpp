#include <cardgrid/cardgrid.h>
#include "grid/grid-layout.h"
#include "grid/grouper.h"
#include "grid/row-planner.h"
#include "scene/scene-assembler.h"
#include <ytrace/ytrace.hpp>

namespace cardgrid {

Result<CardGrid::Ptr> CardGrid::create(const LayoutConfig& config) {
    if (auto res = config.validate(); !res) {
        return Err<Ptr>("CardGrid: invalid layout configuration", res);
    }

    auto gridLayout = grid::GridLayout::create(grid::GridLayout::Params::fromConfig(config));
    if (!gridLayout) {
        return Err<Ptr>("CardGrid: failed to create grid layout", gridLayout);
    }

    auto assembler = scene::SceneAssembler::create(config);
    if (!assembler) {
        return Err<Ptr>("CardGrid: failed to create scene assembler", assembler);
    }

    yinfo("CardGrid: {} flow, {} per row, {} section heads",
          toString(config.grid.flow), config.grid.elementsPerRow,
          toString(config.head.orientation));
    return Ok(Ptr(new CardGrid(config, *gridLayout, *assembler)));
}

CardGrid::CardGrid(const LayoutConfig& config,
                   std::shared_ptr<grid::GridLayout> gridLayout,
                   std::shared_ptr<scene::SceneAssembler> assembler)
    : _config(config)
    , _gridLayout(std::move(gridLayout))
    , _assembler(std::move(assembler))
{}

Result<scene::Scene> CardGrid::layout(const std::vector<Record>& records) const {
    auto grouping = grid::groupRecords(records, _config.grid.order);
    if (!grouping) {
        return Err<scene::Scene>("CardGrid: grouping failed", grouping);
    }

    grid::planRows(*grouping, _config.grid.flow, _config.grid.elementsPerRow);

    auto geometry = _gridLayout->layout(*grouping);
    if (!geometry) {
        return Err<scene::Scene>("CardGrid: layout failed", geometry);
    }

    auto assembled = _assembler->assemble(*geometry, *grouping);
    if (!assembled) {
        return Err<scene::Scene>("CardGrid: scene assembly failed", assembled);
    }

    yinfo("CardGrid: {} records laid out on a {}x{} page",
          records.size(), assembled->width, assembled->height);
    return assembled;
}

} // namespace cardgrid
