#pragma once

#include <cardgrid/layout-config.h>
#include <cardgrid/record.h>
#include <cardgrid/result.hpp>
#include <cardgrid/scene.h>
#include <memory>
#include <vector>

namespace cardgrid {

namespace grid {
class GridLayout;
}
namespace scene {
class SceneAssembler;
}

//=============================================================================
// CardGrid - records + layout configuration to a scene
//
// Pipeline: group records into ordered sections, plan rows per section, lay
// out heads, bodies and card slots, then compose cards into the scene tree.
// The first failing stage aborts the run; no partial scene is returned.
//=============================================================================
class CardGrid {
public:
    using Ptr = std::shared_ptr<CardGrid>;

    // Errors: InvalidConfig
    static Result<Ptr> create(const LayoutConfig& config);

    Result<scene::Scene> layout(const std::vector<Record>& records) const;

    const LayoutConfig& config() const { return _config; }

private:
    CardGrid(const LayoutConfig& config,
             std::shared_ptr<grid::GridLayout> gridLayout,
             std::shared_ptr<scene::SceneAssembler> assembler);

    LayoutConfig _config;
    std::shared_ptr<grid::GridLayout> _gridLayout;
    std::shared_ptr<scene::SceneAssembler> _assembler;
};

} // namespace cardgrid
