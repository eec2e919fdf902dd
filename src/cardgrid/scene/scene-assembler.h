#pragma once

#include "card-composer.h"
#include "../grid/grid-ir.h"
#include <cardgrid/layout-config.h>
#include <cardgrid/result.hpp>
#include <cardgrid/scene.h>
#include <memory>

namespace cardgrid::scene {

//=============================================================================
// SceneAssembler - GridGeometry + Grouping to a Scene tree
//
// root
//   page background rect
//   draw area group, translated by the page margin
//     per section: head rect, head label, one group per card
//=============================================================================
class SceneAssembler {
public:
    using Ptr = std::shared_ptr<SceneAssembler>;

    static Result<Ptr> create(const LayoutConfig& config);

    Result<Scene> assemble(const grid::GridGeometry& geometry,
                           const grid::Grouping& grouping) const;

private:
    SceneAssembler(const LayoutConfig& config, CardComposer::Ptr composer)
        : _config(config), _composer(std::move(composer)) {}

    Result<void> addSection(GroupNode& area, const grid::SectionGeometry& section,
                            const grid::Grouping& grouping) const;

    LayoutConfig _config;
    CardComposer::Ptr _composer;
};

} // namespace cardgrid::scene
