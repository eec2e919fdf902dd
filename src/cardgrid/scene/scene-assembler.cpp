#include "scene-assembler.h"
#include <ytrace/ytrace.hpp>

namespace cardgrid::scene {

Result<SceneAssembler::Ptr> SceneAssembler::create(const LayoutConfig& config) {
    auto composerResult = CardComposer::create(config.card, config.page.fontFamily);
    if (!composerResult) {
        return Err<Ptr>("SceneAssembler: failed to create card composer", composerResult);
    }
    return Ok(Ptr(new SceneAssembler(config, *composerResult)));
}

Result<Scene> SceneAssembler::assemble(const grid::GridGeometry& geometry,
                                       const grid::Grouping& grouping) const {
    Scene scene;
    scene.width = geometry.pageWidth;
    scene.height = geometry.pageHeight;
    scene.fonts.push_back(FontResource{_config.page.fontFamily});

    scene.root.add(RectNode{0, 0, geometry.pageWidth, geometry.pageHeight,
                            _config.page.backgroundColor, "", 0});

    GroupNode area;
    area.transform = Translation{geometry.drawArea.x, geometry.drawArea.y};

    for (const auto& section : geometry.sections) {
        if (auto res = addSection(area, section, grouping); !res) {
            return Err<Scene>("SceneAssembler: section '" + section.name + "'", res);
        }
    }

    scene.root.add(std::move(area));

    yinfo("SceneAssembler: scene {}x{} with {} sections",
           scene.width, scene.height, geometry.sections.size());
    return Ok(std::move(scene));
}

Result<void> SceneAssembler::addSection(GroupNode& area, const grid::SectionGeometry& section,
                                        const grid::Grouping& grouping) const {
    const auto& head = _config.head;

    area.add(RectNode{section.head.x, section.head.y, section.head.width, section.head.height,
                      head.backgroundColor, "", 0});

    TextNode label;
    label.text = section.labelText;
    label.x = section.label.x;
    label.y = section.label.y;
    label.fontSize = head.text.size;
    label.fontWeight = head.text.weight;
    label.fontStyle = head.text.style;
    label.fontFamily = _config.page.fontFamily;
    label.fill = section.labelColor;
    label.anchor = TextAnchor::Start;
    label.baseline = Baseline::Auto;
    area.add(std::move(label));

    for (const auto& slot : section.cards) {
        if (slot.element >= grouping.elements.size()) {
            return Err("card slot refers to element " + std::to_string(slot.element) +
                       " of " + std::to_string(grouping.elements.size()),
                       ErrorCode::InvalidGeometry);
        }
        auto card = _composer->compose(slot.rect, grouping.elements[slot.element], section.name);
        if (!card) {
            return Err("failed to compose card '" + grouping.elements[slot.element].title + "'",
                       card);
        }
        area.add(std::move(*card));
    }
    return Ok();
}

} // namespace cardgrid::scene
