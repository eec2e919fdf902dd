#include <cardgrid/layout-config.h>
#include <cmath>
#include <set>

namespace cardgrid {

const std::string& resolveColor(const ColorSource& source, const std::string& key) {
    if (const auto* uniform = std::get_if<UniformColor>(&source)) {
        return uniform->color;
    }
    const auto& keyed = std::get<KeyedColor>(source);
    auto it = keyed.colors.find(key);
    return it != keyed.colors.end() ? it->second : keyed.fallback;
}

static bool negative(const Edges& e) {
    return e.top < 0 || e.right < 0 || e.bottom < 0 || e.left < 0;
}

static bool finite(const Edges& e) {
    return std::isfinite(e.top) && std::isfinite(e.right) &&
           std::isfinite(e.bottom) && std::isfinite(e.left);
}

static Result<void> invalid(const std::string& message) {
    return Err<void>(message, ErrorCode::InvalidConfig);
}

Result<void> LayoutConfig::validate() const {
    if (!std::isfinite(page.width) || !std::isfinite(head.size) || !std::isfinite(card.height) ||
        !std::isfinite(head.text.size) || !std::isfinite(card.title.size) ||
        !std::isfinite(card.subtitle.size) || !std::isfinite(card.circleStrokeWidth) ||
        !finite(page.margin) || !finite(head.padding) ||
        !finite(card.margin) || !finite(card.circlePadding)) {
        return invalid("sizes, margins and paddings must be finite numbers");
    }
    if (grid.elementsPerRow == 0) {
        return invalid("elements-per-row must be positive");
    }
    if (card.height <= 0) {
        return invalid("card height must be positive");
    }
    if (head.size <= 0) {
        return invalid("section head size must be positive");
    }
    if (negative(page.margin) || negative(head.padding) ||
        negative(card.margin) || negative(card.circlePadding)) {
        return invalid("margins and paddings must not be negative");
    }
    if (drawAreaWidth() <= 0) {
        return invalid("page width " + std::to_string(page.width) +
                       " leaves no drawing area after margins");
    }
    if (head.orientation == HeadOrientation::Left && head.size >= drawAreaWidth()) {
        return invalid("left section heads leave no room for the section body");
    }
    if (card.title.size < 0 || card.subtitle.size < 0 || head.text.size < 0) {
        return invalid("text sizes must not be negative");
    }
    if (card.circleStrokeWidth < 0) {
        return invalid("circle stroke width must not be negative");
    }
    if (!grid.mergeSections.empty()) {
        if (head.orientation != HeadOrientation::Top) {
            return invalid("merge-sections requires top section heads");
        }
        std::set<std::string> seen;
        for (const auto& name : grid.mergeSections) {
            if (!seen.insert(name).second) {
                return invalid("merge-sections lists '" + name + "' twice");
            }
        }
    }
    return Ok();
}

const char* toString(FlowMode mode) {
    return mode == FlowMode::Offset ? "offset" : "regular";
}

const char* toString(HeadOrientation orientation) {
    return orientation == HeadOrientation::Left ? "left" : "top";
}

} // namespace cardgrid
