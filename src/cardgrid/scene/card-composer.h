#pragma once

#include <cardgrid/geometry.h>
#include <cardgrid/layout-config.h>
#include <cardgrid/record.h>
#include <cardgrid/result.hpp>
#include <cardgrid/scene.h>
#include <memory>
#include <optional>
#include <string>

namespace cardgrid::scene {

struct CardFields {
    std::string title;
    std::string subtitle;
    std::optional<std::string> imagePath;   // nullopt renders a placeholder
};

// Fully resolved styling for one card
struct CardStyle {
    std::string backgroundColor = "white";
    std::string fontFamily;
    TextStyle title{10.0f, 400, "normal"};
    TextStyle subtitle{8.0f, 400, "normal"};
    std::string titleColor = "black";
    std::string subtitleColor = "black";
    TitlePosition titlePosition = TitlePosition::Bottom;
    TextAnchor anchor = TextAnchor::Middle;
    Edges margin;
    Edges circlePadding;
    std::string circleStrokeColor = "black";
    float circleStrokeWidth = 0;
    std::string placeholderColor = "#e0e0e0";
};

//=============================================================================
// CardComposer - leaf scene subtree for one record
//
// Emits, in paint order: background rect, stroke disc, portrait image clipped
// to the disc (or a placeholder disc), title text, subtitle text.
//=============================================================================
class CardComposer {
public:
    using Ptr = std::shared_ptr<CardComposer>;

    static Result<Ptr> create(const CardConfig& config, const std::string& fontFamily);

    // Compose the card for a record of the given section, resolving the
    // per-section colours first
    Result<GroupNode> compose(const Rect& box, const Record& record,
                              const std::string& section) const;

    CardStyle styleFor(const std::string& section) const;

    // Errors: InvalidGeometry when the circle radius is not positive
    static Result<GroupNode> compose(const Rect& box, const CardFields& fields,
                                     const CardStyle& style);

    // min(usable width / 2, (usable height - text rows) / 2)
    static float circleRadius(const Rect& box, const CardStyle& style);

private:
    CardComposer(const CardConfig& config, const std::string& fontFamily)
        : _config(config), _fontFamily(fontFamily) {}

    CardConfig _config;
    std::string _fontFamily;
};

} // namespace cardgrid::scene
