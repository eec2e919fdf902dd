#include "card-composer.h"
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace cardgrid::scene {

Result<CardComposer::Ptr> CardComposer::create(const CardConfig& config,
                                               const std::string& fontFamily) {
    if (config.height <= 0) {
        return Err<Ptr>("CardComposer: card height must be positive", ErrorCode::InvalidConfig);
    }
    return Ok(Ptr(new CardComposer(config, fontFamily)));
}

CardStyle CardComposer::styleFor(const std::string& section) const {
    CardStyle style;
    style.backgroundColor = _config.backgroundColor;
    style.fontFamily = _fontFamily;
    style.title = _config.title;
    style.subtitle = _config.subtitle;
    style.titleColor = resolveColor(_config.titleColor, section);
    style.subtitleColor = resolveColor(_config.subtitleColor, section);
    style.titlePosition = _config.titlePosition;
    style.anchor = _config.anchor;
    style.margin = _config.margin;
    style.circlePadding = _config.circlePadding;
    style.circleStrokeColor = resolveColor(_config.circleStrokeColor, section);
    style.circleStrokeWidth = _config.circleStrokeWidth;
    style.placeholderColor = _config.placeholderColor;
    return style;
}

Result<GroupNode> CardComposer::compose(const Rect& box, const Record& record,
                                        const std::string& section) const {
    CardFields fields{record.title, record.subtitle, record.imagePath};
    if (!fields.imagePath) {
        ywarn("CardComposer: no image for '{}' (row {}), drawing placeholder",
              record.title, record.rowIndex);
    }
    return compose(box, fields, styleFor(section));
}

float CardComposer::circleRadius(const Rect& box, const CardStyle& style) {
    const auto& m = style.margin;
    const auto& p = style.circlePadding;
    float horizontal = (box.width - m.left - m.right - p.left - p.right) / 2;
    float vertical = (box.height - m.top - m.bottom - p.top - p.bottom -
                      style.title.size - style.subtitle.size) / 2;
    return std::min(horizontal, vertical);
}

Result<GroupNode> CardComposer::compose(const Rect& box, const CardFields& fields,
                                        const CardStyle& style) {
    float radius = circleRadius(box, style);
    if (radius <= 0) {
        return Err<GroupNode>("card " + std::to_string(box.width) + "x" +
                              std::to_string(box.height) + " is too small for its text and image "
                              "(circle radius " + std::to_string(radius) + ")",
                              ErrorCode::InvalidGeometry);
    }

    const auto& m = style.margin;
    const float textRows = style.title.size + style.subtitle.size;

    // Circle block sits below the text rows when the title is on top
    float circleTop = box.y + m.top + style.circlePadding.top;
    if (style.titlePosition == TitlePosition::Top) {
        circleTop += textRows;
    }
    const float cx = box.centerX();
    const float cy = circleTop + radius;

    GroupNode card;

    card.add(RectNode{box.x, box.y, box.width, box.height, style.backgroundColor, "", 0});

    card.add(CircleNode{cx, cy, radius, style.circleStrokeColor,
                        style.circleStrokeColor, style.circleStrokeWidth});

    if (fields.imagePath) {
        ClippedImageNode image;
        image.x = cx - radius;
        image.y = cy - radius;
        image.width = 2 * radius;
        image.height = 2 * radius;
        image.href = *fields.imagePath;
        image.clipCx = cx;
        image.clipCy = cy;
        image.clipR = radius;
        card.add(std::move(image));
    } else {
        card.add(CircleNode{cx, cy, radius, style.placeholderColor, "", 0});
    }

    float textX = cx;
    switch (style.anchor) {
        case TextAnchor::Start:  textX = box.x + m.left; break;
        case TextAnchor::Middle: textX = box.centerX(); break;
        case TextAnchor::End:    textX = box.right() - m.right; break;
    }

    float titleY = 0;
    float subtitleY = 0;
    Baseline baseline = Baseline::Auto;
    if (style.titlePosition == TitlePosition::Top) {
        titleY = box.y + m.top;
        subtitleY = box.y + m.top + style.title.size;
        baseline = Baseline::Hanging;
    } else {
        titleY = box.bottom() - m.bottom - style.subtitle.size;
        subtitleY = box.bottom() - m.bottom;
    }

    TextNode title;
    title.text = fields.title;
    title.x = textX;
    title.y = titleY;
    title.fontSize = style.title.size;
    title.fontWeight = style.title.weight;
    title.fontStyle = style.title.style;
    title.fontFamily = style.fontFamily;
    title.fill = style.titleColor;
    title.anchor = style.anchor;
    title.baseline = baseline;
    card.add(std::move(title));

    TextNode subtitle;
    subtitle.text = fields.subtitle;
    subtitle.x = textX;
    subtitle.y = subtitleY;
    subtitle.fontSize = style.subtitle.size;
    subtitle.fontWeight = style.subtitle.weight;
    subtitle.fontStyle = style.subtitle.style;
    subtitle.fontFamily = style.fontFamily;
    subtitle.fill = style.subtitleColor;
    subtitle.anchor = style.anchor;
    subtitle.baseline = baseline;
    card.add(std::move(subtitle));

    return Ok(std::move(card));
}

} // namespace cardgrid::scene
