#pragma once

#include <cardgrid/result.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace cardgrid {

//=============================================================================
// Enumerations
//=============================================================================
enum class FlowMode {
    Regular,          // N cards per row, last row may be partial
    Offset            // N, N-1, N, ... cards per row (honeycomb)
};

enum class HeadOrientation {
    Left,             // head beside the body, spanning its height
    Top               // head above the body, spanning the drawing width
};

enum class VerticalAlign { Top, Center, Bottom };

enum class TextAnchor { Start, Middle, End };

enum class TitlePosition { Top, Bottom };

enum class SortDirection { Ascending, Descending };

//=============================================================================
// Edges - margins and paddings
//=============================================================================
struct Edges {
    float top = 0;
    float right = 0;
    float bottom = 0;
    float left = 0;

    static Edges uniform(float v) { return Edges{v, v, v, v}; }
};

//=============================================================================
// ColorSource - one colour for everything, or a colour per section
//=============================================================================
struct UniformColor {
    std::string color;
};

struct KeyedColor {
    std::map<std::string, std::string> colors;
    std::string fallback;
};

using ColorSource = std::variant<UniformColor, KeyedColor>;

// Resolve the colour for a section name
const std::string& resolveColor(const ColorSource& source, const std::string& key);

//=============================================================================
// TextStyle - per text role
//=============================================================================
struct TextStyle {
    float size = 10.0f;
    int weight = 400;
    std::string style = "normal";     // "normal" | "italic" | "oblique"
};

//=============================================================================
// SectionOrder - how sections are sorted
//=============================================================================
struct SectionOrder {
    enum class Kind { Name, Count, Explicit };

    Kind kind = Kind::Count;
    SortDirection direction = SortDirection::Descending;
    std::vector<std::string> names;   // only for Kind::Explicit

    static SectionOrder byName(SortDirection dir = SortDirection::Ascending) {
        return SectionOrder{Kind::Name, dir, {}};
    }
    static SectionOrder byCount(SortDirection dir = SortDirection::Descending) {
        return SectionOrder{Kind::Count, dir, {}};
    }
    static SectionOrder explicitly(std::vector<std::string> names) {
        return SectionOrder{Kind::Explicit, SortDirection::Ascending, std::move(names)};
    }
};

//=============================================================================
// Configuration sections
//=============================================================================
struct PageConfig {
    float width = 800.0f;
    Edges margin = Edges::uniform(10.0f);
    std::string backgroundColor = "white";
    std::string fontFamily = "Open Sans";
};

struct GridConfig {
    uint32_t elementsPerRow = 5;
    FlowMode flow = FlowMode::Regular;
    SectionOrder order;
    std::vector<std::string> mergeSections;   // top orientation only
};

struct SectionHeadConfig {
    HeadOrientation orientation = HeadOrientation::Top;
    float size = 35.0f;                        // width if Left, height if Top
    VerticalAlign align = VerticalAlign::Top;
    TextStyle text{20.0f, 600, "normal"};
    ColorSource textColor = UniformColor{"black"};
    std::string backgroundColor = "white";
    Edges padding = Edges::uniform(5.0f);
    bool showTotals = false;
};

struct CardConfig {
    float height = 50.0f;
    TitlePosition titlePosition = TitlePosition::Bottom;
    TextAnchor anchor = TextAnchor::Middle;
    TextStyle title{10.0f, 400, "normal"};
    TextStyle subtitle{8.0f, 400, "normal"};
    ColorSource titleColor = UniformColor{"black"};
    ColorSource subtitleColor = UniformColor{"black"};
    ColorSource circleStrokeColor = UniformColor{"#c1c5c8"};
    float circleStrokeWidth = 2.0f;
    std::string backgroundColor = "white";
    Edges margin = Edges::uniform(2.0f);
    Edges circlePadding = Edges::uniform(2.0f);
    std::string placeholderColor = "#e0e0e0";
};

//=============================================================================
// LayoutConfig - complete, immutable layout configuration
//=============================================================================
struct LayoutConfig {
    PageConfig page;
    GridConfig grid;
    SectionHeadConfig head;
    CardConfig card;

    // Structural checks; fails with ErrorCode::InvalidConfig
    Result<void> validate() const;

    float drawAreaWidth() const {
        return page.width - page.margin.left - page.margin.right;
    }
};

const char* toString(FlowMode mode);
const char* toString(HeadOrientation orientation);

} // namespace cardgrid
