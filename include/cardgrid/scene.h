#pragma once

#include <cardgrid/layout-config.h>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cardgrid::scene {

//=============================================================================
// Scene tree
//
// Renderer-neutral description of the page: rectangles, circles, images
// clipped to a circle, anchored text and nested groups with a translation.
// Every node has exactly one parent; groups own their children by value.
//=============================================================================

enum class Baseline {
    Auto,             // alphabetic baseline at y
    Hanging           // top of the glyphs at y
};

struct RectNode {
    float x = 0, y = 0;
    float width = 0, height = 0;
    std::string fill;
    std::string stroke;               // empty = none
    float strokeWidth = 0;
};

struct CircleNode {
    float cx = 0, cy = 0;
    float r = 0;
    std::string fill;
    std::string stroke;
    float strokeWidth = 0;
};

// Image scaled into (x, y, width, height) and clipped to a circle
struct ClippedImageNode {
    float x = 0, y = 0;
    float width = 0, height = 0;
    std::string href;                 // resolved by the renderer
    float clipCx = 0, clipCy = 0;
    float clipR = 0;
};

struct TextNode {
    std::string text;
    float x = 0, y = 0;
    float fontSize = 10;
    int fontWeight = 400;
    std::string fontStyle = "normal";
    std::string fontFamily;
    std::string fill;
    TextAnchor anchor = TextAnchor::Start;
    Baseline baseline = Baseline::Auto;
};

struct Translation {
    float dx = 0;
    float dy = 0;
};

struct Node;

struct GroupNode {
    std::optional<Translation> transform;
    std::vector<Node> children;

    template<typename T>
    void add(T node);
};

struct Node {
    std::variant<RectNode, CircleNode, ClippedImageNode, TextNode, GroupNode> value;

    template<typename T>
    const T* as() const { return std::get_if<T>(&value); }
};

template<typename T>
void GroupNode::add(T node) {
    children.push_back(Node{std::move(node)});
}

struct FontResource {
    std::string family;
};

//=============================================================================
// Scene - page size, font declarations and the root group
//=============================================================================
struct Scene {
    float width = 0;
    float height = 0;
    std::vector<FontResource> fonts;
    GroupNode root;
};

} // namespace cardgrid::scene
