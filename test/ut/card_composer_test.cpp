//=============================================================================
// Card Composer Tests
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include "cardgrid/scene/card-composer.h"
#include <string>

using namespace boost::ut;
using namespace cardgrid;
using namespace cardgrid::scene;

namespace {

CardStyle bareStyle() {
    CardStyle style;
    style.fontFamily = "Open Sans";
    style.title = TextStyle{10.0f, 600, "normal"};
    style.subtitle = TextStyle{10.0f, 400, "italic"};
    style.margin = Edges::uniform(0.0f);
    style.circlePadding = Edges::uniform(0.0f);
    style.circleStrokeColor = "#c1c5c8";
    style.circleStrokeWidth = 2.0f;
    return style;
}

CardFields portrait() {
    return CardFields{"Ada", "Engineer", std::string("img/ada.png")};
}

} // namespace

suite card_composer_tests = [] {
    "radius is bounded by the tighter dimension"_test = [] {
        auto style = bareStyle();
        expect(CardComposer::circleRadius(Rect{0, 0, 100, 100}, style) == 40.0f);
        expect(CardComposer::circleRadius(Rect{0, 0, 60, 100}, style) == 30.0f);

        style.margin = Edges::uniform(2.0f);
        style.circlePadding = Edges::uniform(2.0f);
        expect(CardComposer::circleRadius(Rect{100, 50, 100, 100}, style) == 36.0f);
    };

    "card emits nodes in paint order"_test = [] {
        auto card = CardComposer::compose(Rect{0, 0, 100, 100}, portrait(), bareStyle());
        expect(card.has_value() >> fatal);
        const auto& c = card->children;
        expect((c.size() == 5u) >> fatal);
        expect(c[0].as<RectNode>() != nullptr);
        expect(c[1].as<CircleNode>() != nullptr);
        expect(c[2].as<ClippedImageNode>() != nullptr);
        expect(c[3].as<TextNode>() != nullptr);
        expect(c[4].as<TextNode>() != nullptr);

        const auto* bg = c[0].as<RectNode>();
        expect(bg->width == 100.0f && bg->height == 100.0f);
        expect(bg->fill == "white");

        const auto* disc = c[1].as<CircleNode>();
        expect(disc->cx == 50.0f && disc->cy == 40.0f && disc->r == 40.0f);
        expect(disc->fill == "#c1c5c8" && disc->stroke == "#c1c5c8");
        expect(disc->strokeWidth == 2.0f);
    };

    "image fills the circle's bounding square"_test = [] {
        auto card = CardComposer::compose(Rect{0, 0, 100, 100}, portrait(), bareStyle());
        expect(card.has_value() >> fatal);
        const auto* image = card->children[2].as<ClippedImageNode>();
        expect((image != nullptr) >> fatal);
        expect(image->x == 10.0f && image->y == 0.0f);
        expect(image->width == 80.0f && image->height == 80.0f);
        expect(image->clipCx == 50.0f && image->clipCy == 40.0f && image->clipR == 40.0f);
        expect(image->href == "img/ada.png");
    };

    "bottom titles sit on the bottom edge"_test = [] {
        auto card = CardComposer::compose(Rect{0, 0, 100, 100}, portrait(), bareStyle());
        expect(card.has_value() >> fatal);
        const auto* title = card->children[3].as<TextNode>();
        const auto* subtitle = card->children[4].as<TextNode>();
        expect(title->text == "Ada" && subtitle->text == "Engineer");
        expect(title->y == 90.0f);
        expect(subtitle->y == 100.0f);
        expect(title->baseline == Baseline::Auto);
        expect(title->fontWeight == 600);
        expect(subtitle->fontStyle == "italic");
        expect(title->fontFamily == "Open Sans");
    };

    "top titles push the circle below the text"_test = [] {
        auto style = bareStyle();
        style.titlePosition = TitlePosition::Top;
        auto card = CardComposer::compose(Rect{0, 0, 100, 100}, portrait(), style);
        expect(card.has_value() >> fatal);
        const auto* disc = card->children[1].as<CircleNode>();
        expect(disc->cy == 60.0f);
        const auto* title = card->children[3].as<TextNode>();
        const auto* subtitle = card->children[4].as<TextNode>();
        expect(title->y == 0.0f);
        expect(subtitle->y == 10.0f);
        expect(title->baseline == Baseline::Hanging);
        expect(subtitle->baseline == Baseline::Hanging);
    };

    "text anchor picks the shared x"_test = [] {
        auto style = bareStyle();
        style.margin = Edges{0, 4, 0, 6};
        Rect box{200, 0, 100, 100};

        style.anchor = TextAnchor::Start;
        auto start = CardComposer::compose(box, portrait(), style);
        expect(start.has_value() >> fatal);
        expect(start->children[3].as<TextNode>()->x == 206.0f);
        expect(start->children[4].as<TextNode>()->x == 206.0f);

        style.anchor = TextAnchor::Middle;
        auto middle = CardComposer::compose(box, portrait(), style);
        expect(middle.has_value() >> fatal);
        expect(middle->children[3].as<TextNode>()->x == 250.0f);

        style.anchor = TextAnchor::End;
        auto end = CardComposer::compose(box, portrait(), style);
        expect(end.has_value() >> fatal);
        expect(end->children[3].as<TextNode>()->x == 296.0f);
        expect(end->children[3].as<TextNode>()->anchor == TextAnchor::End);
    };

    "missing image draws a placeholder disc"_test = [] {
        CardFields fields{"Bob", "Unknown", std::nullopt};
        auto card = CardComposer::compose(Rect{0, 0, 100, 100}, fields, bareStyle());
        expect(card.has_value() >> fatal);
        const auto& c = card->children;
        expect((c.size() == 5u) >> fatal);
        expect(c[1].as<CircleNode>() != nullptr);
        const auto* placeholder = c[2].as<CircleNode>();
        expect((placeholder != nullptr) >> fatal);
        expect(placeholder->fill == "#e0e0e0");
        expect(placeholder->r == 40.0f);
        expect(c[3].as<TextNode>()->text == "Bob");
    };

    "card too small for its text is rejected"_test = [] {
        auto card = CardComposer::compose(Rect{0, 0, 20, 20}, portrait(), bareStyle());
        expect(!card.has_value() >> fatal);
        expect(card.error().code() == ErrorCode::InvalidGeometry);
    };

    "section colours resolve per card"_test = [] {
        CardConfig config;
        config.titleColor = KeyedColor{{{"Ops", "navy"}}, "black"};
        config.circleStrokeColor = KeyedColor{{{"Ops", "orange"}}, "#c1c5c8"};
        auto composer = CardComposer::create(config, "Lato");
        expect(composer.has_value() >> fatal);

        auto ops = (*composer)->styleFor("Ops");
        expect(ops.titleColor == "navy");
        expect(ops.circleStrokeColor == "orange");
        expect(ops.fontFamily == "Lato");

        auto other = (*composer)->styleFor("Sales");
        expect(other.titleColor == "black");
        expect(other.circleStrokeColor == "#c1c5c8");
    };

    "records compose with their section style"_test = [] {
        CardConfig config;
        config.height = 100.0f;
        config.subtitleColor = KeyedColor{{{"Ops", "teal"}}, "black"};
        auto composer = CardComposer::create(config, "Open Sans");
        expect(composer.has_value() >> fatal);

        Record record;
        record.title = "Ada";
        record.subtitle = "Engineer";
        auto card = (*composer)->compose(Rect{0, 0, 100, 100}, record, "Ops");
        expect(card.has_value() >> fatal);
        expect(card->children[2].as<CircleNode>() != nullptr);
        expect(card->children[4].as<TextNode>()->fill == "teal");
    };
};
