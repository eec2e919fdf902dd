//=============================================================================
// LayoutConfig Tests
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include <cardgrid/layout-config.h>
#include <limits>
#include <string>

using namespace boost::ut;
using namespace cardgrid;

suite layout_config_tests = [] {
    "defaults are valid"_test = [] {
        LayoutConfig config;
        expect(config.validate().has_value());
        expect(config.drawAreaWidth() == 780.0f);
    };

    "colour sources resolve by section"_test = [] {
        ColorSource uniform = UniformColor{"black"};
        expect(resolveColor(uniform, "anything") == "black");

        ColorSource keyed = KeyedColor{{{"Ops", "navy"}}, "gray"};
        expect(resolveColor(keyed, "Ops") == "navy");
        expect(resolveColor(keyed, "Sales") == "gray");
    };

    "structural errors are invalid config"_test = [] {
        auto expectInvalid = [](const LayoutConfig& config) {
            auto res = config.validate();
            expect(!res.has_value() >> fatal);
            expect(res.error().code() == ErrorCode::InvalidConfig);
        };

        LayoutConfig perRow;
        perRow.grid.elementsPerRow = 0;
        expectInvalid(perRow);

        LayoutConfig height;
        height.card.height = -1;
        expectInvalid(height);

        LayoutConfig margin;
        margin.card.margin.left = -2;
        expectInvalid(margin);

        LayoutConfig wide;
        wide.head.orientation = HeadOrientation::Left;
        wide.head.size = 780;
        expectInvalid(wide);

        LayoutConfig twice;
        twice.grid.mergeSections = {"A", "B", "A"};
        expectInvalid(twice);

        LayoutConfig leftMerge;
        leftMerge.head.orientation = HeadOrientation::Left;
        leftMerge.grid.mergeSections = {"A"};
        expectInvalid(leftMerge);
    };

    "non-finite sizes are invalid config"_test = [] {
        const float nan = std::numeric_limits<float>::quiet_NaN();
        const float inf = std::numeric_limits<float>::infinity();
        auto expectInvalid = [](const LayoutConfig& config) {
            auto res = config.validate();
            expect(!res.has_value() >> fatal);
            expect(res.error().code() == ErrorCode::InvalidConfig);
        };

        LayoutConfig width;
        width.page.width = nan;
        expectInvalid(width);

        LayoutConfig height;
        height.card.height = inf;
        expectInvalid(height);

        LayoutConfig head;
        head.head.size = inf;
        expectInvalid(head);

        LayoutConfig padding;
        padding.card.circlePadding.bottom = nan;
        expectInvalid(padding);

        LayoutConfig text;
        text.card.title.size = nan;
        expectInvalid(text);

        LayoutConfig stroke;
        stroke.card.circleStrokeWidth = inf;
        expectInvalid(stroke);
    };

    "enum names"_test = [] {
        expect(std::string(toString(FlowMode::Offset)) == "offset");
        expect(std::string(toString(HeadOrientation::Left)) == "left");
        expect(std::string(errorCodeName(ErrorCode::MergeOverflow)) == "MergeOverflow");
    };

    "errors chain their causes"_test = [] {
        Result<int> inner = Err<int>("inner failure", ErrorCode::Io);
        Result<void> outer = Err("outer context", inner);
        expect(!outer.has_value() >> fatal);
        expect(outer.error().code() == ErrorCode::Io);
        expect(error_msg(outer) == "outer context: inner failure");
        expect(outer.error().cause() != nullptr);
    };
};
