#pragma once

#include "grid-ir.h"
#include <cardgrid/layout-config.h>
#include <cardgrid/result.hpp>
#include <memory>

namespace cardgrid::grid {

//=============================================================================
// GridLayout - sections, rows and cards to pixel geometry
//
// The algorithm has these phases:
// 1. Merge planning (validate the merge set, fuse its rows and heads)
// 2. Page sizing (drawing area from total rows and head count)
// 3. Section placement (head box, label, body box per section)
// 4. Card flow (one slot per element, Regular or Offset wrapping)
//
// A cursor (x, y) marks the next free position in drawing-area coordinates;
// it is passed through each phase by value.
//=============================================================================
class GridLayout {
public:
    using Ptr = std::shared_ptr<GridLayout>;

    struct Params {
        uint32_t elementsPerRow = 5;
        FlowMode flow = FlowMode::Regular;
        HeadOrientation orientation = HeadOrientation::Top;
        float headSize = 35.0f;               // width if Left, height if Top
        float cardHeight = 50.0f;
        float pageWidth = 800.0f;
        Edges pageMargin = Edges::uniform(10.0f);
        VerticalAlign labelAlign = VerticalAlign::Top;
        float labelTextSize = 20.0f;
        Edges headPadding = Edges::uniform(5.0f);
        bool showTotals = false;
        ColorSource labelColor = UniformColor{"black"};
        std::vector<std::string> mergeSections;

        static Params fromConfig(const LayoutConfig& config);
    };

    static Result<Ptr> create(const Params& params);

    // Sections must carry planned row counts (see planRows()).
    // Errors: MergeOverflow, MergeOrderMismatch. Nothing is produced on error.
    Result<GridGeometry> layout(const Grouping& grouping) const;

    const Params& params() const { return _params; }

private:
    explicit GridLayout(const Params& params) : _params(params) {}

    struct Cursor {
        float x = 0;
        float y = 0;
    };

    struct MergePlan {
        size_t first = 0;                     // section index range [first, last]
        size_t last = 0;
        bool active = false;

        bool contains(size_t i) const { return active && i >= first && i <= last; }
    };

    // Per-section card flow state
    struct Flow {
        float originX = 0;
        float cardWidth = 0;
        float cardHeight = 0;
        uint32_t perRow = 1;
        bool offset = false;
        std::vector<uint32_t> boundaries;     // offset row ends
    };

    // Phase 1
    Result<MergePlan> planMerge(const Grouping& grouping) const;

    // Phase 2
    void sizePage(const Grouping& grouping, const MergePlan& merge, GridGeometry& geometry) const;

    // Phase 3 + 4: returns the cursor for the next section
    Cursor placeSection(const Section& section, bool merged, bool lastMerged,
                        Cursor cursor, float drawWidth, SectionGeometry& out) const;

    Point labelPosition(const Rect& head) const;

    // Position of the card after `placed` cards have been laid out
    static Cursor nextCard(const Cursor& current, const Flow& flow, uint32_t placed, bool& wrapped);

    Params _params;
};

} // namespace cardgrid::grid
