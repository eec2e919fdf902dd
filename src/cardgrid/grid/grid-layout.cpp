#include "grid-layout.h"
#include "row-planner.h"
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <unordered_set>

namespace cardgrid::grid {

GridLayout::Params GridLayout::Params::fromConfig(const LayoutConfig& config) {
    Params p;
    p.elementsPerRow = config.grid.elementsPerRow;
    p.flow = config.grid.flow;
    p.orientation = config.head.orientation;
    p.headSize = config.head.size;
    p.cardHeight = config.card.height;
    p.pageWidth = config.page.width;
    p.pageMargin = config.page.margin;
    p.labelAlign = config.head.align;
    p.labelTextSize = config.head.text.size;
    p.headPadding = config.head.padding;
    p.showTotals = config.head.showTotals;
    p.labelColor = config.head.textColor;
    p.mergeSections = config.grid.mergeSections;
    return p;
}

Result<GridLayout::Ptr> GridLayout::create(const Params& params) {
    if (params.elementsPerRow == 0) {
        return Err<Ptr>("GridLayout: elements per row must be positive", ErrorCode::InvalidConfig);
    }
    if (params.cardHeight <= 0) {
        return Err<Ptr>("GridLayout: card height must be positive", ErrorCode::InvalidConfig);
    }
    if (params.headSize <= 0) {
        return Err<Ptr>("GridLayout: section head size must be positive", ErrorCode::InvalidConfig);
    }
    if (params.pageWidth - params.pageMargin.left - params.pageMargin.right <= 0) {
        return Err<Ptr>("GridLayout: page margins leave no drawing area", ErrorCode::InvalidConfig);
    }
    if (params.orientation == HeadOrientation::Left && !params.mergeSections.empty()) {
        return Err<Ptr>("GridLayout: sections can only be merged with top section heads",
                        ErrorCode::InvalidConfig);
    }
    return Ok(Ptr(new GridLayout(params)));
}

static std::string joinNames(const std::vector<std::string>& names) {
    std::string out = "[";
    for (size_t i = 0; i < names.size(); i++) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out + "]";
}

Result<GridGeometry> GridLayout::layout(const Grouping& grouping) const {
    // Phase 1: Merge planning
    auto mergeResult = planMerge(grouping);
    if (!mergeResult) {
        return Err<GridGeometry>("GridLayout: invalid merge sections", mergeResult);
    }
    const MergePlan merge = *mergeResult;

    // Phase 2: Page sizing
    GridGeometry geometry;
    sizePage(grouping, merge, geometry);

    // Phase 3 + 4: Sections and cards
    Cursor cursor;
    geometry.sections.reserve(grouping.sections.size());
    for (size_t i = 0; i < grouping.sections.size(); i++) {
        SectionGeometry sectionGeometry;
        bool merged = merge.contains(i);
        cursor = placeSection(grouping.sections[i], merged, merged && i == merge.last,
                              cursor, geometry.drawArea.width, sectionGeometry);
        geometry.sections.push_back(std::move(sectionGeometry));
    }

    if (const auto* keyed = std::get_if<KeyedColor>(&_params.labelColor)) {
        for (const auto& [name, color] : keyed->colors) {
            if (!grouping.findSection(name)) {
                ywarn("GridLayout: colour for '{}' matches no section", name);
            }
        }
    }

    yinfo("GridLayout: {} sections, {} rows, {} heads, page {}x{}",
          geometry.sections.size(), geometry.totalRows, geometry.headCount,
          geometry.pageWidth, geometry.pageHeight);
    return Ok(std::move(geometry));
}

//=============================================================================
// Phase 1: Merge planning
//=============================================================================
Result<GridLayout::MergePlan> GridLayout::planMerge(const Grouping& grouping) const {
    MergePlan plan;
    const auto& wanted = _params.mergeSections;
    if (wanted.empty()) {
        return Ok(plan);
    }

    std::unordered_set<std::string> wantedSet(wanted.begin(), wanted.end());
    uint32_t mergedElements = 0;
    std::vector<std::string> found;
    std::vector<size_t> foundIndex;
    for (size_t i = 0; i < grouping.sections.size(); i++) {
        const auto& section = grouping.sections[i];
        if (wantedSet.count(section.name)) {
            mergedElements += section.elementCount;
            found.push_back(section.name);
            foundIndex.push_back(i);
        }
    }

    if (mergedElements > _params.elementsPerRow) {
        return Err<MergePlan>("sections to merge must fit onto a single row: " +
                              joinNames(wanted) + " have " + std::to_string(mergedElements) +
                              " elements, but elements per row is " +
                              std::to_string(_params.elementsPerRow),
                              ErrorCode::MergeOverflow);
    }
    if (found != wanted) {
        return Err<MergePlan>("sections to merge must be supplied in the order they appear "
                              "in the data: expected " + joinNames(wanted) +
                              ", found " + joinNames(found),
                              ErrorCode::MergeOrderMismatch);
    }
    if (foundIndex.back() - foundIndex.front() + 1 != foundIndex.size()) {
        return Err<MergePlan>("sections to merge must be adjacent: " + joinNames(wanted),
                              ErrorCode::MergeOrderMismatch);
    }

    plan.first = foundIndex.front();
    plan.last = foundIndex.back();
    plan.active = true;
    return Ok(plan);
}

//=============================================================================
// Phase 2: Page sizing
//=============================================================================
void GridLayout::sizePage(const Grouping& grouping, const MergePlan& merge,
                          GridGeometry& geometry) const {
    uint32_t totalRows = 0;
    for (const auto& section : grouping.sections) {
        totalRows += section.rowCount;
    }
    uint32_t headCount = static_cast<uint32_t>(grouping.sections.size());

    if (merge.active) {
        uint32_t mergedRows = 0;
        uint32_t mergedElements = 0;
        for (size_t i = merge.first; i <= merge.last; i++) {
            mergedRows += grouping.sections[i].rowCount;
            mergedElements += grouping.sections[i].elementCount;
        }
        totalRows = totalRows - mergedRows + regularRowCount(mergedElements, _params.elementsPerRow);
        headCount = headCount - static_cast<uint32_t>(merge.last - merge.first + 1) + 1;
    }

    const auto& margin = _params.pageMargin;
    float drawWidth = _params.pageWidth - margin.left - margin.right;
    float drawHeight = totalRows * _params.cardHeight;
    if (_params.orientation == HeadOrientation::Top) {
        drawHeight += headCount * _params.headSize;
    }

    geometry.totalRows = totalRows;
    geometry.headCount = headCount;
    geometry.drawArea = Rect{margin.left, margin.top, drawWidth, drawHeight};
    geometry.pageWidth = _params.pageWidth;
    geometry.pageHeight = drawHeight + margin.top + margin.bottom;
}

//=============================================================================
// Phase 3: Section placement
//=============================================================================
GridLayout::Cursor GridLayout::placeSection(const Section& section, bool merged, bool lastMerged,
                                            Cursor cursor, float drawWidth,
                                            SectionGeometry& out) const {
    const bool left = _params.orientation == HeadOrientation::Left;
    const float leftHeadWidth = left ? _params.headSize : 0.0f;
    const float topHeadHeight = left ? 0.0f : _params.headSize;
    const float bodyHeight = section.rowCount * _params.cardHeight;
    const float bodyWidth = drawWidth - leftHeadWidth;

    out.name = section.name;
    out.elementCount = section.elementCount;
    out.rowCount = section.rowCount;
    out.merged = merged;

    // Left heads span the body height; top heads span the drawing width
    // from the cursor onwards
    float headExtent = left ? _params.headSize : drawWidth;
    out.head = Rect{cursor.x, cursor.y, headExtent - cursor.x, left ? bodyHeight : topHeadHeight};
    out.label = labelPosition(out.head);
    out.labelText = _params.showTotals
        ? section.name + ": " + std::to_string(section.elementCount)
        : section.name;
    out.labelColor = resolveColor(_params.labelColor, section.name);

    out.cardWidth = bodyWidth / _params.elementsPerRow;
    const Cursor origin{cursor.x + leftHeadWidth, cursor.y + topHeadHeight};
    out.body = Rect{origin.x, origin.y,
                    merged ? section.elementCount * out.cardWidth : bodyWidth,
                    bodyHeight};

    // Phase 4: Card flow
    Flow flow;
    flow.originX = origin.x;
    flow.cardWidth = out.cardWidth;
    flow.cardHeight = _params.cardHeight;
    flow.perRow = _params.elementsPerRow;
    flow.offset = _params.flow == FlowMode::Offset && _params.elementsPerRow >= 2;
    if (flow.offset) {
        flow.boundaries = offsetRowBoundaries(section.elementCount, _params.elementsPerRow);
    }

    Cursor card = origin;
    uint32_t row = 0;
    out.cards.reserve(section.elementCount);
    for (uint32_t i = 0; i < section.elementCount; i++) {
        out.cards.push_back(CardSlot{
            Rect{card.x, card.y, out.cardWidth, _params.cardHeight},
            section.firstElement + i,
            row});
        bool wrapped = false;
        card = nextCard(card, flow, i + 1, wrapped);
        if (wrapped) row++;
    }

    ydebug("GridLayout: section '{}' head=({},{} {}x{}) body=({},{} {}x{}) cards={} rows={}",
           section.name, out.head.x, out.head.y, out.head.width, out.head.height,
           out.body.x, out.body.y, out.body.width, out.body.height,
           section.elementCount, section.rowCount);

    // Merged sections share one row: roll back to the row's top and continue
    // to the right, except the last one which closes the row.
    if (merged && !lastMerged) {
        return Cursor{origin.x + section.elementCount * out.cardWidth, cursor.y};
    }
    return Cursor{0.0f, cursor.y + topHeadHeight + bodyHeight};
}

Point GridLayout::labelPosition(const Rect& head) const {
    const auto& pad = _params.headPadding;
    float x = head.x + pad.left;
    switch (_params.labelAlign) {
        case VerticalAlign::Top:
            return Point{x, head.y + pad.top + _params.labelTextSize};
        case VerticalAlign::Center:
            return Point{x, head.y + pad.top + (head.height + _params.labelTextSize) / 2 - pad.bottom};
        case VerticalAlign::Bottom:
            return Point{x, head.y + head.height - pad.bottom};
    }
    return Point{x, head.y};
}

//=============================================================================
// Phase 4: Card flow
//=============================================================================
GridLayout::Cursor GridLayout::nextCard(const Cursor& current, const Flow& flow,
                                        uint32_t placed, bool& wrapped) {
    wrapped = false;
    if (flow.offset) {
        auto it = std::find(flow.boundaries.begin(), flow.boundaries.end(), placed);
        if (it != flow.boundaries.end()) {
            wrapped = true;
            auto rowIndex = static_cast<size_t>(it - flow.boundaries.begin());
            // A full row is followed by a shifted short row and vice versa
            float x = rowIndex % 2 != 0 ? flow.originX : flow.originX + flow.cardWidth / 2;
            return Cursor{x, current.y + flow.cardHeight};
        }
        return Cursor{current.x + flow.cardWidth, current.y};
    }

    if (placed % flow.perRow == 0) {
        wrapped = true;
        return Cursor{flow.originX, current.y + flow.cardHeight};
    }
    return Cursor{current.x + flow.cardWidth, current.y};
}

} // namespace cardgrid::grid
