#include "row-planner.h"

namespace cardgrid::grid {

uint32_t regularRowCount(uint32_t elements, uint32_t perRow) {
    return (elements + perRow - 1) / perRow;
}

uint32_t offsetRowCount(uint32_t elements, uint32_t perRow) {
    if (perRow < 2) {
        return regularRowCount(elements, perRow);
    }
    uint32_t cycle = 2 * perRow - 1;
    uint32_t fullCycles = elements / cycle;
    uint32_t remainder = elements - fullCycles * cycle;
    if (remainder == 0) {
        return 2 * fullCycles;
    }
    if (remainder <= perRow) {
        return 2 * fullCycles + 1;
    }
    return 2 * fullCycles + 2;
}

uint32_t rowCount(FlowMode mode, uint32_t elements, uint32_t perRow) {
    return mode == FlowMode::Offset ? offsetRowCount(elements, perRow)
                                    : regularRowCount(elements, perRow);
}

std::vector<uint32_t> offsetRowBoundaries(uint32_t elements, uint32_t perRow) {
    std::vector<uint32_t> boundaries{perRow};
    uint32_t shortRow = perRow > 1 ? perRow - 1 : perRow;
    bool nextIsShort = true;
    while (boundaries.back() < elements) {
        boundaries.push_back(boundaries.back() + (nextIsShort ? shortRow : perRow));
        nextIsShort = !nextIsShort;
    }
    return boundaries;
}

void planRows(Grouping& grouping, FlowMode mode, uint32_t perRow) {
    for (auto& section : grouping.sections) {
        section.rowCount = rowCount(mode, section.elementCount, perRow);
    }
}

} // namespace cardgrid::grid
