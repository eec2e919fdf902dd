#pragma once

#include "grid-ir.h"
#include <cardgrid/layout-config.h>
#include <cstdint>
#include <vector>

namespace cardgrid::grid {

//=============================================================================
// Row planning
//
// All functions require perRow >= 1.
//
// Offset flow repeats a two-row cycle of 2N-1 cards: N on the first row,
// N-1 on the second. With N == 1 there is nothing to offset and the
// offset functions behave as Regular.
//=============================================================================

// ceil(elements / perRow)
uint32_t regularRowCount(uint32_t elements, uint32_t perRow);

uint32_t offsetRowCount(uint32_t elements, uint32_t perRow);

uint32_t rowCount(FlowMode mode, uint32_t elements, uint32_t perRow);

// Cumulative card count at the end of each offset row: N, 2N-1, 3N-1, 4N-2, ...
// Extended until the last term reaches `elements`; the first term is always N.
std::vector<uint32_t> offsetRowBoundaries(uint32_t elements, uint32_t perRow);

// Fill Section::rowCount for every section
void planRows(Grouping& grouping, FlowMode mode, uint32_t perRow);

} // namespace cardgrid::grid
