#pragma once

#include "grid-ir.h"
#include <cardgrid/layout-config.h>
#include <cardgrid/result.hpp>
#include <functional>
#include <optional>

namespace cardgrid::grid {

// Extracts the section key of a record; nullopt marks it missing
using SectionKeyFn = std::function<std::optional<std::string>(const Record&)>;

//=============================================================================
// groupRecords - partition records into ordered sections
//
// Sections are sorted by the order policy; ties (and the whole order for
// equal keys) fall back to first appearance, measured by Record::rowIndex so
// the result does not depend on the order the rows are supplied in.
// Elements are ordered by (section order, rowIndex).
//
// Errors: MissingSectionKey, SectionOrderMismatch.
// Row counts are left at zero; see planRows().
//=============================================================================
Result<Grouping> groupRecords(const std::vector<Record>& records,
                              const SectionOrder& order,
                              SectionKeyFn sectionKey = nullptr);

} // namespace cardgrid::grid
