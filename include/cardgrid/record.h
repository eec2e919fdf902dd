#pragma once

#include <cardgrid/result.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cardgrid {

//=============================================================================
// Record - one input row
//
// The four semantic fields are extracted from the row by column mapping;
// every other column is kept verbatim in `fields`.
//=============================================================================
struct Record {
    std::optional<std::string> sectionKey;   // nullopt = missing (rejected by the grouper)
    std::string title;
    std::string subtitle;
    std::optional<std::string> imagePath;    // nullopt = no image available
    std::map<std::string, std::string> fields;
    size_t rowIndex = 0;                      // position in the input table
};

//=============================================================================
// InputColumns - which row columns feed the semantic fields
//=============================================================================
struct InputColumns {
    std::string section = "section";
    std::string title = "title";
    std::string subtitle = "subtitle";
    std::string image = "image";
};

// Parse a YAML sequence of row maps into records. Row indices follow
// document order.
Result<std::vector<Record>> parseRecords(const std::string& yaml,
                                         const InputColumns& columns);

// Load and parse a YAML record file
Result<std::vector<Record>> loadRecords(const std::string& path,
                                        const InputColumns& columns);

} // namespace cardgrid
