#pragma once

#include <cardgrid/geometry.h>
#include <cardgrid/record.h>
#include <cstdint>
#include <string>
#include <vector>

namespace cardgrid::grid {

//=============================================================================
// Section - one group of records sharing a section key
//=============================================================================
struct Section {
    std::string name;
    uint32_t elementCount = 0;
    uint32_t rowCount = 0;            // filled by planRows()
    size_t firstElement = 0;          // index into Grouping::elements
};

//=============================================================================
// Grouping - records ordered by (section order, input row)
//
// Elements of one section are contiguous:
// elements[firstElement, firstElement + elementCount).
//=============================================================================
struct Grouping {
    std::vector<Record> elements;
    std::vector<Section> sections;

    const Section* findSection(const std::string& name) const {
        for (const auto& s : sections) {
            if (s.name == name) return &s;
        }
        return nullptr;
    }
};

//=============================================================================
// Layout results (filled by GridLayout)
//=============================================================================
struct CardSlot {
    Rect rect;
    size_t element = 0;               // index into Grouping::elements
    uint32_t row = 0;                 // row within the section body
};

struct SectionGeometry {
    std::string name;
    uint32_t elementCount = 0;
    uint32_t rowCount = 0;
    Rect head;
    Rect body;
    Point label;                      // head label anchor (start, alphabetic)
    std::string labelText;
    std::string labelColor;
    float cardWidth = 0;
    bool merged = false;              // member of the merge set
    std::vector<CardSlot> cards;
};

struct GridGeometry {
    float pageWidth = 0;
    float pageHeight = 0;
    Rect drawArea;                    // page coordinates
    uint32_t totalRows = 0;
    uint32_t headCount = 0;
    std::vector<SectionGeometry> sections;   // drawing-area coordinates
};

} // namespace cardgrid::grid
