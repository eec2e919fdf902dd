#include "grouper.h"
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <numeric>
#include <unordered_map>
#include <unordered_set>

namespace cardgrid::grid {

namespace {

struct SectionTally {
    std::string name;
    uint32_t count = 0;
    size_t firstRow = 0;              // smallest rowIndex seen
};

std::string joinQuoted(const std::vector<std::string>& names) {
    std::string out = "[";
    for (size_t i = 0; i < names.size(); i++) {
        if (i > 0) out += ", ";
        out += "'" + names[i] + "'";
    }
    return out + "]";
}

// Explicit order must list every section exactly once
Result<void> checkExplicitOrder(const std::vector<SectionTally>& tallies,
                                const std::vector<std::string>& order) {
    std::unordered_set<std::string> inData;
    for (const auto& t : tallies) inData.insert(t.name);

    std::unordered_set<std::string> inPolicy;
    std::vector<std::string> duplicated;
    std::vector<std::string> missingFromData;
    for (const auto& name : order) {
        if (!inPolicy.insert(name).second) {
            duplicated.push_back(name);
        } else if (!inData.count(name)) {
            missingFromData.push_back(name);
        }
    }

    std::vector<std::string> missingFromPolicy;
    for (const auto& t : tallies) {
        if (!inPolicy.count(t.name)) missingFromPolicy.push_back(t.name);
    }

    if (missingFromPolicy.empty() && missingFromData.empty() && duplicated.empty()) {
        return Ok();
    }

    std::string message = "section order does not match the data:";
    if (!missingFromPolicy.empty()) {
        message += " sections not in order list " + joinQuoted(missingFromPolicy) + ";";
    }
    if (!missingFromData.empty()) {
        message += " order entries not in data " + joinQuoted(missingFromData) + ";";
    }
    if (!duplicated.empty()) {
        message += " order entries listed more than once " + joinQuoted(duplicated) + ";";
    }
    message.pop_back();
    return Err<void>(message, ErrorCode::SectionOrderMismatch);
}

} // namespace

Result<Grouping> groupRecords(const std::vector<Record>& records,
                              const SectionOrder& order,
                              SectionKeyFn sectionKey) {
    // Tally sections and remember each record's key
    std::vector<SectionTally> tallies;
    std::unordered_map<std::string, size_t> tallyIndex;
    std::vector<size_t> recordSection(records.size());

    for (size_t i = 0; i < records.size(); i++) {
        const auto& record = records[i];
        auto key = sectionKey ? sectionKey(record) : record.sectionKey;
        if (!key) {
            return Err<Grouping>("record at row " + std::to_string(record.rowIndex) +
                                 " ('" + record.title + "') has no section key",
                                 ErrorCode::MissingSectionKey);
        }
        auto [it, inserted] = tallyIndex.try_emplace(*key, tallies.size());
        if (inserted) {
            tallies.push_back(SectionTally{*key, 0, record.rowIndex});
        }
        auto& tally = tallies[it->second];
        tally.count++;
        tally.firstRow = std::min(tally.firstRow, record.rowIndex);
        recordSection[i] = it->second;
    }

    // First-appearance order is the base every policy sorts stably from
    std::vector<size_t> sectionOrder(tallies.size());
    std::iota(sectionOrder.begin(), sectionOrder.end(), 0);
    std::stable_sort(sectionOrder.begin(), sectionOrder.end(), [&](size_t a, size_t b) {
        return tallies[a].firstRow < tallies[b].firstRow;
    });

    bool ascending = order.direction == SortDirection::Ascending;
    switch (order.kind) {
        case SectionOrder::Kind::Name:
            std::stable_sort(sectionOrder.begin(), sectionOrder.end(), [&](size_t a, size_t b) {
                return ascending ? tallies[a].name < tallies[b].name
                                 : tallies[b].name < tallies[a].name;
            });
            break;
        case SectionOrder::Kind::Count:
            std::stable_sort(sectionOrder.begin(), sectionOrder.end(), [&](size_t a, size_t b) {
                return ascending ? tallies[a].count < tallies[b].count
                                 : tallies[b].count < tallies[a].count;
            });
            break;
        case SectionOrder::Kind::Explicit: {
            if (auto res = checkExplicitOrder(tallies, order.names); !res) {
                return Err<Grouping>("grouping failed", res);
            }
            sectionOrder.clear();
            for (const auto& name : order.names) {
                sectionOrder.push_back(tallyIndex.at(name));
            }
            break;
        }
    }

    std::vector<size_t> rank(tallies.size());
    for (size_t r = 0; r < sectionOrder.size(); r++) {
        rank[sectionOrder[r]] = r;
    }

    // Elements: primary = section rank, secondary = input row
    std::vector<size_t> elementOrder(records.size());
    std::iota(elementOrder.begin(), elementOrder.end(), 0);
    std::stable_sort(elementOrder.begin(), elementOrder.end(), [&](size_t a, size_t b) {
        size_t ra = rank[recordSection[a]];
        size_t rb = rank[recordSection[b]];
        if (ra != rb) return ra < rb;
        return records[a].rowIndex < records[b].rowIndex;
    });

    Grouping grouping;
    grouping.elements.reserve(records.size());
    for (size_t i : elementOrder) {
        Record element = records[i];
        element.sectionKey = tallies[recordSection[i]].name;
        grouping.elements.push_back(std::move(element));
    }

    size_t first = 0;
    for (size_t t : sectionOrder) {
        Section section;
        section.name = tallies[t].name;
        section.elementCount = tallies[t].count;
        section.firstElement = first;
        first += section.elementCount;
        grouping.sections.push_back(std::move(section));
    }

    yinfo("groupRecords: {} records in {} sections", records.size(), grouping.sections.size());
    return Ok(std::move(grouping));
}

} // namespace cardgrid::grid
