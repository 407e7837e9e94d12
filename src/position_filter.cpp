/**
 * Position Filter - region index and record restriction
 */

#include "position_filter.hpp"

namespace snpeffr {

Region Region::range(const std::string& name, int start, int end) {
    Region region;
    region.name = name;
    if (end < start) return region;
    for (int pos = start;; ++pos) {
        region.positions.push_back(pos);
        if (pos == end) break;
    }
    return region;
}

RegionIndex::RegionIndex(const std::vector<Region>& regions) {
    for (const auto& region : regions) {
        for (int pos : region.positions) {
            region_of_[pos] = region.name;
        }
    }
}

const std::string* RegionIndex::find(int pos) const {
    auto it = region_of_.find(pos);
    if (it == region_of_.end()) return nullptr;
    return &it->second;
}

std::vector<int> RegionIndex::positions() const {
    std::vector<int> result;
    result.reserve(region_of_.size());
    for (const auto& entry : region_of_) {
        result.push_back(entry.first);
    }
    return result;
}

VariantTable filter_by_position(const VariantTable& table, const RegionIndex& index) {
    VariantTable result;
    result.sample_names = table.sample_names;

    for (const auto& record : table.records) {
        if (index.contains(record.pos)) {
            result.records.push_back(record);
        }
    }

    log(LogLevel::DEBUG, "Position filter kept " + std::to_string(result.size()) +
        " of " + std::to_string(table.size()) + " records");
    return result;
}

std::vector<Region> default_regions() {
    return {
        Region::range("fks1_hs1", 221638, 221665),
        Region::range("fks1_hs2", 223782, 223805)
    };
}

} // namespace snpeffr
