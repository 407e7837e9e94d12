/**
 * Position Filter
 *
 * Named regions of interest and the position -> region lookup used to
 * restrict the variant table and to label result rows.
 */

#ifndef SNPEFFR_POSITION_FILTER_HPP
#define SNPEFFR_POSITION_FILTER_HPP

#include "snpeffr.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <utility>

namespace snpeffr {

/**
 * A caller-named set of genomic positions (e.g. a hotspot window)
 */
struct Region {
    std::string name;
    std::vector<int> positions;

    Region() = default;
    Region(std::string n, std::vector<int> p) : name(std::move(n)), positions(std::move(p)) {}

    /**
     * Region covering the inclusive range [start, end]
     */
    static Region range(const std::string& name, int start, int end);
};

/**
 * Inverse mapping position -> region name. When a position appears in
 * several regions, the region defined last wins.
 */
class RegionIndex {
public:
    RegionIndex() = default;
    explicit RegionIndex(const std::vector<Region>& regions);

    /**
     * Region name for a position, or nullptr if the position is not covered
     */
    const std::string* find(int pos) const;

    bool contains(int pos) const { return find(pos) != nullptr; }

    /**
     * Every covered position, unordered
     */
    std::vector<int> positions() const;

    size_t size() const { return region_of_.size(); }
    bool empty() const { return region_of_.empty(); }

private:
    std::unordered_map<int, std::string> region_of_;
};

/**
 * Keep only records whose POS is covered by the index. Sample names are
 * carried over unchanged; an empty result is a valid table.
 */
VariantTable filter_by_position(const VariantTable& table, const RegionIndex& index);

/**
 * The two fks1 hotspot windows used when the caller supplies no regions
 */
std::vector<Region> default_regions();

} // namespace snpeffr

#endif // SNPEFFR_POSITION_FILTER_HPP
