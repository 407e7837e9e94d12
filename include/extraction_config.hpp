/**
 * Extraction Configuration
 *
 * Regions, genes and excluded effects for a pipeline run, with parsers
 * for the command-line and file forms of each.
 */

#ifndef SNPEFFR_EXTRACTION_CONFIG_HPP
#define SNPEFFR_EXTRACTION_CONFIG_HPP

#include "snpeffr.hpp"
#include "position_filter.hpp"
#include <string>
#include <vector>
#include <set>

namespace snpeffr {

/**
 * Default gene of interest (fks1 in Candida auris B11221)
 */
constexpr const char* DEFAULT_GENE = "CAB11_002014";

/**
 * Default exclusion pattern for SnpEff effects
 */
constexpr const char* DEFAULT_EXCLUDE_EFFECTS = "synonymous_variant";

/**
 * Pipeline configuration
 */
struct ExtractionConfig {
    std::vector<Region> regions = default_regions();    // Order sets the overlap tie-break
    std::set<std::string> genes = {DEFAULT_GENE};       // Matched against ANN Gene_ID
    std::string exclude_effects = DEFAULT_EXCLUDE_EFFECTS;  // ECMAScript regex; empty excludes nothing
    bool use_index = false;                             // Tabix fetch of region positions

    /**
     * Check the configuration
     * @throws ConfigError on empty region names or an invalid exclusion pattern
     */
    void validate() const;
};

/**
 * Parse a region specification: NAME=START-END[,POS|START-END...]
 * Example: "fks1_hs1=221638-221665"
 * @throws ConfigError on malformed input or reversed ranges
 */
Region parse_region_spec(const std::string& spec);

/**
 * Load regions from a tab-delimited file. Each line is
 * "name<TAB>start<TAB>end" or "name<TAB>pos"; lines sharing a name are
 * merged into one region at the position of its first line.
 * @throws ConfigError if the file cannot be read or a line is malformed
 */
std::vector<Region> load_region_file(const std::string& filepath);

/**
 * Parse a comma-separated gene list, trimming whitespace
 */
std::set<std::string> parse_gene_list(const std::string& list_str);

/**
 * Load gene list from file (one per line, first tab-delimited column)
 * @throws ConfigError if the file cannot be read
 */
std::set<std::string> load_gene_list(const std::string& filepath);

} // namespace snpeffr

#endif // SNPEFFR_EXTRACTION_CONFIG_HPP
