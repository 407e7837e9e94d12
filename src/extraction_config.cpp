/**
 * Extraction Configuration - region, gene list and pattern parsing
 */

#include "extraction_config.hpp"
#include <fstream>
#include <regex>
#include <map>

namespace snpeffr {

namespace {

int parse_position(const std::string& text, const std::string& context) {
    std::string s = trim(text);
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(s, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (s.empty() || consumed != s.size() || value <= 0) {
        throw ConfigError("Invalid position '" + text + "' in " + context);
    }
    return value;
}

void append_range(Region& region, int start, int end, const std::string& context) {
    if (end < start) {
        throw ConfigError("Reversed range " + std::to_string(start) + "-" +
                          std::to_string(end) + " in " + context);
    }
    // Break on end: pos + 1 overflows when end is INT_MAX
    for (int pos = start;; ++pos) {
        region.positions.push_back(pos);
        if (pos == end) break;
    }
}

} // namespace

void ExtractionConfig::validate() const {
    for (const auto& region : regions) {
        if (region.name.empty()) {
            throw ConfigError("Region with empty name");
        }
    }

    if (!exclude_effects.empty()) {
        try {
            std::regex re(exclude_effects);
        } catch (const std::regex_error& e) {
            throw ConfigError("Invalid exclude-effects pattern '" + exclude_effects +
                              "': " + e.what());
        }
    }
}

Region parse_region_spec(const std::string& spec) {
    size_t eq = spec.find('=');
    if (eq == std::string::npos) {
        throw ConfigError("Region must be NAME=START-END: " + spec);
    }

    Region region;
    region.name = trim(spec.substr(0, eq));
    if (region.name.empty()) {
        throw ConfigError("Region name is empty: " + spec);
    }

    std::string body = spec.substr(eq + 1);
    if (trim(body).empty()) {
        throw ConfigError("Region has no positions: " + spec);
    }

    for (const auto& item : split(body, ',')) {
        size_t dash = item.find('-');
        if (dash == std::string::npos) {
            region.positions.push_back(parse_position(item, spec));
        } else {
            int start = parse_position(item.substr(0, dash), spec);
            int end = parse_position(item.substr(dash + 1), spec);
            append_range(region, start, end, spec);
        }
    }

    return region;
}

std::vector<Region> load_region_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigError("Cannot open region file: " + filepath);
    }

    std::vector<Region> regions;
    std::map<std::string, size_t> slot;
    std::string line;
    size_t line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::string context = filepath + ":" + std::to_string(line_number);
        std::vector<std::string> cols = split(line, '\t');
        if (cols.size() < 2 || cols.size() > 3 || trim(cols[0]).empty()) {
            throw ConfigError("Expected name<TAB>start[<TAB>end] at " + context);
        }

        std::string name = trim(cols[0]);
        auto it = slot.find(name);
        if (it == slot.end()) {
            it = slot.emplace(name, regions.size()).first;
            regions.emplace_back(name, std::vector<int>());
        }
        Region& region = regions[it->second];

        int start = parse_position(cols[1], context);
        int end = cols.size() == 3 ? parse_position(cols[2], context) : start;
        append_range(region, start, end, context);
    }

    log(LogLevel::INFO, "Loaded " + std::to_string(regions.size()) + " regions from " + filepath);
    return regions;
}

std::set<std::string> parse_gene_list(const std::string& list_str) {
    std::set<std::string> result;
    for (const auto& item : split(list_str, ',')) {
        std::string gene = trim(item);
        if (!gene.empty()) {
            result.insert(gene);
        }
    }
    return result;
}

std::set<std::string> load_gene_list(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigError("Cannot open gene list: " + filepath);
    }

    std::set<std::string> genes;
    std::string line;
    while (std::getline(file, line)) {
        // Skip comments and empty lines
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Handle TSV format (take first column)
        size_t tab_pos = line.find('\t');
        if (tab_pos != std::string::npos) {
            line = trim(line.substr(0, tab_pos));
        }
        if (!line.empty()) {
            genes.insert(line);
        }
    }

    return genes;
}

} // namespace snpeffr
