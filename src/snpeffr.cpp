/**
 * snpeffr - shared utilities: logging, string helpers, data model accessors
 */

#include "snpeffr.hpp"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace snpeffr {

// ============================================================================
// Logging
// ============================================================================

static LogLevel g_log_level = LogLevel::INFO;

void set_log_level(LogLevel level) {
    g_log_level = level;
}

LogLevel get_log_level() {
    return g_log_level;
}

void log(LogLevel level, const std::string& message) {
    if (level < g_log_level) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    const char* level_str;
    switch (level) {
        case LogLevel::DEBUG:   level_str = "DEBUG"; break;
        case LogLevel::INFO:    level_str = "INFO"; break;
        case LogLevel::WARNING: level_str = "WARNING"; break;
        case LogLevel::ERROR:   level_str = "ERROR"; break;
        default:                level_str = "UNKNOWN"; break;
    }

    std::cerr << std::put_time(std::localtime(&time_t_now), "%Y-%m-%d %H:%M:%S")
              << " - " << level_str << " - " << message << std::endl;
}

// ============================================================================
// String helpers
// ============================================================================

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (true) {
        size_t end = s.find(delim, start);
        if (end == std::string::npos) {
            tokens.push_back(s.substr(start));
            break;
        }
        tokens.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    return tokens;
}

std::string join(const std::vector<std::string>& tokens, const std::string& delim) {
    std::string result;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) result += delim;
        result += tokens[i];
    }
    return result;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// ============================================================================
// AnnotationEntry
// ============================================================================

std::string AnnotationEntry::err_warn_info() const {
    return join(overflow, "|");
}

const std::string& AnnotationEntry::field(const std::string& name) const {
    static const std::string empty;

    if (name == "allele") return allele;
    if (name == "effect") return effect;
    if (name == "putative_impact") return putative_impact;
    if (name == "gene_name") return gene_name;
    if (name == "gene_id") return gene_id;
    if (name == "feature_type") return feature_type;
    if (name == "feature_id") return feature_id;
    if (name == "transcript_biotype") return transcript_biotype;
    if (name == "rank_total") return rank_total;
    if (name == "HGVS.c") return hgvs_c;
    if (name == "HGVS.p") return hgvs_p;
    if (name == "cDNA_pos_len") return cdna_pos_len;
    if (name == "CDS_pos_len") return cds_pos_len;
    if (name == "protein_pos_len") return protein_pos_len;
    if (name == "distance") return distance;
    return empty;
}

// ============================================================================
// ResultTable
// ============================================================================

std::vector<std::string> ResultTable::values(const ResultRow& row) {
    return {
        row.sample_id,
        row.snpeff_gene_name,
        row.region,
        std::to_string(row.position),
        row.mutation,
        row.ref_sequence,
        row.sample_sequence
    };
}

} // namespace snpeffr
