/**
 * snpeffr - Mutation call extraction from SnpEff-annotated VCF files
 *
 * Core data model shared by every pipeline stage: variant records as
 * loaded from the VCF, parsed SnpEff ANN entries, decoded sample calls
 * and the published result rows.
 */

#ifndef SNPEFFR_HPP
#define SNPEFFR_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include <cstddef>

namespace snpeffr {

// ============================================================================
// Errors
// ============================================================================

/**
 * Raised when a record source cannot be read or does not have the
 * expected VCF column layout. Fatal; no partial result is produced.
 */
class InputFormatError : public std::runtime_error {
public:
    explicit InputFormatError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Raised for invalid caller configuration (region specs, gene files,
 * exclusion patterns).
 */
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message)
        : std::invalid_argument(message) {}
};

// ============================================================================
// Variant records
// ============================================================================

/**
 * Fixed VCF columns preceding the FORMAT/sample columns
 */
constexpr const char* VCF_FIXED_COLUMNS[] = {
    "#CHROM", "POS", "ID", "REF", "ALT", "QUAL", "FILTER", "INFO"
};
constexpr size_t VCF_FIXED_COLUMN_COUNT = 8;

/**
 * One VCF data line (one genomic site)
 */
struct VariantRecord {
    std::string chrom;
    int pos = 0;
    std::string id;
    std::string ref;
    std::string alt;                        // Comma-delimited alternates
    std::string qual;
    std::string filter;
    std::string info;                       // May embed ANN=...
    std::string format;
    std::vector<std::string> genotypes;     // One raw field per sample
};

/**
 * In-memory VCF: ordered sample names plus one record per site
 */
struct VariantTable {
    std::vector<std::string> sample_names;
    std::vector<VariantRecord> records;

    size_t size() const { return records.size(); }
    bool empty() const { return records.empty(); }
};

// ============================================================================
// Annotations
// ============================================================================

/**
 * Number of named sub-fields in a SnpEff ANN entry
 */
constexpr size_t ANN_FIELD_COUNT = 15;

/**
 * SnpEff ANN sub-field names, in annotation order
 * See http://pcingola.github.io/SnpEff/se_inputoutput/
 */
constexpr const char* ANN_FIELD_NAMES[ANN_FIELD_COUNT] = {
    "allele", "effect", "putative_impact", "gene_name", "gene_id",
    "feature_type", "feature_id", "transcript_biotype", "rank_total",
    "HGVS.c", "HGVS.p", "cDNA_pos_len", "CDS_pos_len", "protein_pos_len",
    "distance"
};

/**
 * One parsed ANN entry. Sub-fields missing from a short entry are left
 * empty; tokens beyond the fifteenth are kept in overflow, in order.
 */
struct AnnotationEntry {
    std::string allele;
    std::string effect;
    std::string putative_impact;
    std::string gene_name;
    std::string gene_id;
    std::string feature_type;
    std::string feature_id;
    std::string transcript_biotype;
    std::string rank_total;
    std::string hgvs_c;
    std::string hgvs_p;
    std::string cdna_pos_len;
    std::string cds_pos_len;
    std::string protein_pos_len;
    std::string distance;

    std::vector<std::string> overflow;      // Errors / warnings / info
    size_t field_count = 0;                 // Sub-fields present in the source

    bool is_malformed() const { return field_count < ANN_FIELD_COUNT; }

    /**
     * Overflow tokens joined with '|' (the ERRORS / WARNINGS / INFO column)
     */
    std::string err_warn_info() const;

    /**
     * Access a sub-field by its schema name; empty for unknown names
     */
    const std::string& field(const std::string& name) const;
};

/**
 * Long-form annotation row: one ANN instance of one site. row_id is the
 * foreign key back to the originating annotated site.
 */
struct AnnotationRow {
    size_t row_id = 0;                      // 1-based, assigned per annotated site
    size_t instance = 0;                    // 1-based position within the ANN payload
    std::string chrom;
    int pos = 0;
    std::string ref;
    std::string alt;
    AnnotationEntry entry;
};

// ============================================================================
// Results
// ============================================================================

/**
 * Published output columns, in order
 */
constexpr size_t RESULT_COLUMN_COUNT = 7;
constexpr const char* RESULT_COLUMNS[RESULT_COLUMN_COUNT] = {
    "sample_id", "snpeff_gene_name", "region", "position", "mutation",
    "ref_sequence", "sample_sequence"
};

/**
 * One (sample, site, annotation) triple surviving every filter
 */
struct ResultRow {
    std::string sample_id;
    std::string snpeff_gene_name;
    std::string region;
    int position = 0;
    std::string mutation;                   // HGVS.p
    std::string ref_sequence;
    std::string sample_sequence;

    bool operator==(const ResultRow& other) const {
        return sample_id == other.sample_id &&
               snpeff_gene_name == other.snpeff_gene_name &&
               region == other.region &&
               position == other.position &&
               mutation == other.mutation &&
               ref_sequence == other.ref_sequence &&
               sample_sequence == other.sample_sequence;
    }
};

/**
 * Final table. The column list is fixed, so an empty table still carries
 * the full schema.
 */
struct ResultTable {
    std::vector<ResultRow> rows;

    static std::vector<std::string> columns() {
        return std::vector<std::string>(RESULT_COLUMNS, RESULT_COLUMNS + RESULT_COLUMN_COUNT);
    }

    /**
     * Row values rendered as strings, in column order
     */
    static std::vector<std::string> values(const ResultRow& row);

    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }
};

// ============================================================================
// Utilities
// ============================================================================

/**
 * Split on a single-character delimiter, keeping empty tokens.
 * An empty input yields one empty token.
 */
std::vector<std::string> split(const std::string& s, char delim);

/**
 * Join tokens with a delimiter
 */
std::string join(const std::vector<std::string>& tokens, const std::string& delim);

/**
 * Trim spaces, tabs and line endings from both ends
 */
std::string trim(const std::string& s);

/**
 * Logging utilities
 */
enum class LogLevel { DEBUG, INFO, WARNING, ERROR };
void set_log_level(LogLevel level);
LogLevel get_log_level();
void log(LogLevel level, const std::string& message);

} // namespace snpeffr

#endif // SNPEFFR_HPP
