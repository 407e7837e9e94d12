/**
 * Record Loader
 *
 * Record sources that turn VCF input into an in-memory VariantTable:
 * - VcfFileSource: plain / gzip / bgzip VCF files read through htslib,
 *   with optional tabix-indexed fetch of selected positions
 * - TextRecordSource: VCF text already held in memory
 */

#ifndef SNPEFFR_RECORD_LOADER_HPP
#define SNPEFFR_RECORD_LOADER_HPP

#include "snpeffr.hpp"
#include <string>
#include <vector>
#include <memory>
#include <utility>

namespace snpeffr {

/**
 * Abstract base class for record sources
 */
class RecordSource {
public:
    virtual ~RecordSource() = default;

    /**
     * Description of the source for log messages (usually the path)
     */
    virtual std::string name() const = 0;

    /**
     * Load every record
     * @throws InputFormatError if the source is unreadable or malformed
     */
    virtual VariantTable load() = 0;

    /**
     * Load records whose POS is in the given set. Sources without random
     * access may return more than requested; callers still apply the
     * position filter.
     */
    virtual VariantTable load_positions(const std::vector<int>& positions) {
        (void)positions;
        return load();
    }
};

// ============================================================================
// Line-level parsing
// ============================================================================

/**
 * Parse the #CHROM header line
 * @return Sample names (columns after FORMAT), possibly empty
 * @throws InputFormatError if the fixed columns are missing or misordered
 */
std::vector<std::string> parse_vcf_header(const std::string& line);

/**
 * Parse one VCF data line
 * @param line Tab-delimited data line
 * @param sample_count Number of sample columns declared in the header
 * @param has_format Whether the header declares a FORMAT column
 * @param line_number 1-based line number for error messages
 * @throws InputFormatError on a column-count mismatch or non-integer POS
 */
VariantRecord parse_vcf_record(const std::string& line,
                               size_t sample_count,
                               bool has_format,
                               size_t line_number);

/**
 * Collapse positions into sorted, non-overlapping inclusive ranges
 */
std::vector<std::pair<int, int>> position_ranges(std::vector<int> positions);

// ============================================================================
// Sources
// ============================================================================

/**
 * VCF file source backed by htslib. Handles uncompressed, gzip and
 * bgzip input transparently.
 */
class VcfFileSource : public RecordSource {
public:
    /**
     * @param path VCF path (.vcf, .vcf.gz)
     * @param use_index Use a tabix index (.tbi/.csi) in load_positions() when present
     */
    explicit VcfFileSource(const std::string& path, bool use_index = false);
    ~VcfFileSource() override;

    VcfFileSource(const VcfFileSource&) = delete;
    VcfFileSource& operator=(const VcfFileSource&) = delete;

    std::string name() const override { return path_; }

    VariantTable load() override;
    VariantTable load_positions(const std::vector<int>& positions) override;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
    std::string path_;
    bool use_index_;
};

/**
 * In-memory VCF text source
 */
class TextRecordSource : public RecordSource {
public:
    explicit TextRecordSource(std::string text, std::string label = "<memory>")
        : text_(std::move(text)), label_(std::move(label)) {}

    std::string name() const override { return label_; }

    VariantTable load() override;

private:
    std::string text_;
    std::string label_;
};

} // namespace snpeffr

#endif // SNPEFFR_RECORD_LOADER_HPP
