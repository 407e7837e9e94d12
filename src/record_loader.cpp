/**
 * Record Loader - VCF parsing and htslib-backed file access
 */

#include "record_loader.hpp"
#include <sstream>
#include <algorithm>
#include <cstdlib>

#include <htslib/hts.h>
#include <htslib/kstring.h>
#include <htslib/tbx.h>

namespace snpeffr {

// ============================================================================
// Line-level parsing
// ============================================================================

std::vector<std::string> parse_vcf_header(const std::string& line) {
    std::vector<std::string> columns = split(line, '\t');

    if (columns.size() < VCF_FIXED_COLUMN_COUNT) {
        throw InputFormatError("VCF header has " + std::to_string(columns.size()) +
                               " columns, expected at least " +
                               std::to_string(VCF_FIXED_COLUMN_COUNT));
    }

    for (size_t i = 0; i < VCF_FIXED_COLUMN_COUNT; ++i) {
        if (columns[i] != VCF_FIXED_COLUMNS[i]) {
            throw InputFormatError("VCF header column " + std::to_string(i + 1) +
                                   " is '" + columns[i] + "', expected '" +
                                   VCF_FIXED_COLUMNS[i] + "'");
        }
    }

    std::vector<std::string> samples;
    if (columns.size() > VCF_FIXED_COLUMN_COUNT) {
        if (columns[VCF_FIXED_COLUMN_COUNT] != "FORMAT") {
            throw InputFormatError("VCF header column 9 is '" + columns[VCF_FIXED_COLUMN_COUNT] +
                                   "', expected 'FORMAT'");
        }
        samples.assign(columns.begin() + VCF_FIXED_COLUMN_COUNT + 1, columns.end());
    }
    return samples;
}

VariantRecord parse_vcf_record(const std::string& line,
                               size_t sample_count,
                               bool has_format,
                               size_t line_number) {
    std::vector<std::string> fields = split(line, '\t');
    size_t expected = VCF_FIXED_COLUMN_COUNT + (has_format ? 1 + sample_count : 0);

    if (fields.size() != expected) {
        throw InputFormatError("Line " + std::to_string(line_number) + ": expected " +
                               std::to_string(expected) + " columns, found " +
                               std::to_string(fields.size()));
    }

    VariantRecord record;
    record.chrom = fields[0];

    size_t consumed = 0;
    try {
        record.pos = std::stoi(fields[1], &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (fields[1].empty() || consumed != fields[1].size()) {
        throw InputFormatError("Line " + std::to_string(line_number) +
                               ": POS is not an integer: '" + fields[1] + "'");
    }

    record.id = fields[2];
    record.ref = fields[3];
    record.alt = fields[4];
    record.qual = fields[5];
    record.filter = fields[6];
    record.info = fields[7];

    if (has_format) {
        record.format = fields[8];
        record.genotypes.assign(fields.begin() + VCF_FIXED_COLUMN_COUNT + 1, fields.end());
    }

    return record;
}

std::vector<std::pair<int, int>> position_ranges(std::vector<int> positions) {
    std::vector<std::pair<int, int>> ranges;
    std::sort(positions.begin(), positions.end());
    positions.erase(std::unique(positions.begin(), positions.end()), positions.end());

    for (int pos : positions) {
        if (!ranges.empty() && ranges.back().second + 1 == pos) {
            ranges.back().second = pos;
        } else {
            ranges.emplace_back(pos, pos);
        }
    }
    return ranges;
}

namespace {

/**
 * Accumulates VCF lines into a VariantTable, tracking header state
 */
class TableBuilder {
public:
    explicit TableBuilder(const std::string& source) : source_(source) {}

    /**
     * Feed one line; meta lines are skipped, the #CHROM line sets the layout
     */
    void add_line(std::string line) {
        ++line_number_;
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }
        if (line.empty()) return;

        if (line.compare(0, 2, "##") == 0) return;

        if (line[0] == '#') {
            if (has_header_) {
                throw InputFormatError(source_ + ": duplicate #CHROM header at line " +
                                       std::to_string(line_number_));
            }
            table_.sample_names = parse_vcf_header(line);
            has_format_ = split(line, '\t').size() > VCF_FIXED_COLUMN_COUNT;
            has_header_ = true;
            return;
        }

        add_record(line);
    }

    void add_record(const std::string& line) {
        require_header();
        table_.records.push_back(
            parse_vcf_record(line, table_.sample_names.size(), has_format_, line_number_));
    }

    /**
     * Add a data line only if its POS lies in [first, last]
     */
    void add_record_in_range(const std::string& line, int first, int last) {
        ++line_number_;
        if (line.empty() || line[0] == '#') return;
        require_header();
        VariantRecord record =
            parse_vcf_record(line, table_.sample_names.size(), has_format_, line_number_);
        if (record.pos >= first && record.pos <= last) {
            table_.records.push_back(std::move(record));
        }
    }

    void require_header() const {
        if (!has_header_) {
            throw InputFormatError(source_ + ": missing #CHROM header line");
        }
    }

    VariantTable finish() {
        require_header();
        return std::move(table_);
    }

private:
    std::string source_;
    VariantTable table_;
    bool has_header_ = false;
    bool has_format_ = false;
    size_t line_number_ = 0;
};

} // namespace

// ============================================================================
// VcfFileSource
// ============================================================================

struct VcfFileSource::Impl {
    htsFile* fp = nullptr;
    tbx_t* tbx = nullptr;

    ~Impl() { close(); }

    void open(const std::string& path) {
        close();
        fp = hts_open(path.c_str(), "r");
        if (!fp) {
            throw InputFormatError("Cannot open VCF file: " + path);
        }
    }

    void close() {
        if (tbx) {
            tbx_destroy(tbx);
            tbx = nullptr;
        }
        if (fp) {
            hts_close(fp);
            fp = nullptr;
        }
    }
};

VcfFileSource::VcfFileSource(const std::string& path, bool use_index)
    : pimpl_(std::make_unique<Impl>()), path_(path), use_index_(use_index) {}

VcfFileSource::~VcfFileSource() = default;

VariantTable VcfFileSource::load() {
    log(LogLevel::INFO, "Loading VCF file: " + path_);

    pimpl_->open(path_);
    TableBuilder builder(path_);

    kstring_t str = {0, 0, nullptr};
    int ret;
    while ((ret = hts_getline(pimpl_->fp, KS_SEP_LINE, &str)) >= 0) {
        try {
            builder.add_line(std::string(str.s, str.l));
        } catch (...) {
            free(str.s);
            pimpl_->close();
            throw;
        }
    }
    free(str.s);
    pimpl_->close();

    if (ret < -1) {
        throw InputFormatError("Error reading VCF file: " + path_);
    }

    VariantTable table = builder.finish();
    log(LogLevel::INFO, "Loaded " + std::to_string(table.size()) + " records and " +
        std::to_string(table.sample_names.size()) + " samples from " + path_);
    return table;
}

VariantTable VcfFileSource::load_positions(const std::vector<int>& positions) {
    if (!use_index_) {
        return load();
    }

    pimpl_->open(path_);
    pimpl_->tbx = tbx_index_load(path_.c_str());
    if (!pimpl_->tbx) {
        log(LogLevel::WARNING, "No tabix index for " + path_ + ", reading the whole file");
        pimpl_->close();
        return load();
    }

    log(LogLevel::INFO, "Loading indexed VCF file: " + path_);

    TableBuilder builder(path_);
    kstring_t str = {0, 0, nullptr};

    try {
        // Header lines come first; stop at the first data line, the
        // iterators below seek to the requested ranges themselves.
        while (hts_getline(pimpl_->fp, KS_SEP_LINE, &str) >= 0) {
            if (str.l > 0 && str.s[0] != '#') break;
            builder.add_line(std::string(str.s, str.l));
        }
        builder.require_header();

        std::vector<std::pair<int, int>> ranges = position_ranges(positions);

        int n_contigs = 0;
        std::unique_ptr<const char*, decltype(&free)> contigs(
            tbx_seqnames(pimpl_->tbx, &n_contigs), &free);

        for (int c = 0; c < n_contigs; ++c) {
            std::string contig = contigs.get()[c];
            for (const auto& range : ranges) {
                // Build region string: contig:start-end
                std::string region = contig + ":" + std::to_string(range.first) + "-" +
                                     std::to_string(range.second);
                std::unique_ptr<hts_itr_t, decltype(&hts_itr_destroy)> itr(
                    tbx_itr_querys(pimpl_->tbx, region.c_str()), &hts_itr_destroy);
                if (!itr) continue;

                while (tbx_itr_next(pimpl_->fp, pimpl_->tbx, itr.get(), &str) >= 0) {
                    // Overlap queries also return deletions starting upstream
                    builder.add_record_in_range(std::string(str.s, str.l),
                                                range.first, range.second);
                }
            }
        }
    } catch (...) {
        free(str.s);
        pimpl_->close();
        throw;
    }
    free(str.s);
    pimpl_->close();

    VariantTable table = builder.finish();
    log(LogLevel::INFO, "Fetched " + std::to_string(table.size()) + " records in " +
        std::to_string(position_ranges(positions).size()) + " ranges from " + path_);
    return table;
}

// ============================================================================
// TextRecordSource
// ============================================================================

VariantTable TextRecordSource::load() {
    TableBuilder builder(label_);
    std::istringstream iss(text_);
    std::string line;
    while (std::getline(iss, line)) {
        builder.add_line(line);
    }
    return builder.finish();
}

} // namespace snpeffr
