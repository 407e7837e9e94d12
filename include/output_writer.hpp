/**
 * Output Writer - Result Formatting and Multiple Output Format Support
 *
 * Projects long-form mutation calls onto the published column schema and
 * writes the table as TSV (default), CSV or JSON, optionally gzipped.
 */

#ifndef SNPEFFR_OUTPUT_WRITER_HPP
#define SNPEFFR_OUTPUT_WRITER_HPP

#include "snpeffr.hpp"
#include "mutation_extractor.hpp"
#include <string>
#include <vector>
#include <memory>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <cctype>
#include <zlib.h>

namespace snpeffr {

// ============================================================================
// Output formatting
// ============================================================================

/**
 * Project mutation calls onto the published schema:
 * sample_id, snpeff_gene_name (ANN Gene_ID), region, position,
 * mutation (HGVS.p), ref_sequence (REF), sample_sequence.
 * No rows are added or removed.
 */
inline ResultTable format_results(const std::vector<MutationCall>& calls) {
    ResultTable table;
    table.rows.reserve(calls.size());

    for (const auto& call : calls) {
        const AnnotationRow& ann = *call.annotation;

        ResultRow row;
        row.sample_id = call.sample_id;
        row.snpeff_gene_name = ann.entry.gene_id;
        row.region = call.region;
        row.position = ann.pos;
        row.mutation = ann.entry.hgvs_p;
        row.ref_sequence = ann.ref;
        row.sample_sequence = call.sample_sequence;
        table.rows.push_back(std::move(row));
    }

    return table;
}

// ============================================================================
// Output writers
// ============================================================================

/**
 * Output format types
 */
enum class OutputFormat {
    TSV,    // Tab-separated values (default)
    CSV,    // Comma-separated values, RFC 4180 quoting
    JSON    // Array of row objects
};

/**
 * Parse output format from string
 * @throws ConfigError for unknown formats
 */
inline OutputFormat parse_output_format(const std::string& format) {
    std::string lower = format;
    for (size_t i = 0; i < lower.size(); ++i) {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(lower[i])));
    }

    if (lower == "tsv") return OutputFormat::TSV;
    if (lower == "csv") return OutputFormat::CSV;
    if (lower == "json") return OutputFormat::JSON;
    throw ConfigError("Unknown output format: " + format);
}

/**
 * Render run statistics to match the output format: JSON for JSON
 * output, the plain-text report otherwise
 */
inline std::string format_stats(const ExtractionStats& stats, OutputFormat format) {
    if (format == OutputFormat::JSON) {
        return stats.to_json() + "\n";
    }
    return stats.to_string();
}

// Helper to check if path ends with .gz
inline bool ends_with_gz(const std::string& path) {
    return path.size() > 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

/**
 * Abstract base class for result writers. Owns the output sink:
 * stdout for "" / "-" / "STDOUT", gzip for .gz paths or when compress
 * is set, a plain file otherwise.
 */
class ResultWriter {
public:
    explicit ResultWriter(const std::string& output_path, bool compress = false)
        : output_path_(output_path), compress_(compress), gz_file_(nullptr),
          use_stdout_(output_path.empty() || output_path == "-" || output_path == "STDOUT") {

        if (use_stdout_) {
            compress_ = false;  // Cannot compress stdout
        } else if (compress_ || ends_with_gz(output_path_)) {
            compress_ = true;
            gz_file_ = gzopen(output_path_.c_str(), "wb");
            if (!gz_file_) {
                throw std::runtime_error("Cannot open output file: " + output_path_);
            }
        } else {
            output_.open(output_path_);
            if (!output_.is_open()) {
                throw std::runtime_error("Cannot open output file: " + output_path_);
            }
        }
    }

    virtual ~ResultWriter() {
        if (gz_file_) {
            gzclose(gz_file_);
        }
    }

    ResultWriter(const ResultWriter&) = delete;
    ResultWriter& operator=(const ResultWriter&) = delete;

    virtual void write_header() = 0;
    virtual void write_row(const ResultRow& row) = 0;
    virtual void write_footer() = 0;

    /**
     * Header, every row, footer. The header is written for empty tables too.
     */
    void write_table(const ResultTable& table) {
        write_header();
        for (const auto& row : table.rows) {
            write_row(row);
        }
        write_footer();
    }

    /**
     * Flush and release the sink
     * @throws std::runtime_error if buffered output cannot be written
     */
    void close() {
        if (gz_file_) {
            int rc = gzclose(gz_file_);
            gz_file_ = nullptr;
            if (rc != Z_OK) {
                throw std::runtime_error("Error closing gzip output: " + output_path_);
            }
        }
        if (output_.is_open()) {
            output_.close();
            if (output_.fail()) {
                throw std::runtime_error("Error writing output file: " + output_path_);
            }
        }
        if (use_stdout_) {
            std::cout.flush();
        }
    }

    int rows_written() const { return rows_written_; }

protected:
    int rows_written_ = 0;

    void write_string(const std::string& s) {
        if (use_stdout_) {
            std::cout << s;
        } else if (compress_ && gz_file_) {
            if (!s.empty() &&
                gzwrite(gz_file_, s.c_str(), static_cast<unsigned int>(s.size())) == 0) {
                throw std::runtime_error("Error writing gzip output: " + output_path_);
            }
        } else {
            output_ << s;
        }
    }

private:
    std::string output_path_;
    bool compress_;
    std::ofstream output_;
    gzFile gz_file_;
    bool use_stdout_;
};

/**
 * TSV result writer (default format)
 */
class TSVWriter : public ResultWriter {
public:
    using ResultWriter::ResultWriter;

    void write_header() override {
        write_string(join(ResultTable::columns(), "\t") + "\n");
    }

    void write_row(const ResultRow& row) override {
        write_string(join(ResultTable::values(row), "\t") + "\n");
        rows_written_++;
    }

    void write_footer() override {
        // TSV has no footer
    }
};

/**
 * CSV result writer
 */
class CSVWriter : public ResultWriter {
public:
    using ResultWriter::ResultWriter;

    void write_header() override {
        write_string(format_line(ResultTable::columns()));
    }

    void write_row(const ResultRow& row) override {
        write_string(format_line(ResultTable::values(row)));
        rows_written_++;
    }

    void write_footer() override {}

    /**
     * Quote a field if it contains a comma, quote or line break
     */
    static std::string escape_csv(const std::string& s) {
        if (s.find_first_of(",\"\r\n") == std::string::npos) return s;
        std::string result = "\"";
        for (char c : s) {
            if (c == '"') result += '"';
            result += c;
        }
        result += '"';
        return result;
    }

private:
    static std::string format_line(const std::vector<std::string>& values) {
        std::string line;
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) line += ',';
            line += escape_csv(values[i]);
        }
        return line + "\n";
    }
};

/**
 * JSON result writer - array of objects keyed by the published columns.
 * position is written as a number, every other value as a string.
 */
class JSONWriter : public ResultWriter {
public:
    using ResultWriter::ResultWriter;

    void write_header() override {
        write_string("[");
    }

    void write_row(const ResultRow& row) override {
        std::vector<std::string> columns = ResultTable::columns();
        std::vector<std::string> values = ResultTable::values(row);

        std::ostringstream json;
        json << (rows_written_ == 0 ? "\n" : ",\n") << "  {";
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) json << ", ";
            json << "\"" << columns[i] << "\": ";
            if (columns[i] == "position") {
                json << values[i];
            } else {
                json << "\"" << escape_json(values[i]) << "\"";
            }
        }
        json << "}";

        write_string(json.str());
        rows_written_++;
    }

    void write_footer() override {
        write_string(rows_written_ == 0 ? "]\n" : "\n]\n");
    }

    static std::string escape_json(const std::string& s) {
        std::string result;
        result.reserve(s.size());
        for (char c : s) {
            switch (c) {
                case '"': result += "\\\""; break;
                case '\\': result += "\\\\"; break;
                case '\b': result += "\\b"; break;
                case '\f': result += "\\f"; break;
                case '\n': result += "\\n"; break;
                case '\r': result += "\\r"; break;
                case '\t': result += "\\t"; break;
                default: result += c; break;
            }
        }
        return result;
    }
};

/**
 * Factory function to create a writer for the given format
 */
inline std::unique_ptr<ResultWriter> create_result_writer(
    const std::string& output_path,
    OutputFormat format,
    bool compress = false) {

    if (format == OutputFormat::JSON) {
        return std::make_unique<JSONWriter>(output_path, compress);
    } else if (format == OutputFormat::CSV) {
        return std::make_unique<CSVWriter>(output_path, compress);
    } else {
        return std::make_unique<TSVWriter>(output_path, compress);
    }
}

} // namespace snpeffr

#endif // SNPEFFR_OUTPUT_WRITER_HPP
