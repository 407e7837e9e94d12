/**
 * Genotype Decoding
 *
 * Turns raw per-sample genotype fields into allele calls and resolves
 * them against the site's [REF, ALT1, ALT2, ...] allele list.
 */

#ifndef SNPEFFR_GENOTYPE_DECODER_HPP
#define SNPEFFR_GENOTYPE_DECODER_HPP

#include "snpeffr.hpp"
#include "annotation_parser.hpp"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

namespace snpeffr {

/**
 * Kind of allele a sample carries at a site
 */
enum class GenotypeKind {
    NO_CALL,        // Missing, empty or unparseable genotype
    REFERENCE,      // GT code 0
    ALTERNATE       // GT code n > 0, alt_index == n
};

/**
 * Decoded genotype call
 */
struct GenotypeCall {
    GenotypeKind kind = GenotypeKind::NO_CALL;
    int alt_index = 0;  // 1-based ALT index, only meaningful for ALTERNATE

    static GenotypeCall no_call() { return GenotypeCall(); }
    static GenotypeCall reference() { return GenotypeCall{GenotypeKind::REFERENCE, 0}; }
    static GenotypeCall alternate(int index) { return GenotypeCall{GenotypeKind::ALTERNATE, index}; }

    bool is_no_call() const { return kind == GenotypeKind::NO_CALL; }

    bool operator==(const GenotypeCall& other) const {
        return kind == other.kind && alt_index == other.alt_index;
    }
    bool operator!=(const GenotypeCall& other) const { return !(*this == other); }
};

/**
 * Decode a raw sample field (e.g. "1:35,2:40"). The allele code is the
 * token before the first '.', '|' or ':'; an empty or non-numeric token
 * (".", "./.", "0/1") is a no-call.
 */
GenotypeCall decode_genotype(const std::string& raw);

/**
 * Ordered allele list of one site: REF followed by the split ALT alleles
 */
class AlleleTable {
public:
    AlleleTable(const std::string& ref, const std::string& alt);

    /**
     * Sequence for a call; std::nullopt for no-calls and for ALT indices
     * beyond the listed alternates
     */
    std::optional<std::string> resolve(const GenotypeCall& call) const;

    const std::string& reference() const { return ref_; }
    const std::vector<std::string>& alternates() const { return alts_; }

private:
    std::string ref_;
    std::vector<std::string> alts_;
};

/**
 * One sample's decoded call at one site
 */
struct SampleCall {
    std::string sample_id;
    GenotypeCall call;
    std::optional<std::string> sequence;    // Resolved allele; empty for no-calls
};

/**
 * Decoded calls of every annotated site, keyed by row id. Each vector
 * follows the table's sample order.
 */
using SampleCallTable = std::unordered_map<size_t, std::vector<SampleCall>>;

/**
 * Decode and resolve every sample of every annotated site
 * @param no_calls Optional counter of unresolved calls
 */
SampleCallTable decode_samples(const std::vector<AnnotatedSite>& sites,
                               const std::vector<std::string>& sample_names,
                               size_t* no_calls = nullptr);

} // namespace snpeffr

#endif // SNPEFFR_GENOTYPE_DECODER_HPP
