/**
 * Mutation Extraction Pipeline
 *
 * Joins decoded sample calls with parsed ANN rows, applies the effect /
 * gene / protein-change filters, reshapes to one row per sample and keeps
 * the samples that actually carry the annotated allele.
 *
 * Pipeline order:
 *   load -> position filter -> ANN split/parse -> genotype decode
 *        -> join & filter -> sample reshape -> allele match -> format
 */

#ifndef SNPEFFR_MUTATION_EXTRACTOR_HPP
#define SNPEFFR_MUTATION_EXTRACTOR_HPP

#include "snpeffr.hpp"
#include "annotation_parser.hpp"
#include "genotype_decoder.hpp"
#include "position_filter.hpp"
#include "extraction_config.hpp"
#include "record_loader.hpp"
#include <string>
#include <vector>
#include <set>
#include <regex>

namespace snpeffr {

/**
 * Per-run counters, one per pipeline stage
 */
struct ExtractionStats {
    size_t sites_loaded = 0;
    size_t sites_in_regions = 0;
    size_t annotated_sites = 0;
    size_t annotation_instances = 0;
    size_t malformed_annotations = 0;
    size_t unresolved_calls = 0;
    size_t annotations_passing = 0;
    size_t result_rows = 0;

    std::string to_string() const;
    std::string to_json() const;
};

/**
 * Annotation-level filter: HGVS.p present, effect not matching the
 * exclusion pattern, Gene_ID in the gene set. All three must hold.
 */
class EffectFilter {
public:
    /**
     * @throws ConfigError if the exclusion pattern is not a valid regex
     */
    EffectFilter(const std::set<std::string>& genes, const std::string& exclude_effects);

    bool accepts(const AnnotationEntry& entry) const;

    bool is_excluded_effect(const std::string& effect) const;

private:
    std::set<std::string> genes_;
    std::regex exclude_;
    bool has_exclusion_ = false;
};

/**
 * Long-form call: one sample carrying the allele of one annotation row
 */
struct MutationCall {
    std::string sample_id;
    std::string region;
    const AnnotationRow* annotation = nullptr;  // Owned by the caller's row vector
    std::string sample_sequence;
};

/**
 * Join calls to annotation rows by row id, filter, melt samples and keep
 * calls whose resolved sequence equals the annotation allele.
 * Output is ordered by sample (table order), then annotation row order.
 */
std::vector<MutationCall> join_and_reshape(const std::vector<AnnotationRow>& annotations,
                                           const SampleCallTable& calls,
                                           const std::vector<std::string>& sample_names,
                                           const EffectFilter& filter,
                                           const RegionIndex& regions,
                                           ExtractionStats* stats = nullptr);

/**
 * Run the pipeline on an already loaded table
 * @throws ConfigError on invalid configuration
 */
ResultTable extract_mutations(const VariantTable& table,
                              const ExtractionConfig& config,
                              ExtractionStats* stats = nullptr);

/**
 * Load from a record source and run the pipeline
 * @throws InputFormatError if the source cannot be read
 * @throws ConfigError on invalid configuration
 */
ResultTable extract_mutations(RecordSource& source,
                              const ExtractionConfig& config,
                              ExtractionStats* stats = nullptr);

} // namespace snpeffr

#endif // SNPEFFR_MUTATION_EXTRACTOR_HPP
