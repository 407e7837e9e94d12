/**
 * SnpEff ANN Parsing
 *
 * Splits the ANN INFO payload into per-allele annotation instances
 * (one long-form row per site and instance) and parses each instance
 * into the fifteen named SnpEff sub-fields plus trailing overflow.
 *
 * ANN format (one instance):
 *   Allele|Annotation|Annotation_Impact|Gene_Name|Gene_ID|Feature_Type|
 *   Feature_ID|Transcript_BioType|Rank|HGVS.c|HGVS.p|cDNA.pos/cDNA.length|
 *   CDS.pos/CDS.length|AA.pos/AA.length|Distance|ERRORS/WARNINGS/INFO
 */

#ifndef SNPEFFR_ANNOTATION_PARSER_HPP
#define SNPEFFR_ANNOTATION_PARSER_HPP

#include "snpeffr.hpp"
#include <string>
#include <vector>
#include <optional>

namespace snpeffr {

/**
 * INFO marker preceding the SnpEff annotation payload
 */
constexpr const char* ANN_MARKER = "ANN=";

/**
 * A record carrying an ANN payload, with the row id every later stage
 * uses as its join key. Row ids are 1-based and follow input order.
 */
struct AnnotatedSite {
    size_t row_id = 0;
    VariantRecord record;
    std::string payload;
};

/**
 * Extract the ANN payload from an INFO string: the text after the last
 * "ANN=" key (at the start of INFO or following ';'), up to the next ';'
 * (or the end of the field)
 * @return std::nullopt if the marker is absent
 */
std::optional<std::string> extract_ann_payload(const std::string& info);

/**
 * Keep records whose INFO carries an ANN payload and number them 1..N
 */
std::vector<AnnotatedSite> select_annotated_sites(const VariantTable& table);

/**
 * Split an ANN payload into its comma-delimited instances
 */
std::vector<std::string> split_annotation_payload(const std::string& payload);

/**
 * Parse one annotation instance. Never throws: missing sub-fields stay
 * empty and field_count records how many were present.
 */
AnnotationEntry parse_annotation_entry(const std::string& value);

/**
 * Reshape sites into long form, one row per (site, annotation instance).
 * Rows are ordered by instance number, then by row id.
 */
std::vector<AnnotationRow> split_annotations(const std::vector<AnnotatedSite>& sites);

} // namespace snpeffr

#endif // SNPEFFR_ANNOTATION_PARSER_HPP
