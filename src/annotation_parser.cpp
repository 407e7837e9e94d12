/**
 * SnpEff ANN Parsing - payload extraction, instance split, sub-field parse
 */

#include "annotation_parser.hpp"
#include <algorithm>

namespace snpeffr {

std::optional<std::string> extract_ann_payload(const std::string& info) {
    const std::string marker(ANN_MARKER);

    // Last ANN= that starts a key: at the beginning of INFO or after ';'
    size_t pos = info.rfind(marker);
    while (pos != std::string::npos && pos > 0 && info[pos - 1] != ';') {
        pos = info.rfind(marker, pos - 1);
    }
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    size_t start = pos + marker.size();
    size_t end = info.find(';', start);
    if (end == std::string::npos) {
        return info.substr(start);
    }
    return info.substr(start, end - start);
}

std::vector<AnnotatedSite> select_annotated_sites(const VariantTable& table) {
    std::vector<AnnotatedSite> sites;

    for (const auto& record : table.records) {
        std::optional<std::string> payload = extract_ann_payload(record.info);
        if (!payload) continue;

        AnnotatedSite site;
        site.row_id = sites.size() + 1;
        site.record = record;
        site.payload = std::move(*payload);
        sites.push_back(std::move(site));
    }

    log(LogLevel::DEBUG, std::to_string(sites.size()) + " of " +
        std::to_string(table.size()) + " records carry ANN annotations");
    return sites;
}

std::vector<std::string> split_annotation_payload(const std::string& payload) {
    return split(payload, ',');
}

AnnotationEntry parse_annotation_entry(const std::string& value) {
    std::vector<std::string> tokens = split(value, '|');

    AnnotationEntry entry;
    entry.field_count = tokens.size();

    // Pad short entries so every named field can be assigned
    if (tokens.size() < ANN_FIELD_COUNT) {
        tokens.resize(ANN_FIELD_COUNT);
    }

    entry.allele = tokens[0];
    entry.effect = tokens[1];
    entry.putative_impact = tokens[2];
    entry.gene_name = tokens[3];
    entry.gene_id = tokens[4];
    entry.feature_type = tokens[5];
    entry.feature_id = tokens[6];
    entry.transcript_biotype = tokens[7];
    entry.rank_total = tokens[8];
    entry.hgvs_c = tokens[9];
    entry.hgvs_p = tokens[10];
    entry.cdna_pos_len = tokens[11];
    entry.cds_pos_len = tokens[12];
    entry.protein_pos_len = tokens[13];
    entry.distance = tokens[14];

    entry.overflow.assign(tokens.begin() + ANN_FIELD_COUNT, tokens.end());
    while (!entry.overflow.empty() && entry.overflow.back().empty()) {
        entry.overflow.pop_back();
    }

    return entry;
}

std::vector<AnnotationRow> split_annotations(const std::vector<AnnotatedSite>& sites) {
    std::vector<std::vector<std::string>> instances;
    instances.reserve(sites.size());

    size_t max_instances = 0;
    for (const auto& site : sites) {
        instances.push_back(split_annotation_payload(site.payload));
        max_instances = std::max(max_instances, instances.back().size());
    }

    std::vector<AnnotationRow> rows;
    size_t malformed = 0;

    // Instance-major order: every site's first annotation, then every
    // site's second annotation, and so on. Sites with fewer instances
    // simply have no row for the missing slots.
    for (size_t k = 0; k < max_instances; ++k) {
        for (size_t i = 0; i < sites.size(); ++i) {
            if (k >= instances[i].size()) continue;

            const VariantRecord& record = sites[i].record;

            AnnotationRow row;
            row.row_id = sites[i].row_id;
            row.instance = k + 1;
            row.chrom = record.chrom;
            row.pos = record.pos;
            row.ref = record.ref;
            row.alt = record.alt;
            row.entry = parse_annotation_entry(instances[i][k]);

            if (row.entry.is_malformed()) {
                ++malformed;
                log(LogLevel::DEBUG, "Short ANN entry at " + record.chrom + ":" +
                    std::to_string(record.pos) + " (" + std::to_string(row.entry.field_count) +
                    " fields): " + instances[i][k]);
            }

            rows.push_back(std::move(row));
        }
    }

    if (malformed > 0) {
        log(LogLevel::DEBUG, std::to_string(malformed) + " ANN entries had fewer than " +
            std::to_string(ANN_FIELD_COUNT) + " fields");
    }
    return rows;
}

} // namespace snpeffr
