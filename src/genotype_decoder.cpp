/**
 * Genotype Decoding - GT code parsing and allele resolution
 */

#include "genotype_decoder.hpp"
#include <cctype>
#include <limits>

namespace snpeffr {

GenotypeCall decode_genotype(const std::string& raw) {
    std::string token = raw.substr(0, raw.find_first_of(".|:"));

    if (token.empty()) {
        return GenotypeCall::no_call();
    }

    int code = 0;
    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return GenotypeCall::no_call();
        }
        if (code > (std::numeric_limits<int>::max() - (c - '0')) / 10) {
            return GenotypeCall::no_call();
        }
        code = code * 10 + (c - '0');
    }

    if (code == 0) {
        return GenotypeCall::reference();
    }
    return GenotypeCall::alternate(code);
}

AlleleTable::AlleleTable(const std::string& ref, const std::string& alt)
    : ref_(ref), alts_(split(alt, ',')) {}

std::optional<std::string> AlleleTable::resolve(const GenotypeCall& call) const {
    switch (call.kind) {
        case GenotypeKind::REFERENCE:
            return ref_;
        case GenotypeKind::ALTERNATE:
            if (call.alt_index >= 1 && static_cast<size_t>(call.alt_index) <= alts_.size()) {
                return alts_[call.alt_index - 1];
            }
            return std::nullopt;
        case GenotypeKind::NO_CALL:
        default:
            return std::nullopt;
    }
}

SampleCallTable decode_samples(const std::vector<AnnotatedSite>& sites,
                               const std::vector<std::string>& sample_names,
                               size_t* no_calls) {
    SampleCallTable table;
    size_t unresolved = 0;

    for (const auto& site : sites) {
        AlleleTable alleles(site.record.ref, site.record.alt);

        std::vector<SampleCall>& calls = table[site.row_id];
        calls.reserve(sample_names.size());

        for (size_t s = 0; s < sample_names.size(); ++s) {
            SampleCall sc;
            sc.sample_id = sample_names[s];
            if (s < site.record.genotypes.size()) {
                sc.call = decode_genotype(site.record.genotypes[s]);
            }
            sc.sequence = alleles.resolve(sc.call);
            if (!sc.sequence) {
                ++unresolved;
            }
            calls.push_back(std::move(sc));
        }
    }

    log(LogLevel::DEBUG, "Decoded genotypes for " + std::to_string(sites.size()) +
        " sites; " + std::to_string(unresolved) + " calls unresolved");

    if (no_calls) *no_calls += unresolved;
    return table;
}

} // namespace snpeffr
