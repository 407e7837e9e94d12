/**
 * Tests for genotype_decoder.hpp: GT code decoding, allele resolution
 * and per-site sample call tables.
 */

#include <gtest/gtest.h>
#include "genotype_decoder.hpp"

using namespace snpeffr;

// ============================================================================
// decode_genotype
// ============================================================================

TEST(DecodeGenotype, ReferenceCode) {
    EXPECT_EQ(decode_genotype("0"), GenotypeCall::reference());
    EXPECT_EQ(decode_genotype("0:35"), GenotypeCall::reference());
}

TEST(DecodeGenotype, AlternateCodes) {
    EXPECT_EQ(decode_genotype("1"), GenotypeCall::alternate(1));
    EXPECT_EQ(decode_genotype("2:12,30:42"), GenotypeCall::alternate(2));
    EXPECT_EQ(decode_genotype("12"), GenotypeCall::alternate(12));
}

TEST(DecodeGenotype, PhasedAndDottedSeparators) {
    EXPECT_EQ(decode_genotype("1|1"), GenotypeCall::alternate(1));
    EXPECT_EQ(decode_genotype("1.5"), GenotypeCall::alternate(1));
}

TEST(DecodeGenotype, NoCalls) {
    EXPECT_TRUE(decode_genotype(".").is_no_call());
    EXPECT_TRUE(decode_genotype("./.").is_no_call());
    EXPECT_TRUE(decode_genotype(".:0").is_no_call());
    EXPECT_TRUE(decode_genotype("").is_no_call());
    EXPECT_TRUE(decode_genotype(":35").is_no_call());
}

TEST(DecodeGenotype, UnparseableIsNoCall) {
    EXPECT_TRUE(decode_genotype("0/1").is_no_call());
    EXPECT_TRUE(decode_genotype("A").is_no_call());
    EXPECT_TRUE(decode_genotype("-1").is_no_call());
    EXPECT_TRUE(decode_genotype("99999999999999999999").is_no_call());
}

TEST(DecodeGenotype, Idempotent) {
    const char* raws[] = {"0", "1:4,20", ".", "0/1", "3|3"};
    for (const char* raw : raws) {
        EXPECT_EQ(decode_genotype(raw), decode_genotype(raw)) << raw;
    }
}

// ============================================================================
// AlleleTable
// ============================================================================

TEST(AlleleTable, ResolvesReferenceAndAlternates) {
    AlleleTable alleles("AGT", "AGC,AGA");
    EXPECT_EQ(alleles.reference(), "AGT");
    ASSERT_EQ(alleles.alternates().size(), 2u);

    EXPECT_EQ(alleles.resolve(GenotypeCall::reference()), std::optional<std::string>("AGT"));
    EXPECT_EQ(alleles.resolve(GenotypeCall::alternate(1)), std::optional<std::string>("AGC"));
    EXPECT_EQ(alleles.resolve(GenotypeCall::alternate(2)), std::optional<std::string>("AGA"));
}

TEST(AlleleTable, OutOfRangeAlternate) {
    AlleleTable alleles("AGT", "AGC");
    EXPECT_FALSE(alleles.resolve(GenotypeCall::alternate(2)).has_value());
    EXPECT_FALSE(alleles.resolve(GenotypeCall::alternate(0)).has_value());
}

TEST(AlleleTable, NoCallNeverResolves) {
    AlleleTable alleles("AGT", "AGC");
    EXPECT_FALSE(alleles.resolve(GenotypeCall::no_call()).has_value());
}

TEST(AlleleTable, DecodeThenResolve) {
    AlleleTable alleles("AGT", "AGC");
    EXPECT_EQ(alleles.resolve(decode_genotype("0:30")), std::optional<std::string>("AGT"));
    EXPECT_EQ(alleles.resolve(decode_genotype("1:30")), std::optional<std::string>("AGC"));
    EXPECT_FALSE(alleles.resolve(decode_genotype(".:0")).has_value());
}

// ============================================================================
// decode_samples
// ============================================================================

static AnnotatedSite make_site(size_t row_id, const std::string& ref, const std::string& alt,
                               const std::vector<std::string>& genotypes) {
    AnnotatedSite site;
    site.row_id = row_id;
    site.record.chrom = "chr1";
    site.record.pos = 1000 + static_cast<int>(row_id);
    site.record.ref = ref;
    site.record.alt = alt;
    site.record.format = "GT:DP";
    site.record.genotypes = genotypes;
    return site;
}

TEST(DecodeSamples, KeyedByRowIdInSampleOrder) {
    std::vector<AnnotatedSite> sites = {
        make_site(1, "AGT", "AGC", {"1:20", "0:18", ".:0"}),
        make_site(2, "C", "T,G", {"2:11", "1:9", "0:30"})
    };
    std::vector<std::string> samples = {"S1", "S2", "S3"};

    size_t no_calls = 0;
    SampleCallTable table = decode_samples(sites, samples, &no_calls);

    ASSERT_EQ(table.size(), 2u);
    ASSERT_EQ(table.at(1).size(), 3u);
    EXPECT_EQ(table.at(1)[0].sample_id, "S1");
    EXPECT_EQ(table.at(1)[0].sequence, std::optional<std::string>("AGC"));
    EXPECT_EQ(table.at(1)[1].sequence, std::optional<std::string>("AGT"));
    EXPECT_FALSE(table.at(1)[2].sequence.has_value());
    EXPECT_TRUE(table.at(1)[2].call.is_no_call());

    EXPECT_EQ(table.at(2)[0].sequence, std::optional<std::string>("G"));
    EXPECT_EQ(table.at(2)[1].sequence, std::optional<std::string>("T"));
    EXPECT_EQ(table.at(2)[2].sequence, std::optional<std::string>("C"));

    EXPECT_EQ(no_calls, 1u);
}

TEST(DecodeSamples, MissingGenotypeColumnsAreNoCalls) {
    std::vector<AnnotatedSite> sites = {make_site(1, "A", "T", {})};
    SampleCallTable table = decode_samples(sites, {"S1", "S2"});

    ASSERT_EQ(table.at(1).size(), 2u);
    EXPECT_TRUE(table.at(1)[0].call.is_no_call());
    EXPECT_FALSE(table.at(1)[1].sequence.has_value());
}
