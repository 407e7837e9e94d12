/**
 * Tests for record_loader.hpp: header and record parsing, in-memory and
 * file-backed (plain and gzip) sources, and structural failures.
 */

#include <gtest/gtest.h>
#include "record_loader.hpp"
#include "position_filter.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <zlib.h>

#include <htslib/bgzf.h>
#include <htslib/tbx.h>

using namespace snpeffr;

// ============================================================================
// Helpers
// ============================================================================

static const std::string kHeader =
    "##fileformat=VCFv4.2\n"
    "##INFO=<ID=ANN,Number=.,Type=String,Description=\"Functional annotations\">\n"
    "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tS1\tS2\n";

static const std::string kBody =
    "PEKT02000007\t221640\t.\tAGT\tAGC\t900\tPASS\tANN=AGC|missense_variant\tGT:DP\t1:30\t0:28\n"
    "PEKT02000007\t223790\t.\tC\tT,G\t500\tPASS\tDP=40\tGT:DP\t2:11\t.:0\n";

namespace {

// RAII temp file cleanup
class TempFile {
public:
    TempFile(const std::string& suffix = ".vcf") {
        path_ = std::filesystem::temp_directory_path() /
                ("test_record_loader_" + std::to_string(counter_++) + suffix);
    }
    ~TempFile() {
        std::filesystem::remove(path_);
        std::filesystem::remove(path_.string() + ".tbi");
    }
    std::string path() const { return path_.string(); }
private:
    std::filesystem::path path_;
    static inline int counter_ = 0;
};

} // namespace

static void write_plain(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

static void write_gzip(const std::string& path, const std::string& content) {
    gzFile gz = gzopen(path.c_str(), "wb");
    ASSERT_NE(gz, nullptr);
    gzwrite(gz, content.c_str(), static_cast<unsigned int>(content.size()));
    gzclose(gz);
}

// bgzip the content and build a tabix index beside it
static void write_bgzip_indexed(const std::string& path, const std::string& content) {
    BGZF* fp = bgzf_open(path.c_str(), "w");
    ASSERT_NE(fp, nullptr);
    ASSERT_EQ(bgzf_write(fp, content.c_str(), content.size()),
              static_cast<ssize_t>(content.size()));
    ASSERT_EQ(bgzf_close(fp), 0);
    ASSERT_EQ(tbx_index_build(path.c_str(), 0, &tbx_conf_vcf), 0);
}

static std::vector<std::pair<std::string, int>> loci(const VariantTable& table) {
    std::vector<std::pair<std::string, int>> result;
    for (const auto& rec : table.records) {
        result.emplace_back(rec.chrom, rec.pos);
    }
    return result;
}

// Two contigs; chrA:100 is a deletion spanning 100-108
static const std::string kIndexedBody =
    "chrA\t100\t.\tAGTAGTAGT\tA\t50\tPASS\tANN=A|frameshift_variant\tGT\t1\n"
    "chrA\t105\t.\tC\tT\t50\tPASS\t.\tGT\t1\n"
    "chrA\t106\t.\tG\tA\t50\tPASS\t.\tGT\t0\n"
    "chrA\t200\t.\tT\tC\t50\tPASS\t.\tGT\t1\n"
    "chrB\t50\t.\tA\tG\t50\tPASS\t.\tGT\t1\n"
    "chrB\t105\t.\tC\tG\t50\tPASS\t.\tGT\t.\n"
    "chrB\t300\t.\tG\tT\t50\tPASS\t.\tGT\t1\n";

static const std::string kIndexedHeader =
    "##fileformat=VCFv4.2\n"
    "##contig=<ID=chrA>\n"
    "##contig=<ID=chrB>\n"
    "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tS1\n";

// ============================================================================
// parse_vcf_header / parse_vcf_record
// ============================================================================

TEST(ParseVcfHeader, SampleNames) {
    auto samples = parse_vcf_header("#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tA\tB\tC");
    EXPECT_EQ(samples, (std::vector<std::string>{"A", "B", "C"}));
}

TEST(ParseVcfHeader, SitesOnly) {
    auto samples = parse_vcf_header("#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO");
    EXPECT_TRUE(samples.empty());
}

TEST(ParseVcfHeader, MissingFixedColumns) {
    EXPECT_THROW(parse_vcf_header("#CHROM\tPOS\tREF\tALT"), InputFormatError);
    EXPECT_THROW(parse_vcf_header("#CHROM\tPOS\tID\tREF\tALT\tQUAL\tINFO\tFILTER"), InputFormatError);
    EXPECT_THROW(parse_vcf_header("#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tS1"), InputFormatError);
}

TEST(ParseVcfRecord, AllColumns) {
    VariantRecord rec = parse_vcf_record(
        "chr1\t42\trs1\tA\tG,T\t50\tPASS\tDP=3\tGT\t1\t2", 2, true, 7);
    EXPECT_EQ(rec.chrom, "chr1");
    EXPECT_EQ(rec.pos, 42);
    EXPECT_EQ(rec.id, "rs1");
    EXPECT_EQ(rec.ref, "A");
    EXPECT_EQ(rec.alt, "G,T");
    EXPECT_EQ(rec.qual, "50");
    EXPECT_EQ(rec.filter, "PASS");
    EXPECT_EQ(rec.info, "DP=3");
    EXPECT_EQ(rec.format, "GT");
    EXPECT_EQ(rec.genotypes, (std::vector<std::string>{"1", "2"}));
}

TEST(ParseVcfRecord, ColumnCountMismatch) {
    EXPECT_THROW(parse_vcf_record("chr1\t42\t.\tA\tG\t50\tPASS\tDP=3\tGT\t1", 2, true, 3),
                 InputFormatError);
    EXPECT_THROW(parse_vcf_record("chr1\t42\t.\tA", 0, false, 3), InputFormatError);
}

TEST(ParseVcfRecord, NonIntegerPosition) {
    EXPECT_THROW(parse_vcf_record("chr1\tabc\t.\tA\tG\t50\tPASS\t.", 0, false, 1), InputFormatError);
    EXPECT_THROW(parse_vcf_record("chr1\t12x\t.\tA\tG\t50\tPASS\t.", 0, false, 1), InputFormatError);
    EXPECT_THROW(parse_vcf_record("chr1\t\t.\tA\tG\t50\tPASS\t.", 0, false, 1), InputFormatError);
}

TEST(PositionRanges, CollapsesContiguousRuns) {
    auto ranges = position_ranges({7, 3, 4, 5, 10, 4, 11});
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[0], std::make_pair(3, 5));
    EXPECT_EQ(ranges[1], std::make_pair(7, 7));
    EXPECT_EQ(ranges[2], std::make_pair(10, 11));
    EXPECT_TRUE(position_ranges({}).empty());
}

// ============================================================================
// TextRecordSource
// ============================================================================

TEST(TextRecordSource, LoadsRecordsAndSamples) {
    TextRecordSource source(kHeader + kBody);
    VariantTable table = source.load();

    EXPECT_EQ(table.sample_names, (std::vector<std::string>{"S1", "S2"}));
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table.records[0].pos, 221640);
    EXPECT_EQ(table.records[0].info, "ANN=AGC|missense_variant");
    EXPECT_EQ(table.records[1].alt, "T,G");
    EXPECT_EQ(table.records[1].genotypes[1], ".:0");
}

TEST(TextRecordSource, HeaderOnly) {
    TextRecordSource source(kHeader);
    VariantTable table = source.load();
    EXPECT_TRUE(table.empty());
    EXPECT_EQ(table.sample_names.size(), 2u);
}

TEST(TextRecordSource, CrlfLineEndings) {
    std::string text = "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tS1\r\n"
                       "c\t5\t.\tA\tG\t.\t.\t.\tGT\t1\r\n";
    VariantTable table = TextRecordSource(text).load();
    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(table.records[0].genotypes[0], "1");
}

TEST(TextRecordSource, MissingHeaderThrows) {
    TextRecordSource source("PEKT02000007\t221640\t.\tAGT\tAGC\t900\tPASS\t.\n");
    EXPECT_THROW(source.load(), InputFormatError);
}

TEST(TextRecordSource, EmptyInputThrows) {
    TextRecordSource source("");
    EXPECT_THROW(source.load(), InputFormatError);
}

TEST(TextRecordSource, RaggedRowThrows) {
    TextRecordSource source(kHeader + "PEKT02000007\t221640\t.\tAGT\tAGC\t900\tPASS\t.\tGT\t1\n");
    EXPECT_THROW(source.load(), InputFormatError);
}

TEST(TextRecordSource, DuplicateHeaderThrows) {
    TextRecordSource source(kHeader + kBody + kHeader);
    EXPECT_THROW(source.load(), InputFormatError);
}

// ============================================================================
// VcfFileSource
// ============================================================================

TEST(VcfFileSource, PlainFile) {
    TempFile tmp(".vcf");
    write_plain(tmp.path(), kHeader + kBody);

    VcfFileSource source(tmp.path());
    EXPECT_EQ(source.name(), tmp.path());

    VariantTable table = source.load();
    EXPECT_EQ(table.sample_names, (std::vector<std::string>{"S1", "S2"}));
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table.records[1].pos, 223790);
}

TEST(VcfFileSource, GzipFile) {
    TempFile tmp(".vcf.gz");
    write_gzip(tmp.path(), kHeader + kBody);

    VariantTable table = VcfFileSource(tmp.path()).load();
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table.records[0].ref, "AGT");
    EXPECT_EQ(table.records[0].genotypes[0], "1:30");
}

TEST(VcfFileSource, MissingFileThrows) {
    VcfFileSource source("/nonexistent/path/input.vcf");
    EXPECT_THROW(source.load(), InputFormatError);
}

TEST(VcfFileSource, MalformedFileThrows) {
    TempFile tmp(".vcf");
    write_plain(tmp.path(), "this is not a vcf\n");
    EXPECT_THROW(VcfFileSource(tmp.path()).load(), InputFormatError);
}

TEST(VcfFileSource, LoadPositionsWithoutIndexReadsEverything) {
    TempFile tmp(".vcf");
    write_plain(tmp.path(), kHeader + kBody);

    VcfFileSource unindexed(tmp.path(), false);
    EXPECT_EQ(unindexed.load_positions({221640}).size(), 2u);

    // Index requested but absent: falls back to a full read
    VcfFileSource fallback(tmp.path(), true);
    EXPECT_EQ(fallback.load_positions({221640}).size(), 2u);
}

TEST(VcfFileSource, IndexedFetchMatchesFullLoadThenFilter) {
    TempFile tmp(".vcf.gz");
    write_bgzip_indexed(tmp.path(), kIndexedHeader + kIndexedBody);
    ASSERT_TRUE(std::filesystem::exists(tmp.path() + ".tbi"));

    RegionIndex regions({Region("hs", {105, 106}), Region("far", {300, 1000})});

    VariantTable full = VcfFileSource(tmp.path()).load();
    VariantTable expected = filter_by_position(full, regions);

    VcfFileSource indexed(tmp.path(), true);
    VariantTable fetched = indexed.load_positions(regions.positions());

    EXPECT_EQ(fetched.sample_names, expected.sample_names);
    EXPECT_EQ(loci(fetched), loci(expected));
    EXPECT_EQ(loci(fetched), (std::vector<std::pair<std::string, int>>{
                                 {"chrA", 105}, {"chrA", 106}, {"chrB", 105}, {"chrB", 300}}));
    ASSERT_EQ(fetched.size(), 4u);
    EXPECT_EQ(fetched.records[3].alt, "T");
    EXPECT_EQ(fetched.records[2].genotypes, (std::vector<std::string>{"."}));
}

// The deletion at chrA:100 overlaps 101-108 but its POS is outside the range
TEST(VcfFileSource, IndexedFetchDropsUpstreamOverlaps) {
    TempFile tmp(".vcf.gz");
    write_bgzip_indexed(tmp.path(), kIndexedHeader + kIndexedBody);

    VcfFileSource indexed(tmp.path(), true);
    EXPECT_TRUE(indexed.load_positions({103, 104}).empty());

    VariantTable at_deletion = indexed.load_positions({100});
    EXPECT_EQ(loci(at_deletion), (std::vector<std::pair<std::string, int>>{{"chrA", 100}}));
}

TEST(VcfFileSource, IndexedFetchWithNoPositions) {
    TempFile tmp(".vcf.gz");
    write_bgzip_indexed(tmp.path(), kIndexedHeader + kIndexedBody);

    VariantTable table = VcfFileSource(tmp.path(), true).load_positions({});
    EXPECT_TRUE(table.empty());
    EXPECT_EQ(table.sample_names, (std::vector<std::string>{"S1"}));
}
