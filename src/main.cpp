/**
 * snpeffr - Command-line entry point
 *
 * Extracts per-sample mutation calls from a SnpEff-annotated VCF,
 * restricted to regions, genes and effects of interest.
 */

#include "snpeffr.hpp"
#include "extraction_config.hpp"
#include "mutation_extractor.hpp"
#include "output_writer.hpp"
#include "record_loader.hpp"
#include <iostream>
#include <set>
#include <string>
#include <vector>

void print_usage(const char* program_name) {
    std::cout << "snpeffr - Mutation calls from SnpEff-annotated VCF files\n"
              << "========================================================\n\n"
              << "Usage: " << program_name << " [OPTIONS] -i INPUT\n\n"
              << "Required:\n"
              << "  -i, --vcf FILE           SnpEff-annotated VCF (.vcf, .vcf.gz)\n\n"
              << "Output:\n"
              << "  -o, --output FILE        Output file (default: stdout; .gz compresses)\n"
              << "  --format FORMAT          tsv (default), csv or json\n"
              << "  --compress               gzip the output\n\n"
              << "Regions (default: fks1_hs1=221638-221665, fks1_hs2=223782-223805):\n"
              << "  --region NAME=SPEC       Region of interest, can be used multiple times\n"
              << "                           SPEC: START-END[,POS|START-END...]\n"
              << "                           A position in several regions takes the last one\n"
              << "  --regions-file FILE      Tab-delimited name, start[, end] per line\n\n"
              << "Annotation Filters:\n"
              << "  --genes LIST             Comma-separated ANN Gene_IDs (default: CAB11_002014)\n"
              << "  --gene-list FILE         Gene_IDs from file (one per line)\n"
              << "  --exclude-effects REGEX  Effects to ignore (default: synonymous_variant)\n"
              << "                           An empty pattern excludes nothing\n\n"
              << "Other Options:\n"
              << "  --use-index              Fetch region positions through the tabix index\n"
              << "  --stats                  Print extraction statistics to stderr\n"
              << "                           (as JSON with --format json)\n"
              << "  --debug                  Enable debug logging\n"
              << "  -q, --quiet              Only log warnings and errors\n"
              << "  -h, --help               Show this help message\n\n"
              << "Examples:\n"
              << "  " << program_name << " -i cohort.ann.vcf.gz -o fks1_mutations.tsv\n\n"
              << "  " << program_name << " -i cohort.ann.vcf.gz --format csv \\\n"
              << "      --region hs1=221638-221665 --genes CAB11_002014 \\\n"
              << "      --exclude-effects 'synonymous_variant|upstream_gene_variant'\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    std::string vcf_path;
    std::string output_path;
    std::string format_str = "tsv";
    bool compress = false;
    bool print_stats = false;

    snpeffr::ExtractionConfig config;
    std::vector<snpeffr::Region> cli_regions;
    std::set<std::string> cli_genes;
    bool genes_given = false;

    try {
        // Parse command line arguments
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if ((arg == "-i" || arg == "--vcf") && i + 1 < argc) {
                vcf_path = argv[++i];
            } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--format" && i + 1 < argc) {
                format_str = argv[++i];
            } else if (arg == "--compress") {
                compress = true;
            } else if (arg == "--region" && i + 1 < argc) {
                cli_regions.push_back(snpeffr::parse_region_spec(argv[++i]));
            } else if (arg == "--regions-file" && i + 1 < argc) {
                for (auto& region : snpeffr::load_region_file(argv[++i])) {
                    cli_regions.push_back(std::move(region));
                }
            } else if (arg == "--genes" && i + 1 < argc) {
                for (const auto& gene : snpeffr::parse_gene_list(argv[++i])) {
                    cli_genes.insert(gene);
                }
                genes_given = true;
            } else if (arg == "--gene-list" && i + 1 < argc) {
                auto genes = snpeffr::load_gene_list(argv[++i]);
                if (genes.empty()) {
                    snpeffr::log(snpeffr::LogLevel::WARNING, "No genes loaded from file");
                }
                cli_genes.insert(genes.begin(), genes.end());
                genes_given = true;
            } else if (arg == "--exclude-effects" && i + 1 < argc) {
                config.exclude_effects = argv[++i];
            } else if (arg == "--use-index") {
                config.use_index = true;
            } else if (arg == "--stats") {
                print_stats = true;
            } else if (arg == "--debug") {
                snpeffr::set_log_level(snpeffr::LogLevel::DEBUG);
            } else if (arg == "-q" || arg == "--quiet") {
                snpeffr::set_log_level(snpeffr::LogLevel::WARNING);
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        // Validate required arguments
        if (vcf_path.empty()) {
            std::cerr << "Error: Input VCF (-i) is required.\n" << std::endl;
            print_usage(argv[0]);
            return 1;
        }

        if (!cli_regions.empty()) {
            config.regions = std::move(cli_regions);
        }
        if (genes_given) {
            config.genes = std::move(cli_genes);
        }
        if (config.genes.empty()) {
            snpeffr::log(snpeffr::LogLevel::WARNING, "Gene set is empty; no rows will be reported");
        }

        snpeffr::OutputFormat format = snpeffr::parse_output_format(format_str);
        config.validate();

        snpeffr::VcfFileSource source(vcf_path, config.use_index);
        snpeffr::ExtractionStats stats;
        snpeffr::ResultTable result = snpeffr::extract_mutations(source, config, &stats);

        auto writer = snpeffr::create_result_writer(output_path, format, compress);
        writer->write_table(result);
        writer->close();

        if (print_stats) {
            std::cerr << snpeffr::format_stats(stats, format);
        }

        if (!output_path.empty() && output_path != "-") {
            snpeffr::log(snpeffr::LogLevel::INFO, "Output written to: " + output_path);
        }
    } catch (const std::exception& e) {
        snpeffr::log(snpeffr::LogLevel::ERROR, e.what());
        return 1;
    }

    return 0;
}
