#include <visual_chunker/document_chunker.h>
#include <visual_chunker/document_source.h>
#include <visual_chunker/json_serializer.h>
#include <iostream>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <numeric>
#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <stdexcept>
#include <getopt.h>

namespace fs = std::filesystem;
using namespace visual_chunker;

struct CLIOptions {
    std::string input_file;
    std::string output_file;
    std::string config_file;
    std::optional<DocumentType> type;
    std::optional<int> max_chunk_size;
    std::optional<int> min_chunk_size;
    std::optional<int> overlap;
    std::optional<double> proximity;
    bool no_page_boundaries = false;
    bool no_visual_context = false;
    bool no_semantic_boundaries = false;
    bool no_adaptive = false;
    bool verbose = false;
    bool quiet = false;
    bool analyze = true;
    bool help = false;
    bool version = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n";
    std::cout << "\nRequired:\n";
    std::cout << "  -i, --input FILE           Input document (.json, .pdf or text)\n";
    std::cout << "\nOptional:\n";
    std::cout << "  -o, --output FILE          Output JSON file path (default: auto-generated)\n";
    std::cout << "  --type TYPE                Text input type: paginated, markup, structured, flat\n";
    std::cout << "  --config FILE              JSON chunking configuration\n";
    std::cout << "  --max-chunk-size N         Maximum characters per chunk (default: 1000)\n";
    std::cout << "  --min-chunk-size N         Minimum characters per chunk (default: 200)\n";
    std::cout << "  --overlap N                Character overlap between chunks (default: 150)\n";
    std::cout << "  --proximity N              Visual proximity threshold (default: 100)\n";
    std::cout << "  --no-page-boundaries       Allow merges across pages\n";
    std::cout << "  --no-visual-context        Skip visual association\n";
    std::cout << "  --no-semantic-boundaries   Skip semantic boundary merging\n";
    std::cout << "  --no-adaptive              Skip adaptive chunk sizing\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -q, --quiet                Quiet mode (minimal output)\n";
    std::cout << "  --no-analyze               Skip chunk distribution analysis\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " -i report.pdf\n";
    std::cout << "  " << program_name << " -i document.json -o chunks.json --max-chunk-size 800\n";
    std::cout << "  " << program_name << " --input notes.txt --type structured --verbose\n";
}

void print_version() {
    std::cout << "visual_chunker visual-chunk version 1.0.0\n";
    std::cout << "Built with C++17, MuPDF, nlohmann_json and RapidJSON\n";
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "i:o:vqh";
    const struct option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"max-chunk-size", required_argument, nullptr, 1001},
        {"min-chunk-size", required_argument, nullptr, 1002},
        {"overlap", required_argument, nullptr, 1003},
        {"proximity", required_argument, nullptr, 1004},
        {"type", required_argument, nullptr, 1005},
        {"config", required_argument, nullptr, 1006},
        {"no-page-boundaries", no_argument, nullptr, 1007},
        {"no-visual-context", no_argument, nullptr, 1008},
        {"no-semantic-boundaries", no_argument, nullptr, 1009},
        {"no-adaptive", no_argument, nullptr, 1010},
        {"no-analyze", no_argument, nullptr, 1011},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1012},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'i':
                options.input_file = optarg;
                break;
            case 'o':
                options.output_file = optarg;
                break;
            case 1001:  // max-chunk-size
                options.max_chunk_size = std::stoi(optarg);
                if (*options.max_chunk_size <= 0) {
                    throw std::invalid_argument("max-chunk-size must be positive");
                }
                break;
            case 1002:  // min-chunk-size
                options.min_chunk_size = std::stoi(optarg);
                if (*options.min_chunk_size < 0) {
                    throw std::invalid_argument("min-chunk-size cannot be negative");
                }
                break;
            case 1003:  // overlap
                options.overlap = std::stoi(optarg);
                if (*options.overlap < 0) {
                    throw std::invalid_argument("overlap cannot be negative");
                }
                break;
            case 1004:  // proximity
                options.proximity = std::stod(optarg);
                if (*options.proximity < 0) {
                    throw std::invalid_argument("proximity cannot be negative");
                }
                break;
            case 1005:  // type
                options.type = document_type_from_string(optarg);
                break;
            case 1006:  // config
                options.config_file = optarg;
                break;
            case 1007:
                options.no_page_boundaries = true;
                break;
            case 1008:
                options.no_visual_context = true;
                break;
            case 1009:
                options.no_semantic_boundaries = true;
                break;
            case 1010:
                options.no_adaptive = true;
                break;
            case 1011:  // no-analyze
                options.analyze = false;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                return options;
            case 1012:  // version
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    // Validate options
    if (options.input_file.empty() && !options.help && !options.version) {
        throw std::invalid_argument("Input file is required");
    }

    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    // Auto-generate output filename if not provided
    if (!options.input_file.empty() && options.output_file.empty()) {
        fs::path input_path(options.input_file);
        fs::path output_dir = input_path.parent_path();
        if (output_dir.empty()) {
            output_dir = ".";
        }
        std::string stem = input_path.stem().string();
        options.output_file = (output_dir / (stem + "_chunks.json")).string();
    }

    return options;
}

// Config file first, then command-line overrides
ChunkingConfig build_config(const CLIOptions& options) {
    ChunkingConfig config;
    if (!options.config_file.empty()) {
        config = JsonSerializer::load_config(options.config_file);
    }

    if (options.max_chunk_size) config.max_chunk_size = static_cast<size_t>(*options.max_chunk_size);
    if (options.min_chunk_size) config.min_chunk_size = static_cast<size_t>(*options.min_chunk_size);
    if (options.overlap) config.overlap_size = static_cast<size_t>(*options.overlap);
    if (options.proximity) config.visual_proximity_threshold = *options.proximity;
    if (options.no_page_boundaries) config.preserve_page_boundaries = false;
    if (options.no_visual_context) config.include_visual_context = false;
    if (options.no_semantic_boundaries) config.semantic_boundary_detection = false;
    if (options.no_adaptive) config.adaptive_chunk_sizing = false;
    if (options.verbose) config.verbose = true;

    config.validate();
    return config;
}

void analyze_chunk_distribution(const std::vector<FinalChunk>& chunks, bool quiet) {
    if (chunks.empty()) {
        if (!quiet) std::cout << "\nNo chunks created\n";
        return;
    }

    std::vector<size_t> sizes;
    size_t with_visuals = 0;
    for (const auto& chunk : chunks) {
        sizes.push_back(chunk.content.size());
        if (!chunk.visual_references.empty()) with_visuals++;
    }

    std::sort(sizes.begin(), sizes.end());

    double avg_size = std::accumulate(sizes.begin(), sizes.end(), 0.0) / sizes.size();

    if (!quiet) {
        std::cout << "\n=== Chunk Distribution Analysis ===\n";
        std::cout << "Total chunks: " << chunks.size() << "\n";
        std::cout << "Min chars: " << sizes.front() << "\n";
        std::cout << "Max chars: " << sizes.back() << "\n";
        std::cout << "Average chars: " << static_cast<size_t>(avg_size) << "\n";
        std::cout << "Chunks with visual context: " << with_visuals << "\n";

        std::cout << "\nQuintiles:\n";
        for (int p = 20; p <= 80; p += 20) {
            size_t idx = (sizes.size() - 1) * p / 100;
            std::cout << "  " << p << "th percentile: " << sizes[idx] << " chars\n";
        }

        std::map<std::string, int> distribution;
        for (size_t size : sizes) {
            if (size <= 200) distribution["0001-200"]++;
            else if (size <= 400) distribution["0201-400"]++;
            else if (size <= 600) distribution["0401-600"]++;
            else if (size <= 800) distribution["0601-800"]++;
            else if (size <= 1000) distribution["0801-1000"]++;
            else if (size <= 1200) distribution["1001-1200"]++;
            else distribution["1201+"]++;
        }

        std::cout << "\nSize Range Distribution:\n";
        for (const auto& [range, count] : distribution) {
            double percentage = (count * 100.0) / chunks.size();
            std::cout << "  " << std::setw(10) << range << " chars: "
                      << std::setw(5) << count << " chunks ("
                      << std::fixed << std::setprecision(1) << percentage << "%)\n";
        }
    }
}

int main(int argc, char* argv[]) {
    try {
        CLIOptions options = parse_arguments(argc, argv);

        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (options.version) {
            print_version();
            return 0;
        }

        if (!fs::exists(options.input_file)) {
            throw std::runtime_error("Input file not found: " + options.input_file);
        }

        fs::path output_path(options.output_file);
        fs::path output_dir = output_path.parent_path();
        if (!output_dir.empty() && !fs::exists(output_dir)) {
            if (options.verbose) {
                std::cout << "Creating output directory: " << output_dir << "\n";
            }
            fs::create_directories(output_dir);
        }

        ChunkingConfig config = build_config(options);

        if (!options.quiet) {
            std::cout << "Processing: " << options.input_file << "\n";
            std::cout << "Output: " << options.output_file << "\n";
            std::cout << "Configuration:\n";
            std::cout << "  Max chunk size: " << config.max_chunk_size << " chars\n";
            std::cout << "  Min chunk size: " << config.min_chunk_size << " chars\n";
            std::cout << "  Overlap: " << config.overlap_size << " chars\n";
            std::cout << "  Visual proximity: " << config.visual_proximity_threshold << "\n";
            std::cout << "  Page boundaries: " << (config.preserve_page_boundaries ? "on" : "off") << "\n";
            std::cout << "  Visual context: " << (config.include_visual_context ? "on" : "off") << "\n";
            std::cout << "  Semantic boundaries: " << (config.semantic_boundary_detection ? "on" : "off") << "\n";
            std::cout << "  Adaptive sizing: " << (config.adaptive_chunk_sizing ? "on" : "off") << "\n";
            std::cout << "\n";
        }

        auto start = std::chrono::high_resolution_clock::now();

        auto source = make_document_source(options.input_file, options.type);
        SourceDocument loaded = source->load(options.input_file);

        if (options.verbose) {
            std::cout << "Loaded " << loaded.document.content.size() << " chars ("
                      << to_string(loaded.document.type) << ") and "
                      << loaded.visuals.size() << " visuals\n";
        }

        DocumentChunker chunker(config);
        auto result = chunker.chunk(loaded.document, loaded.visuals);

        if (!result.error.empty()) {
            throw std::runtime_error("Chunking failed: " + result.error);
        }

        if (options.analyze && !options.quiet) {
            analyze_chunk_distribution(result.chunks, options.quiet);
        }

        if (options.verbose) {
            std::cout << "\nSaving chunks to JSON...\n";
        }

        bool save_success = chunker.process_to_json(loaded.document, loaded.visuals, options.output_file);
        if (!save_success) {
            throw std::runtime_error("Failed to save JSON output");
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        if (!options.quiet) {
            std::cout << "\n=== Processing Complete ===\n";
            std::cout << "Chunks created: " << result.metadata.total_chunks << "\n";
            std::cout << "Chunks with visual context: " << result.metadata.visual_context_chunks << "\n";
            std::cout << "Average chunk size: " << result.metadata.average_chunk_size << " chars\n";
            std::cout << "Chunking time: " << std::fixed << std::setprecision(2)
                      << result.metadata.processing_time_ms << "ms\n";
            std::cout << "Total time: " << total_duration.count() << "ms\n";
            std::cout << "Output saved to: " << options.output_file << "\n";
        } else {
            // In quiet mode, just output essential info in parseable format
            std::cout << "SUCCESS|" << options.input_file << "|"
                      << result.metadata.total_chunks << "|"
                      << result.metadata.visual_context_chunks << "|"
                      << total_duration.count() << "\n";
        }

        return 0;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid argument - " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "Error: Unknown error occurred\n";
        return 1;
    }
}
