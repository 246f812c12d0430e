#include <visual_chunker/document_chunker.h>
#include <visual_chunker/adaptive_sizing.h>
#include <visual_chunker/chunk_splitter.h>
#include <visual_chunker/errors.h>
#include <visual_chunker/json_serializer.h>
#include <visual_chunker/metadata_aggregator.h>
#include <visual_chunker/semantic_boundary.h>
#include <visual_chunker/structure_parser.h>
#include <chrono>
#include <fstream>
#include <iostream>

namespace visual_chunker {

ChunkingResult chunk_document(const Document& document,
                              const std::vector<VisualElement>& visuals,
                              const ChunkingConfig& config) {
    return chunk_document(document, visuals, config, default_visual_matchers());
}

ChunkingResult chunk_document(const Document& document,
                              const std::vector<VisualElement>& visuals,
                              const ChunkingConfig& config,
                              const std::vector<VisualMatcher>& matchers) {
    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        config.validate();

        if (config.verbose) {
            std::cout << "[chunk_document] Chunking " << (document.name.empty() ? "document" : document.name)
                      << " (" << to_string(document.type) << ", " << document.content.size()
                      << " chars, " << visuals.size() << " visuals)" << std::endl;
        }

        // Step 1: detect pages, sections or blocks
        StructureParser parser(config.verbose);
        DocumentStructure structure = parser.parse(document.content, document.type);

        // Step 2: size-bounded raw chunks
        ChunkSplitter splitter(config);
        std::vector<RawChunk> raw_chunks = splitter.split(structure, document.content);

        // Step 3: visual association and context metrics
        VisualContextEnhancer enhancer(config, matchers);
        std::vector<FinalChunk> chunks = enhancer.enhance(std::move(raw_chunks), visuals);

        // Step 4: merge chunks that end mid-thought
        if (config.semantic_boundary_detection) {
            chunks = SemanticBoundaryOptimizer(config).optimize(std::move(chunks));
        }

        // Step 5: density-driven resizing
        if (config.adaptive_chunk_sizing) {
            chunks = AdaptiveSizeOptimizer(config).optimize(std::move(chunks));
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        double elapsed = std::chrono::duration<double, std::milli>(end_time - start_time).count();

        ChunkingResult result;
        result.metadata = MetadataAggregator::aggregate(chunks, elapsed);
        result.chunks = std::move(chunks);

        if (config.verbose) {
            std::cout << "[chunk_document] " << result.metadata.total_chunks << " chunks in "
                      << elapsed << "ms" << std::endl;
        }
        return result;

    } catch (const PipelineError&) {
        throw;
    } catch (const std::exception& e) {
        throw PipelineError(std::string("Error chunking document: ") + e.what());
    }
}

class DocumentChunker::Impl {
public:
    ChunkingConfig config;
    std::vector<VisualMatcher> matchers;

    Impl(const ChunkingConfig& cfg, std::vector<VisualMatcher> m)
        : config(cfg), matchers(std::move(m)) {}
};

DocumentChunker::DocumentChunker(const ChunkingConfig& config, std::vector<VisualMatcher> matchers)
    : pImpl(std::make_unique<Impl>(config, std::move(matchers))) {
}

DocumentChunker::~DocumentChunker() = default;

ChunkingResult DocumentChunker::chunk(const Document& document,
                                      const std::vector<VisualElement>& visuals) const {
    try {
        return chunk_document(document, visuals, pImpl->config, pImpl->matchers);
    } catch (const std::exception& e) {
        ChunkingResult result;
        result.error = e.what();
        return result;
    }
}

bool DocumentChunker::process_to_json(const Document& document,
                                      const std::vector<VisualElement>& visuals,
                                      const std::string& output_path,
                                      bool pretty) const {
    auto result = chunk(document, visuals);
    if (!result.error.empty()) {
        std::cerr << "[DocumentChunker::process_to_json] " << result.error << std::endl;
        return false;
    }

    std::ofstream outfile(output_path);
    if (!outfile) {
        std::cerr << "[DocumentChunker::process_to_json] Cannot open " << output_path << std::endl;
        return false;
    }

    outfile << JsonSerializer::serialize_result(result, document.name, pretty);
    return static_cast<bool>(outfile);
}

const ChunkingConfig& DocumentChunker::get_config() const {
    return pImpl->config;
}

} // namespace visual_chunker
