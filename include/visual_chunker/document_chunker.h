#pragma once

#include <visual_chunker/chunking_config.h>
#include <visual_chunker/types.h>
#include <visual_chunker/visual_context.h>
#include <memory>
#include <string>
#include <vector>

namespace visual_chunker {

// Document -> StructureParser -> ChunkSplitter -> VisualContextEnhancer
//          -> SemanticBoundaryOptimizer -> AdaptiveSizeOptimizer -> MetadataAggregator
//
// Pure and synchronous. The returned chunks borrow from `visuals`.
// Throws PipelineError; there is no partial result.
ChunkingResult chunk_document(const Document& document,
                              const std::vector<VisualElement>& visuals,
                              const ChunkingConfig& config);

ChunkingResult chunk_document(const Document& document,
                              const std::vector<VisualElement>& visuals,
                              const ChunkingConfig& config,
                              const std::vector<VisualMatcher>& matchers);

// Main API class for visual-aware document chunking. The configuration is
// fixed at construction, so one instance may serve concurrent callers.
class DocumentChunker {
public:
    explicit DocumentChunker(const ChunkingConfig& config = ChunkingConfig{},
                             std::vector<VisualMatcher> matchers = default_visual_matchers());
    ~DocumentChunker();

    // Failures are reported through ChunkingResult::error
    ChunkingResult chunk(const Document& document,
                         const std::vector<VisualElement>& visuals = {}) const;

    // Chunk a document and save JSON output
    bool process_to_json(const Document& document,
                         const std::vector<VisualElement>& visuals,
                         const std::string& output_path,
                         bool pretty = true) const;

    const ChunkingConfig& get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace visual_chunker
