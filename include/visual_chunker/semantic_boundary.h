#pragma once

#include <visual_chunker/chunking_config.h>
#include <visual_chunker/types.h>
#include <vector>

namespace visual_chunker {

// Merges chunks that end mid-thought into their successor. Single greedy
// left-to-right pass; a merged chunk is not considered again.
class SemanticBoundaryOptimizer {
public:
    explicit SemanticBoundaryOptimizer(const ChunkingConfig& config) : config_(config) {}

    std::vector<FinalChunk> optimize(std::vector<FinalChunk> chunks) const;

    // Combined length (with separator) within max_chunk_size * 1.2 and, when
    // page boundaries are preserved, both chunks on the same page
    bool can_merge(const FinalChunk& first, const FinalChunk& second) const;

    static FinalChunk merge(const FinalChunk& first, const FinalChunk& second);

private:
    ChunkingConfig config_;
};

} // namespace visual_chunker
