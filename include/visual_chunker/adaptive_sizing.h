#pragma once

#include <visual_chunker/chunking_config.h>
#include <visual_chunker/types.h>
#include <vector>

namespace visual_chunker {

// Adapts chunk sizes to local content density. Visual-dense and hard to read
// chunks get a smaller target; chunks far above target are split with
// overlap, chunks far below it lose importance.
class AdaptiveSizeOptimizer {
public:
    explicit AdaptiveSizeOptimizer(const ChunkingConfig& config) : config_(config) {}

    std::vector<FinalChunk> optimize(std::vector<FinalChunk> chunks) const;

    size_t optimal_size(const FinalChunk& chunk) const;

    // Sub-chunks of target_size characters sharing overlap_size characters,
    // ids suffixed with _0, _1, ...
    std::vector<FinalChunk> split(const FinalChunk& chunk, size_t target_size) const;

private:
    ChunkingConfig config_;
};

} // namespace visual_chunker
