#pragma once

#include <visual_chunker/chunking_config.h>
#include <visual_chunker/structure_parser.h>
#include <visual_chunker/types.h>
#include <string>
#include <vector>

namespace visual_chunker {

// Walks a parsed structure and emits raw chunks bounded by max_chunk_size.
// Offsets index the original document content.
class ChunkSplitter {
public:
    explicit ChunkSplitter(const ChunkingConfig& config) : config_(config) {}

    std::vector<RawChunk> split(const DocumentStructure& structure, const std::string& content) const;

    // Word accumulation over content[begin, end), used for pages.
    // Consecutive chunks overlap on whole words.
    std::vector<RawChunk> split_words(const std::string& content, size_t begin, size_t end) const;

    // Fixed window over content[begin, end) ending at the last '.' when one
    // leaves at least min_chunk_size characters, used for sections and flat text.
    std::vector<RawChunk> split_window(const std::string& content, size_t begin, size_t end) const;

private:
    ChunkingConfig config_;
};

} // namespace visual_chunker
