#pragma once

#include <cstddef>

namespace visual_chunker {

// Configuration for visual-aware chunking. Sizes are in characters.
struct ChunkingConfig {
    size_t max_chunk_size = 1000;
    size_t min_chunk_size = 200;
    size_t overlap_size = 150;
    bool preserve_page_boundaries = true;
    bool include_visual_context = true;
    bool semantic_boundary_detection = true;
    bool adaptive_chunk_sizing = true;
    double visual_proximity_threshold = 100.0;  // position units
    bool verbose = false;

    // Throws std::invalid_argument
    void validate() const;
};

} // namespace visual_chunker
