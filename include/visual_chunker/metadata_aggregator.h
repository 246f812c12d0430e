#pragma once

#include <visual_chunker/types.h>
#include <vector>

namespace visual_chunker {

class MetadataAggregator {
public:
    // Pure aggregation over the final chunk list
    static ChunkingMetadata aggregate(const std::vector<FinalChunk>& chunks, double processing_time_ms);
};

} // namespace visual_chunker
