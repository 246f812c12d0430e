#include <visual_chunker/metadata_aggregator.h>
#include <cmath>

namespace visual_chunker {

ChunkingMetadata MetadataAggregator::aggregate(const std::vector<FinalChunk>& chunks,
                                               double processing_time_ms) {
    ChunkingMetadata metadata;
    metadata.total_chunks = chunks.size();
    metadata.processing_time_ms = processing_time_ms;

    size_t total_size = 0;
    for (const auto& chunk : chunks) {
        total_size += chunk.content.size();
        if (chunk.page_number) {
            metadata.page_distribution[*chunk.page_number]++;
        }
        if (!chunk.visual_references.empty()) {
            metadata.visual_context_chunks++;
        }
    }

    if (!chunks.empty()) {
        metadata.average_chunk_size = static_cast<size_t>(
            std::round(static_cast<double>(total_size) / chunks.size()));
    }

    return metadata;
}

} // namespace visual_chunker
