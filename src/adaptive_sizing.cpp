#include <visual_chunker/adaptive_sizing.h>
#include <visual_chunker/text_metrics.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace visual_chunker {

namespace {

const double kVisualDenseThreshold = 0.5;
const double kVisualDenseFactor = 0.8;
const double kLowReadabilityThreshold = 0.3;
const double kLowReadabilityFactor = 0.7;
const double kSplitFactor = 1.5;
const double kUndersizedFactor = 0.5;
const double kUndersizedImportance = 0.5;

} // namespace

std::vector<FinalChunk> AdaptiveSizeOptimizer::optimize(std::vector<FinalChunk> chunks) const {
    std::vector<FinalChunk> optimized;
    optimized.reserve(chunks.size());
    size_t splits = 0;

    for (auto& chunk : chunks) {
        double target = static_cast<double>(optimal_size(chunk));
        double length = static_cast<double>(chunk.content.size());

        if (length > target * kSplitFactor) {
            for (auto& sub_chunk : split(chunk, static_cast<size_t>(target))) {
                optimized.push_back(std::move(sub_chunk));
            }
            splits++;
            continue;
        }

        if (length < target * kUndersizedFactor) {
            chunk.context.importance = std::min(chunk.context.importance, kUndersizedImportance);
        }
        optimized.push_back(std::move(chunk));
    }

    if (config_.verbose) {
        std::cout << "[AdaptiveSizeOptimizer::optimize] Split " << splits << " oversized chunks, "
                  << optimized.size() << " chunks total" << std::endl;
    }

    return optimized;
}

size_t AdaptiveSizeOptimizer::optimal_size(const FinalChunk& chunk) const {
    double size = static_cast<double>(config_.max_chunk_size);

    if (chunk.context.visual_density > kVisualDenseThreshold) {
        size *= kVisualDenseFactor;
    }
    if (chunk.context.readability_score < kLowReadabilityThreshold) {
        size *= kLowReadabilityFactor;
    }

    return std::max(static_cast<size_t>(std::round(size)), config_.min_chunk_size);
}

std::vector<FinalChunk> AdaptiveSizeOptimizer::split(const FinalChunk& chunk, size_t target_size) const {
    std::vector<FinalChunk> sub_chunks;
    const std::string& content = chunk.content;
    target_size = std::max<size_t>(target_size, 1);

    size_t offset = 0;
    while (offset < content.size()) {
        size_t end = std::min(offset + target_size, content.size());

        FinalChunk sub_chunk = chunk;
        sub_chunk.id = chunk.id + "_" + std::to_string(sub_chunks.size());
        sub_chunk.content = content.substr(offset, end - offset);
        // Merged content is not a verbatim slice of the document, so
        // offsets are approximate and clamped to the parent range
        size_t base = chunk.start_index + chunk.content_offset;
        sub_chunk.start_index = std::min(base + offset, chunk.end_index);
        sub_chunk.end_index = std::min(base + end, chunk.end_index);
        sub_chunk.content_offset = 0;
        sub_chunk.token_estimate = estimate_tokens(sub_chunk.content);
        sub_chunk.context.semantic_boundaries = semantic_boundaries(sub_chunk.content);
        sub_chunks.push_back(std::move(sub_chunk));

        if (end >= content.size()) break;

        size_t next = end > config_.overlap_size ? end - config_.overlap_size : 0;
        offset = next > offset ? next : end;
    }

    return sub_chunks;
}

} // namespace visual_chunker
