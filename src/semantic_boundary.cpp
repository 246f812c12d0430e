#include <visual_chunker/semantic_boundary.h>
#include <visual_chunker/text_metrics.h>
#include <visual_chunker/visual_context.h>
#include <algorithm>
#include <iostream>

namespace visual_chunker {

const double kMergeTolerance = 1.2;

std::vector<FinalChunk> SemanticBoundaryOptimizer::optimize(std::vector<FinalChunk> chunks) const {
    std::vector<FinalChunk> optimized;
    optimized.reserve(chunks.size());
    size_t merges = 0;

    for (size_t i = 0; i < chunks.size(); ++i) {
        if (i + 1 < chunks.size() && is_at_poor_boundary(chunks[i].content) &&
            can_merge(chunks[i], chunks[i + 1])) {
            optimized.push_back(merge(chunks[i], chunks[i + 1]));
            merges++;
            i++;  // Next chunk is consumed by the merge
            continue;
        }
        optimized.push_back(std::move(chunks[i]));
    }

    if (config_.verbose) {
        std::cout << "[SemanticBoundaryOptimizer::optimize] Merged " << merges
                  << " chunk pairs at poor boundaries" << std::endl;
    }

    return optimized;
}

bool SemanticBoundaryOptimizer::can_merge(const FinalChunk& first, const FinalChunk& second) const {
    if (config_.preserve_page_boundaries && first.page_number && second.page_number &&
        *first.page_number != *second.page_number) {
        return false;
    }

    double combined = static_cast<double>(first.content.size() + 1 + second.content.size());
    return combined <= config_.max_chunk_size * kMergeTolerance;
}

FinalChunk SemanticBoundaryOptimizer::merge(const FinalChunk& first, const FinalChunk& second) {
    FinalChunk merged = first;
    merged.content = first.content + " " + second.content;
    merged.end_index = std::max(first.end_index, second.end_index);
    merged.token_estimate = estimate_tokens(merged.content);
    merged.merged = true;

    for (const auto* visual : second.context.nearby_visuals) {
        auto& nearby = merged.context.nearby_visuals;
        if (std::find(nearby.begin(), nearby.end(), visual) == nearby.end()) {
            nearby.push_back(visual);
        }
    }
    apply_visual_scores(merged);

    merged.context.semantic_boundaries = semantic_boundaries(merged.content);
    merged.context.readability_score = readability_score(merged.content);
    merged.context.importance = std::max(first.context.importance, second.context.importance);

    return merged;
}

} // namespace visual_chunker
