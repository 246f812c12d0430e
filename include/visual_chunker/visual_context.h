#pragma once

#include <visual_chunker/chunking_config.h>
#include <visual_chunker/types.h>
#include <functional>
#include <vector>

namespace visual_chunker {

// Decides whether a visual belongs with a chunk. A visual is associated when
// any matcher accepts it. Matchers may throw VisualEnhancementError.
using VisualMatcher = std::function<bool(const RawChunk&, const VisualElement&, const ChunkingConfig&)>;

// Both page numbers known and at most one page apart
bool match_page_proximity(const RawChunk& chunk, const VisualElement& visual, const ChunkingConfig& config);

// Both positions known; distance between the chunk position center and the
// bounding box center is within visual_proximity_threshold
bool match_spatial_proximity(const RawChunk& chunk, const VisualElement& visual, const ChunkingConfig& config);

// Title or description appears in the chunk text, case-insensitive
bool match_textual_relevance(const RawChunk& chunk, const VisualElement& visual, const ChunkingConfig& config);

std::vector<VisualMatcher> default_visual_matchers();

// Throws VisualEnhancementError for non-finite or negative geometry
void validate_visual(const VisualElement& visual);

// visual_area / (visual_area + content_length * 10), 1000 units^2 per visual
// without bounding box
double calculate_visual_density(const std::string& content,
                                const std::vector<const VisualElement*>& visuals);

SectionType section_type_for_density(double density);

// Refreshes visual_references, visual_density and section_type from
// chunk.context.nearby_visuals
void apply_visual_scores(FinalChunk& chunk);

class VisualContextEnhancer {
public:
    explicit VisualContextEnhancer(const ChunkingConfig& config,
                                   std::vector<VisualMatcher> matchers = default_visual_matchers());

    std::vector<FinalChunk> enhance(std::vector<RawChunk> chunks,
                                    const std::vector<VisualElement>& visuals) const;

    std::vector<const VisualElement*> find_nearby_visuals(const RawChunk& chunk,
                                                          const std::vector<VisualElement>& visuals) const;

private:
    ChunkingConfig config_;
    std::vector<VisualMatcher> matchers_;
};

} // namespace visual_chunker
