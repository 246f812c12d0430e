#include <visual_chunker/visual_context.h>
#include <visual_chunker/errors.h>
#include <visual_chunker/text_metrics.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace visual_chunker {

namespace {

const double kDefaultVisualArea = 1000.0;
const double kTextAreaPerChar = 10.0;

bool contains_term(const std::string& lower_text, const std::optional<std::string>& term) {
    if (!term || term->empty()) return false;
    return lower_text.find(to_lower(*term)) != std::string::npos;
}

} // namespace

bool match_page_proximity(const RawChunk& chunk, const VisualElement& visual, const ChunkingConfig&) {
    if (!chunk.page_number || !visual.page_number) return false;
    return std::abs(*chunk.page_number - *visual.page_number) <= 1;
}

bool match_spatial_proximity(const RawChunk& chunk, const VisualElement& visual, const ChunkingConfig& config) {
    if (!chunk.position || !visual.bounding_box) return false;
    // Positions are page-local, so only compare them on the same page
    if (chunk.page_number && visual.page_number && *chunk.page_number != *visual.page_number) {
        return false;
    }

    double dx = chunk.position->center_x() - visual.bounding_box->center_x();
    double dy = chunk.position->center_y() - visual.bounding_box->center_y();
    return std::sqrt(dx * dx + dy * dy) <= config.visual_proximity_threshold;
}

bool match_textual_relevance(const RawChunk& chunk, const VisualElement& visual, const ChunkingConfig&) {
    if (!visual.title && !visual.description) return false;

    std::string lower_text = to_lower(chunk.content);
    return contains_term(lower_text, visual.title) || contains_term(lower_text, visual.description);
}

std::vector<VisualMatcher> default_visual_matchers() {
    return {match_page_proximity, match_spatial_proximity, match_textual_relevance};
}

void validate_visual(const VisualElement& visual) {
    if (!std::isfinite(visual.confidence)) {
        throw VisualEnhancementError("visual " + visual.id + " has a non-finite confidence");
    }
    if (visual.bounding_box) {
        const auto& box = *visual.bounding_box;
        if (!std::isfinite(box.x) || !std::isfinite(box.y) ||
            !std::isfinite(box.width) || !std::isfinite(box.height)) {
            throw VisualEnhancementError("visual " + visual.id + " has a non-finite bounding box");
        }
        if (box.width < 0 || box.height < 0) {
            throw VisualEnhancementError("visual " + visual.id + " has a negative bounding box size");
        }
    }
}

double calculate_visual_density(const std::string& content,
                                const std::vector<const VisualElement*>& visuals) {
    if (visuals.empty()) return 0.0;

    double visual_area = 0.0;
    for (const auto* visual : visuals) {
        visual_area += visual->bounding_box ? visual->bounding_box->area() : kDefaultVisualArea;
    }

    double text_area = content.size() * kTextAreaPerChar;
    if (visual_area + text_area <= 0.0) return 0.0;

    return std::clamp(visual_area / (visual_area + text_area), 0.0, 1.0);
}

SectionType section_type_for_density(double density) {
    if (density > 0.6) return SectionType::visual_heavy;
    if (density > 0.2) return SectionType::mixed;
    return SectionType::text;
}

void apply_visual_scores(FinalChunk& chunk) {
    chunk.visual_references.clear();
    for (const auto* visual : chunk.context.nearby_visuals) {
        chunk.visual_references.push_back(visual->id);
    }
    chunk.context.visual_density = calculate_visual_density(chunk.content, chunk.context.nearby_visuals);
    chunk.section_type = section_type_for_density(chunk.context.visual_density);
}

VisualContextEnhancer::VisualContextEnhancer(const ChunkingConfig& config, std::vector<VisualMatcher> matchers)
    : config_(config), matchers_(std::move(matchers)) {}

std::vector<FinalChunk> VisualContextEnhancer::enhance(std::vector<RawChunk> chunks,
                                                       const std::vector<VisualElement>& visuals) const {
    std::vector<FinalChunk> enhanced;
    enhanced.reserve(chunks.size());
    size_t visual_chunks = 0;

    for (auto& raw : chunks) {
        FinalChunk chunk;
        static_cast<RawChunk&>(chunk) = std::move(raw);

        if (config_.include_visual_context && !visuals.empty()) {
            chunk.context.nearby_visuals = find_nearby_visuals(chunk, visuals);
        }
        apply_visual_scores(chunk);

        chunk.context.semantic_boundaries = semantic_boundaries(chunk.content);
        chunk.context.readability_score = readability_score(chunk.content);
        chunk.context.importance = chunk_importance(chunk.content, chunk.context.nearby_visuals.size());

        if (!chunk.visual_references.empty()) visual_chunks++;
        enhanced.push_back(std::move(chunk));
    }

    if (config_.verbose) {
        std::cout << "[VisualContextEnhancer::enhance] " << visual_chunks << "/" << enhanced.size()
                  << " chunks have visual context" << std::endl;
    }

    return enhanced;
}

std::vector<const VisualElement*> VisualContextEnhancer::find_nearby_visuals(
    const RawChunk& chunk, const std::vector<VisualElement>& visuals) const {
    std::vector<const VisualElement*> nearby;

    for (const auto& visual : visuals) {
        try {
            validate_visual(visual);

            bool associated = std::any_of(matchers_.begin(), matchers_.end(),
                                          [&](const VisualMatcher& matcher) {
                                              return matcher(chunk, visual, config_);
                                          });
            if (associated) {
                nearby.push_back(&visual);
            }
        } catch (const VisualEnhancementError& e) {
            if (config_.verbose) {
                std::cout << "[VisualContextEnhancer::find_nearby_visuals] Skipping visual for "
                          << chunk.id << ": " << e.what() << std::endl;
            }
        }
    }

    return nearby;
}

} // namespace visual_chunker
