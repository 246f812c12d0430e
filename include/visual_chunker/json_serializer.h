#pragma once

#include <visual_chunker/chunking_config.h>
#include <visual_chunker/types.h>
#include <string>
#include <nlohmann/json.hpp>

namespace visual_chunker {

// nlohmann_json conversions. Visual metadata uses the nested layout of the
// extraction service: {"id", "type", "title", "description",
// "metadata": {"pageNumber", "boundingBox": {x, y, width, height}, "confidence"}}.
// A bounding box that is present but malformed is kept as NaN geometry so the
// enhancer skips that visual instead of failing the whole document.
void to_json(nlohmann::json& j, const BoundingBox& box);
void from_json(const nlohmann::json& j, BoundingBox& box);
void to_json(nlohmann::json& j, const VisualElement& visual);
void from_json(const nlohmann::json& j, VisualElement& visual);

// camelCase keys named after the options (maxChunkSize, overlapSize, ...)
void to_json(nlohmann::json& j, const ChunkingConfig& config);
void from_json(const nlohmann::json& j, ChunkingConfig& config);

class JsonSerializer {
public:
    // {"document", "chunks": [...], "metadata": {...}} written with RapidJSON
    static std::string serialize_result(const ChunkingResult& result,
                                        const std::string& document_name = "",
                                        bool pretty = false);

    // Throws std::runtime_error when the file is missing or not valid JSON
    static ChunkingConfig load_config(const std::string& path);
};

} // namespace visual_chunker
