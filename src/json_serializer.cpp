#include <visual_chunker/json_serializer.h>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace visual_chunker {

namespace {

size_t read_size(const nlohmann::json& j, const char* key, size_t current) {
    if (!j.contains(key)) return current;

    long long value = j.at(key).get<long long>();
    if (value < 0) {
        throw std::invalid_argument(std::string(key) + " cannot be negative");
    }
    return static_cast<size_t>(value);
}

template <typename Writer>
void write_string(Writer& writer, const std::string& value) {
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

template <typename Writer>
void write_optional_int(Writer& writer, const std::optional<int>& value) {
    if (value) {
        writer.Int(*value);
    } else {
        writer.Null();
    }
}

template <typename Writer>
void write_chunk(Writer& writer, const FinalChunk& chunk) {
    writer.StartObject();
    writer.Key("id");
    write_string(writer, chunk.id);
    writer.Key("content");
    write_string(writer, chunk.content);
    writer.Key("startIndex");
    writer.Uint64(chunk.start_index);
    writer.Key("endIndex");
    writer.Uint64(chunk.end_index);
    writer.Key("pageNumber");
    write_optional_int(writer, chunk.page_number);
    writer.Key("sectionIndex");
    write_optional_int(writer, chunk.section_index);
    writer.Key("sectionTitle");
    if (chunk.section_title) {
        write_string(writer, *chunk.section_title);
    } else {
        writer.Null();
    }
    writer.Key("tokenCount");
    writer.Uint64(chunk.token_estimate);

    writer.Key("visualReferences");
    writer.StartArray();
    for (const auto& reference : chunk.visual_references) {
        write_string(writer, reference);
    }
    writer.EndArray();

    writer.Key("sectionType");
    write_string(writer, to_string(chunk.section_type));
    writer.Key("merged");
    writer.Bool(chunk.merged);

    writer.Key("contextualMetadata");
    writer.StartObject();
    writer.Key("semanticBoundaries");
    writer.StartArray();
    for (const auto& boundary : chunk.context.semantic_boundaries) {
        write_string(writer, boundary);
    }
    writer.EndArray();
    writer.Key("importance");
    writer.Double(chunk.context.importance);
    writer.Key("readabilityScore");
    writer.Double(chunk.context.readability_score);
    writer.Key("visualDensity");
    writer.Double(chunk.context.visual_density);
    writer.EndObject();

    writer.EndObject();
}

template <typename Writer>
void write_result(Writer& writer, const ChunkingResult& result, const std::string& document_name) {
    writer.StartObject();

    if (!document_name.empty()) {
        writer.Key("document");
        write_string(writer, document_name);
    }

    writer.Key("chunks");
    writer.StartArray();
    for (const auto& chunk : result.chunks) {
        write_chunk(writer, chunk);
    }
    writer.EndArray();

    const auto& metadata = result.metadata;
    writer.Key("metadata");
    writer.StartObject();
    writer.Key("totalChunks");
    writer.Uint64(metadata.total_chunks);
    writer.Key("averageChunkSize");
    writer.Uint64(metadata.average_chunk_size);
    writer.Key("visualContextChunks");
    writer.Uint64(metadata.visual_context_chunks);
    writer.Key("pageDistribution");
    writer.StartObject();
    for (const auto& [page, count] : metadata.page_distribution) {
        write_string(writer, std::to_string(page));
        writer.Uint64(count);
    }
    writer.EndObject();
    writer.Key("processingTime");
    writer.Double(metadata.processing_time_ms);
    writer.EndObject();

    if (!result.error.empty()) {
        writer.Key("error");
        write_string(writer, result.error);
    }

    writer.EndObject();
}

} // namespace

void to_json(nlohmann::json& j, const BoundingBox& box) {
    j = {{"x", box.x}, {"y", box.y}, {"width", box.width}, {"height", box.height}};
}

void from_json(const nlohmann::json& j, BoundingBox& box) {
    box.x = j.at("x").get<double>();
    box.y = j.at("y").get<double>();
    box.width = j.at("width").get<double>();
    box.height = j.at("height").get<double>();
}

void to_json(nlohmann::json& j, const VisualElement& visual) {
    j = {{"id", visual.id}, {"type", visual.type}};
    if (visual.title) j["title"] = *visual.title;
    if (visual.description) j["description"] = *visual.description;

    nlohmann::json metadata = {{"confidence", visual.confidence}};
    if (visual.page_number) metadata["pageNumber"] = *visual.page_number;
    if (visual.bounding_box) metadata["boundingBox"] = *visual.bounding_box;
    j["metadata"] = metadata;
}

void from_json(const nlohmann::json& j, VisualElement& visual) {
    visual.id = j.at("id").get<std::string>();
    visual.type = j.value("type", std::string("image"));
    if (j.contains("title") && j["title"].is_string()) visual.title = j["title"].get<std::string>();
    if (j.contains("description") && j["description"].is_string()) {
        visual.description = j["description"].get<std::string>();
    }

    // Flat layout is accepted as well as the nested "metadata" one
    const nlohmann::json& metadata = j.contains("metadata") && j["metadata"].is_object() ? j["metadata"] : j;

    if (metadata.contains("pageNumber") && metadata["pageNumber"].is_number_integer()) {
        visual.page_number = metadata["pageNumber"].get<int>();
    }
    if (metadata.contains("confidence") && metadata["confidence"].is_number()) {
        visual.confidence = metadata["confidence"].get<double>();
    }
    if (metadata.contains("boundingBox") && !metadata["boundingBox"].is_null()) {
        try {
            visual.bounding_box = metadata["boundingBox"].get<BoundingBox>();
        } catch (const nlohmann::json::exception&) {
            double nan = std::numeric_limits<double>::quiet_NaN();
            visual.bounding_box = BoundingBox{nan, nan, nan, nan};
        }
    }
}

void to_json(nlohmann::json& j, const ChunkingConfig& config) {
    j = {
        {"maxChunkSize", config.max_chunk_size},
        {"minChunkSize", config.min_chunk_size},
        {"overlapSize", config.overlap_size},
        {"preservePageBoundaries", config.preserve_page_boundaries},
        {"includeVisualContext", config.include_visual_context},
        {"semanticBoundaryDetection", config.semantic_boundary_detection},
        {"adaptiveChunkSizing", config.adaptive_chunk_sizing},
        {"visualProximityThreshold", config.visual_proximity_threshold},
        {"verbose", config.verbose}
    };
}

void from_json(const nlohmann::json& j, ChunkingConfig& config) {
    config.max_chunk_size = read_size(j, "maxChunkSize", config.max_chunk_size);
    config.min_chunk_size = read_size(j, "minChunkSize", config.min_chunk_size);
    config.overlap_size = read_size(j, "overlapSize", config.overlap_size);
    config.preserve_page_boundaries = j.value("preservePageBoundaries", config.preserve_page_boundaries);
    config.include_visual_context = j.value("includeVisualContext", config.include_visual_context);
    config.semantic_boundary_detection = j.value("semanticBoundaryDetection", config.semantic_boundary_detection);
    config.adaptive_chunk_sizing = j.value("adaptiveChunkSizing", config.adaptive_chunk_sizing);
    config.visual_proximity_threshold = j.value("visualProximityThreshold", config.visual_proximity_threshold);
    config.verbose = j.value("verbose", config.verbose);
}

std::string JsonSerializer::serialize_result(const ChunkingResult& result,
                                             const std::string& document_name,
                                             bool pretty) {
    rapidjson::StringBuffer buffer;

    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        write_result(writer, result, document_name);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        write_result(writer, result, document_name);
    }

    return std::string(buffer.GetString(), buffer.GetSize());
}

ChunkingConfig JsonSerializer::load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Config file not found: " + path);
    }

    try {
        return nlohmann::json::parse(file).get<ChunkingConfig>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }
}

} // namespace visual_chunker
