#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace visual_chunker {

enum class DocumentType {
    paginated,   // extracted PDF text with page-break markers
    markup,      // HTML-like content with heading tags
    structured,  // office document text, paragraph sections
    flat
};

// Accepts canonical names and file-type aliases ("pdf", "html", "docx", ...)
DocumentType document_type_from_string(const std::string& name);
std::string to_string(DocumentType type);

struct BoundingBox {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    double area() const { return width * height; }
    double center_x() const { return x + width / 2; }
    double center_y() const { return y + height / 2; }
};

struct VisualElement {
    std::string id;
    std::string type;  // image, chart, table, graph, diagram
    std::optional<int> page_number;
    std::optional<BoundingBox> bounding_box;
    std::optional<std::string> title;
    std::optional<std::string> description;
    double confidence = 1.0;
};

// Borrowed by the chunker for the duration of one call
struct Document {
    std::string name;
    std::string content;
    DocumentType type = DocumentType::flat;
};

struct RawChunk {
    std::string id;
    std::string content;
    size_t start_index = 0;
    size_t end_index = 0;
    // Whitespace trimmed between start_index and the first content character
    size_t content_offset = 0;
    std::optional<int> page_number;
    std::optional<int> section_index;
    std::optional<std::string> section_title;
    std::optional<BoundingBox> position;
    size_t token_estimate = 0;
};

enum class SectionType {
    text,
    mixed,
    visual_heavy
};

std::string to_string(SectionType type);

struct ChunkContext {
    // Points into the visuals passed to chunk_document(), never owned
    std::vector<const VisualElement*> nearby_visuals;
    std::vector<std::string> semantic_boundaries;
    double importance = 0.5;
    double readability_score = 0.5;
    double visual_density = 0.0;
};

struct FinalChunk : RawChunk {
    std::vector<std::string> visual_references;
    SectionType section_type = SectionType::text;
    ChunkContext context;
    bool merged = false;
};

struct ChunkingMetadata {
    size_t total_chunks = 0;
    size_t average_chunk_size = 0;
    size_t visual_context_chunks = 0;
    std::map<int, size_t> page_distribution;
    double processing_time_ms = 0;
};

struct ChunkingResult {
    std::vector<FinalChunk> chunks;
    ChunkingMetadata metadata;
    std::string error;  // Empty if successful
};

} // namespace visual_chunker
