#include <visual_chunker/types.h>
#include <visual_chunker/chunking_config.h>
#include <visual_chunker/text_metrics.h>
#include <stdexcept>

namespace visual_chunker {

DocumentType document_type_from_string(const std::string& name) {
    std::string type = to_lower(trim(name));

    if (type == "paginated" || type == "pdf") return DocumentType::paginated;
    if (type == "markup" || type == "html" || type == "htm") return DocumentType::markup;
    if (type == "structured" || type == "docx" || type == "doc" || type == "odt") {
        return DocumentType::structured;
    }
    return DocumentType::flat;
}

std::string to_string(DocumentType type) {
    switch (type) {
        case DocumentType::paginated: return "paginated";
        case DocumentType::markup: return "markup";
        case DocumentType::structured: return "structured";
        case DocumentType::flat: return "flat";
    }
    return "flat";
}

std::string to_string(SectionType type) {
    switch (type) {
        case SectionType::text: return "text";
        case SectionType::mixed: return "mixed";
        case SectionType::visual_heavy: return "visual-heavy";
    }
    return "text";
}

void ChunkingConfig::validate() const {
    if (max_chunk_size == 0) {
        throw std::invalid_argument("maxChunkSize must be positive");
    }
    if (min_chunk_size > max_chunk_size) {
        throw std::invalid_argument("minChunkSize cannot be greater than maxChunkSize");
    }
    if (!(visual_proximity_threshold >= 0)) {
        throw std::invalid_argument("visualProximityThreshold cannot be negative");
    }
}

} // namespace visual_chunker
