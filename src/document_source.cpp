#include <visual_chunker/document_source.h>
#include <visual_chunker/json_serializer.h>
#include <visual_chunker/text_metrics.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace visual_chunker {

namespace {

std::string read_file(const std::string& path) {
    if (!fs::exists(path)) {
        throw std::runtime_error("Input file not found: " + path);
    }

    std::ifstream file(path, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

SourceDocument JsonDocumentSource::load(const std::string& path) {
    std::string text = read_file(path);

    try {
        auto json = nlohmann::json::parse(text);

        SourceDocument source;
        source.document.name = json.value("name", fs::path(path).stem().string());
        source.document.type = document_type_from_string(json.value("type", std::string("flat")));
        source.document.content = json.at("content").get<std::string>();

        if (json.contains("visuals")) {
            source.visuals = json["visuals"].get<std::vector<VisualElement>>();
        }
        return source;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid document JSON " + path + ": " + e.what());
    }
}

SourceDocument TextDocumentSource::load(const std::string& path) {
    SourceDocument source;
    source.document.name = fs::path(path).filename().string();
    source.document.type = type_;
    source.document.content = read_file(path);
    return source;
}

std::unique_ptr<DocumentSource> make_document_source(const std::string& path,
                                                     std::optional<DocumentType> type) {
    std::string extension = to_lower(fs::path(path).extension().string());

    if (extension == ".json") {
        return std::make_unique<JsonDocumentSource>();
    }
    if (extension == ".pdf") {
        return std::make_unique<PdfDocumentSource>();
    }
    if (!type) {
        if (extension == ".html" || extension == ".htm") {
            type = DocumentType::markup;
        } else {
            type = DocumentType::flat;
        }
    }
    return std::make_unique<TextDocumentSource>(*type);
}

} // namespace visual_chunker
