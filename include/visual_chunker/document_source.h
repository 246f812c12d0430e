#pragma once

#include <visual_chunker/types.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace visual_chunker {

// Output of the extraction side: document text plus detected visuals
struct SourceDocument {
    Document document;
    std::vector<VisualElement> visuals;
};

// Text and visual extraction collaborators. The chunker never calls these;
// callers load a SourceDocument and pass its parts to chunk_document().
class DocumentSource {
public:
    virtual ~DocumentSource() = default;
    virtual SourceDocument load(const std::string& path) = 0;
};

// {"name", "type", "content", "visuals": [...]}
class JsonDocumentSource : public DocumentSource {
public:
    SourceDocument load(const std::string& path) override;
};

// Plain text file with a declared type
class TextDocumentSource : public DocumentSource {
public:
    explicit TextDocumentSource(DocumentType type) : type_(type) {}
    SourceDocument load(const std::string& path) override;

private:
    DocumentType type_;
};

// MuPDF extraction: page text joined with form feeds, image blocks become
// visuals with page number and bounding box
class PdfDocumentSource : public DocumentSource {
public:
    PdfDocumentSource();
    ~PdfDocumentSource() override;

    SourceDocument load(const std::string& path) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Picks a source by extension (.json, .pdf, anything else is text).
// `type` overrides the document type for text input and defaults to flat.
std::unique_ptr<DocumentSource> make_document_source(const std::string& path,
                                                     std::optional<DocumentType> type = std::nullopt);

} // namespace visual_chunker
