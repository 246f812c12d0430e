#pragma once

#include <visual_chunker/types.h>
#include <string>
#include <vector>

namespace visual_chunker {

// Offsets describe the trimmed span inside the original content:
// content == original.substr(start_offset, end_offset - start_offset)

struct PageContent {
    int number = 0;
    std::string content;
    size_t start_offset = 0;
    size_t end_offset = 0;
    BoundingBox position;
};

struct SectionContent {
    std::string title;
    int level = 0;  // 0 = untitled preamble
    std::string content;
    size_t start_offset = 0;
    size_t end_offset = 0;
};

struct ContentBlock {
    std::string content;
    size_t start_offset = 0;
    size_t end_offset = 0;
};

// Exactly one of the three lists is populated (none for blank content)
struct DocumentStructure {
    std::vector<PageContent> pages;
    std::vector<SectionContent> sections;
    std::vector<ContentBlock> content_blocks;
};

class StructureParser {
public:
    // A4 in points
    static constexpr double kPageWidth = 595;
    static constexpr double kPageHeight = 842;

    explicit StructureParser(bool verbose = false) : verbose_(verbose) {}

    // Never throws for malformed content: a failing format parser falls
    // back to flat paragraph splitting.
    DocumentStructure parse(const std::string& content, DocumentType type) const;

    // Format parsers, exposed for testing. These may throw StructureParseError.
    std::vector<PageContent> parse_pages(const std::string& content) const;
    std::vector<SectionContent> parse_markup_sections(const std::string& content) const;
    std::vector<SectionContent> parse_paragraph_sections(const std::string& content) const;
    std::vector<ContentBlock> parse_blocks(const std::string& content) const;

private:
    bool verbose_;
};

} // namespace visual_chunker
