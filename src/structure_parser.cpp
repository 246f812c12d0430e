#include <visual_chunker/structure_parser.h>
#include <visual_chunker/errors.h>
#include <visual_chunker/text_metrics.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>

namespace visual_chunker {

namespace {

using Span = std::pair<size_t, size_t>;

// Paragraph spans separated by blank lines (newline, optional horizontal
// whitespace, newline). Spans are trimmed and blank ones dropped.
std::vector<Span> split_paragraphs(const std::string& content) {
    std::vector<Span> paragraphs;
    size_t start = 0;
    size_t i = 0;

    auto flush = [&](size_t end) {
        auto span = trim_span(content, start, end);
        if (span.first < span.second) {
            paragraphs.push_back(span);
        }
    };

    while (i < content.size()) {
        if (content[i] == '\n') {
            size_t j = i + 1;
            while (j < content.size() && (content[j] == ' ' || content[j] == '\t' || content[j] == '\r')) {
                ++j;
            }
            if (j < content.size() && content[j] == '\n') {
                flush(i);
                start = j + 1;
                i = j + 1;
                continue;
            }
        }
        ++i;
    }
    flush(content.size());

    return paragraphs;
}

bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool is_word_char(char c) {
    return is_alnum(c) || c == '_';
}

// "Page N" header lines name their page; form feeds and \page only separate
bool is_page_header(const std::string& content, const Span& marker) {
    for (size_t i = marker.first; i < marker.second; ++i) {
        if (!std::isspace(static_cast<unsigned char>(content[i]))) {
            return content[i] == 'p' || content[i] == 'P';
        }
    }
    return false;
}

std::vector<Span> find_page_markers(const std::string& content) {
    static const std::regex page_line("^\\s*page\\s+\\d+(\\s+of\\s+\\d+)?\\s*$", std::regex::icase);

    std::vector<Span> markers;

    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\f') {
            markers.emplace_back(i, i + 1);
        } else if (content.compare(i, 5, "\\page") == 0 &&
                   (i + 5 == content.size() || !is_alnum(content[i + 5]))) {
            markers.emplace_back(i, i + 5);
        }
    }

    size_t line_start = 0;
    while (line_start < content.size()) {
        size_t line_end = content.find('\n', line_start);
        if (line_end == std::string::npos) line_end = content.size();

        // Marker lines are short; skip the regex for prose
        if (line_end - line_start < 40) {
            std::string line = content.substr(line_start, line_end - line_start);
            if (std::regex_match(line, page_line)) {
                markers.emplace_back(line_start, line_end);
            }
        }
        line_start = line_end + 1;
    }

    std::sort(markers.begin(), markers.end());

    // A form feed can sit inside a "Page N" line; keep the outer marker
    std::vector<Span> merged;
    for (const auto& marker : markers) {
        if (!merged.empty() && marker.first < merged.back().second) {
            merged.back().second = std::max(merged.back().second, marker.second);
        } else {
            merged.push_back(marker);
        }
    }
    return merged;
}

std::string strip_tags(const std::string& html) {
    std::string text;
    bool in_tag = false;
    for (char c : html) {
        if (c == '<') {
            in_tag = true;
        } else if (c == '>') {
            in_tag = false;
        } else if (!in_tag) {
            text += c;
        }
    }
    return trim(text);
}

} // namespace

DocumentStructure StructureParser::parse(const std::string& content, DocumentType type) const {
    DocumentStructure structure;

    try {
        switch (type) {
            case DocumentType::paginated:
                structure.pages = parse_pages(content);
                break;
            case DocumentType::markup:
                structure.sections = parse_markup_sections(content);
                break;
            case DocumentType::structured:
                structure.sections = parse_paragraph_sections(content);
                break;
            case DocumentType::flat:
                structure.content_blocks = parse_blocks(content);
                break;
        }
    } catch (const std::exception& e) {
        if (verbose_) {
            std::cout << "[StructureParser::parse] " << to_string(type)
                      << " parsing failed, falling back to flat text: " << e.what() << std::endl;
        }
        structure = DocumentStructure{};
        structure.content_blocks = parse_blocks(content);
    }

    return structure;
}

std::vector<PageContent> StructureParser::parse_pages(const std::string& content) const {
    std::vector<PageContent> pages;
    auto markers = find_page_markers(content);

    std::vector<Span> segments;
    size_t previous = 0;
    for (const auto& [marker_start, marker_end] : markers) {
        segments.emplace_back(previous, marker_start);
        previous = marker_end;
    }
    segments.emplace_back(previous, content.size());

    // Blank text before a leading "Page N" header is not a page. Before a
    // separator it is an empty first page and keeps its number.
    if (!markers.empty() && is_page_header(content, markers.front())) {
        auto leading = trim_span(content, segments.front().first, segments.front().second);
        if (leading.first == leading.second) {
            segments.erase(segments.begin());
        }
    }

    int number = 0;
    for (const auto& [segment_start, segment_end] : segments) {
        number++;
        auto [start, end] = trim_span(content, segment_start, segment_end);
        if (start == end) continue;

        PageContent page;
        page.number = number;
        page.content = content.substr(start, end - start);
        page.start_offset = start;
        page.end_offset = end;
        page.position = BoundingBox{0, 0, kPageWidth, kPageHeight};
        pages.push_back(std::move(page));
    }

    return pages;
}

std::vector<SectionContent> StructureParser::parse_markup_sections(const std::string& content) const {
    struct Heading {
        int level;
        std::string title;
        size_t open_start;
        size_t close_end;
    };

    std::vector<Heading> headings;
    const std::string lower = to_lower(content);
    size_t position = 0;

    while (true) {
        size_t open_start = lower.find("<h", position);
        if (open_start == std::string::npos) break;

        // Opening tag: <h1>..<h6> followed by '>' or attributes
        size_t digit = open_start + 2;
        if (digit >= lower.size() || lower[digit] < '1' || lower[digit] > '6' ||
            (digit + 1 < lower.size() && is_word_char(lower[digit + 1]))) {
            position = open_start + 2;
            continue;
        }
        size_t open_end = lower.find('>', digit);
        if (open_end == std::string::npos) break;

        size_t body_start = open_end + 1;
        std::string level(1, lower[digit]);

        size_t close_start = lower.find("</h" + level, body_start);
        size_t close_end = close_start == std::string::npos ? close_start : lower.find('>', close_start);
        if (close_end == std::string::npos) {
            throw StructureParseError("unterminated <h" + level + "> heading at offset " +
                                      std::to_string(open_start));
        }
        close_end++;

        headings.push_back({std::stoi(level),
                            strip_tags(content.substr(body_start, close_start - body_start)),
                            open_start, close_end});
        position = close_end;
    }

    std::vector<SectionContent> sections;
    auto add_section = [&](const std::string& title, int level, size_t from, size_t to) {
        auto [start, end] = trim_span(content, from, to);
        if (start == end) return;

        SectionContent section;
        section.title = title;
        section.level = level;
        section.content = content.substr(start, end - start);
        section.start_offset = start;
        section.end_offset = end;
        sections.push_back(std::move(section));
    };

    add_section("", 0, 0, headings.empty() ? content.size() : headings.front().open_start);
    for (size_t i = 0; i < headings.size(); ++i) {
        size_t body_end = i + 1 < headings.size() ? headings[i + 1].open_start : content.size();
        add_section(headings[i].title, headings[i].level, headings[i].close_end, body_end);
    }

    return sections;
}

std::vector<SectionContent> StructureParser::parse_paragraph_sections(const std::string& content) const {
    std::vector<SectionContent> sections;

    for (const auto& [start, end] : split_paragraphs(content)) {
        SectionContent section;
        section.title = "Section " + std::to_string(sections.size() + 1);
        section.level = 1;
        section.content = content.substr(start, end - start);
        section.start_offset = start;
        section.end_offset = end;
        sections.push_back(std::move(section));
    }

    return sections;
}

std::vector<ContentBlock> StructureParser::parse_blocks(const std::string& content) const {
    std::vector<ContentBlock> blocks;
    for (const auto& [start, end] : split_paragraphs(content)) {
        blocks.push_back({content.substr(start, end - start), start, end});
    }
    return blocks;
}

} // namespace visual_chunker
