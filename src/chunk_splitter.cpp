#include <visual_chunker/chunk_splitter.h>
#include <visual_chunker/text_metrics.h>
#include <algorithm>
#include <cctype>
#include <iostream>

namespace visual_chunker {

namespace {

using Span = std::pair<size_t, size_t>;

// Non-whitespace runs of content[begin, end); runs longer than max_len are
// cut into max_len pieces so that every word fits in a chunk.
std::vector<Span> find_words(const std::string& content, size_t begin, size_t end, size_t max_len) {
    std::vector<Span> words;
    size_t i = begin;

    while (i < end) {
        while (i < end && std::isspace(static_cast<unsigned char>(content[i]))) ++i;
        size_t word_start = i;
        while (i < end && !std::isspace(static_cast<unsigned char>(content[i]))) ++i;

        for (size_t piece = word_start; piece < i; piece += max_len) {
            words.emplace_back(piece, std::min(piece + max_len, i));
        }
    }

    return words;
}

RawChunk make_chunk(const std::string& content, size_t text_start, size_t text_end,
                    size_t range_start, size_t range_end) {
    RawChunk chunk;
    chunk.content = content.substr(text_start, text_end - text_start);
    chunk.start_index = range_start;
    chunk.end_index = range_end;
    chunk.content_offset = text_start - range_start;
    chunk.token_estimate = estimate_tokens(chunk.content);
    return chunk;
}

} // namespace

std::vector<RawChunk> ChunkSplitter::split(const DocumentStructure& structure,
                                           const std::string& content) const {
    std::vector<RawChunk> chunks;

    if (!structure.pages.empty()) {
        for (const auto& page : structure.pages) {
            for (auto& chunk : split_words(content, page.start_offset, page.end_offset)) {
                chunk.page_number = page.number;
                chunk.position = page.position;
                chunks.push_back(std::move(chunk));
            }
        }
    } else if (!structure.sections.empty()) {
        for (size_t i = 0; i < structure.sections.size(); ++i) {
            const auto& section = structure.sections[i];
            for (auto& chunk : split_window(content, section.start_offset, section.end_offset)) {
                chunk.section_index = static_cast<int>(i);
                if (!section.title.empty()) {
                    chunk.section_title = section.title;
                }
                chunks.push_back(std::move(chunk));
            }
        }
    } else if (!structure.content_blocks.empty()) {
        // Flat text is one region from the first block to the last
        chunks = split_window(content, structure.content_blocks.front().start_offset,
                              structure.content_blocks.back().end_offset);
    }

    for (size_t i = 0; i < chunks.size(); ++i) {
        chunks[i].id = "chunk_" + std::to_string(i);
    }

    if (config_.verbose) {
        std::cout << "[ChunkSplitter::split] Created " << chunks.size() << " raw chunks" << std::endl;
    }

    return chunks;
}

std::vector<RawChunk> ChunkSplitter::split_words(const std::string& content, size_t begin, size_t end) const {
    std::vector<RawChunk> chunks;
    const size_t max_size = config_.max_chunk_size;
    const size_t overlap = config_.overlap_size;
    auto words = find_words(content, begin, std::min(end, content.size()), max_size);

    size_t first = 0;
    while (first < words.size()) {
        size_t last = first;
        while (last + 1 < words.size() && words[last + 1].second - words[first].first <= max_size) {
            ++last;
        }

        size_t chunk_start = words[first].first;
        size_t chunk_end = words[last].second;
        chunks.push_back(make_chunk(content, chunk_start, chunk_end, chunk_start, chunk_end));

        if (last + 1 >= words.size()) break;

        size_t next = last + 1;
        if (overlap > 0) {
            size_t boundary = chunk_end > overlap ? chunk_end - overlap : 0;
            size_t candidate = first + 1;
            while (candidate <= last && words[candidate].first < boundary) ++candidate;
            // Overlap words must leave room for the next new word
            while (candidate <= last && words[last + 1].second - words[candidate].first > max_size) {
                ++candidate;
            }
            next = candidate;
        }
        first = next;
    }

    return chunks;
}

std::vector<RawChunk> ChunkSplitter::split_window(const std::string& content, size_t begin, size_t end) const {
    std::vector<RawChunk> chunks;
    const size_t max_size = config_.max_chunk_size;
    const size_t min_size = config_.min_chunk_size;
    const size_t overlap = config_.overlap_size;
    end = std::min(end, content.size());

    size_t current = begin;
    while (current < end) {
        size_t window_end = std::min(current + max_size, end);
        size_t actual_end = window_end;

        if (window_end < end) {
            size_t text_start = trim_span(content, current, window_end).first;
            size_t search_floor = std::max(current, text_start + std::max<size_t>(min_size, 1) - 1);
            for (size_t i = window_end; i > search_floor; --i) {
                if (content[i - 1] == '.') {
                    actual_end = i;
                    break;
                }
            }
        }

        auto [text_start, text_end] = trim_span(content, current, actual_end);
        if (text_start < text_end) {
            chunks.push_back(make_chunk(content, text_start, text_end, current, actual_end));
        }

        if (actual_end >= end) break;

        size_t next = actual_end > overlap ? actual_end - overlap : 0;
        if (next <= current) {
            next = actual_end;
        }
        current = next;
    }

    return chunks;
}

} // namespace visual_chunker
