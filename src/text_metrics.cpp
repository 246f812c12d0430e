#include <visual_chunker/text_metrics.h>
#include <algorithm>
#include <cctype>

namespace visual_chunker {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_sentence_terminator(char c) {
    return c == '.' || c == '!' || c == '?';
}

// Splits on runs of . ! ? and keeps the pieces that contain non-whitespace.
// Each piece remembers its position among all pieces, empty ones included.
std::vector<std::pair<size_t, std::string>> split_sentences(const std::string& text) {
    std::vector<std::pair<size_t, std::string>> sentences;
    size_t piece_index = 0;
    size_t start = 0;
    size_t i = 0;

    while (i <= text.size()) {
        if (i == text.size() || is_sentence_terminator(text[i])) {
            std::string piece = text.substr(start, i - start);
            if (!trim(piece).empty()) {
                sentences.emplace_back(piece_index, piece);
            }
            piece_index++;
            while (i < text.size() && is_sentence_terminator(text[i])) {
                ++i;
            }
            start = i;
            if (i == text.size()) break;
            continue;
        }
        ++i;
    }

    return sentences;
}

} // namespace

std::pair<size_t, size_t> trim_span(const std::string& text, size_t begin, size_t end) {
    end = std::min(end, text.size());
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
    if (begin == end) return {end, end};
    return {begin, end};
}

std::string trim(const std::string& text) {
    auto [begin, end] = trim_span(text, 0, text.size());
    return text.substr(begin, end - begin);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

size_t count_words(const std::string& text) {
    size_t words = 0;
    bool in_word = false;
    for (char c : text) {
        if (is_space(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            words++;
        }
    }
    return words;
}

size_t estimate_tokens(const std::string& text) {
    // Integer form of ceil(words * 1.3)
    return (count_words(text) * 13 + 9) / 10;
}

double readability_score(const std::string& text) {
    auto sentences = split_sentences(text);
    if (sentences.empty()) {
        return 1.0;
    }

    double avg_sentence_length = static_cast<double>(count_words(text)) / sentences.size();
    double score = 1.0 - (avg_sentence_length - 15.0) / 30.0;
    return std::clamp(score, 0.0, 1.0);
}

std::vector<std::string> semantic_boundaries(const std::string& text) {
    std::vector<std::string> boundaries;
    for (const auto& [index, sentence] : split_sentences(text)) {
        boundaries.push_back("sentence_" + std::to_string(index));
    }
    return boundaries;
}

bool is_at_poor_boundary(const std::string& text) {
    auto [begin, end] = trim_span(text, 0, text.size());
    if (begin == end) return true;

    char last = text[end - 1];
    return !(last == '.' || last == '!' || last == '?' || last == ':' || last == ';');
}

double chunk_importance(const std::string& text, size_t nearby_visual_count) {
    double importance = 0.5;
    importance += nearby_visual_count * 0.1;

    if (text.find("important") != std::string::npos || text.find("key") != std::string::npos) {
        importance += 0.2;
    }

    return std::min(importance, 1.0);
}

} // namespace visual_chunker
