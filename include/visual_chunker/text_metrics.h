#pragma once

#include <string>
#include <utility>
#include <vector>

namespace visual_chunker {

// Narrows [begin, end) of text to exclude leading and trailing whitespace.
// Returns {end, end} when the range is blank.
std::pair<size_t, size_t> trim_span(const std::string& text, size_t begin, size_t end);

std::string trim(const std::string& text);
std::string to_lower(std::string text);

// Whitespace-separated words
size_t count_words(const std::string& text);

// ceil(words * 1.3), no tokenizer involved
size_t estimate_tokens(const std::string& text);

// clamp(1 - (avg_sentence_words - 15) / 30, 0, 1)
double readability_score(const std::string& text);

// One "sentence_<i>" marker per non-empty sentence
std::vector<std::string> semantic_boundaries(const std::string& text);

// True when the trimmed text does not end with . ! ? : ;
bool is_at_poor_boundary(const std::string& text);

double chunk_importance(const std::string& text, size_t nearby_visual_count);

} // namespace visual_chunker
