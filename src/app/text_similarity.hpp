// Copyright (c) 2025 Dualscribe
#pragma once
#include <string>
#include <vector>

namespace app {

// Lower-cases ASCII, drops punctuation, collapses whitespace. Bytes >= 0x80
// are kept as word characters so UTF-8 text survives.
std::string normalize_text(const std::string& text);

std::vector<std::string> split_words(const std::string& normalized);

// |A ∩ B| / |A ∪ B| over word sets; 0 when either side is empty.
double jaccard_similarity(const std::vector<std::string>& a, const std::vector<std::string>& b);

// Heuristic in [0,1]: identical normalized texts score 1, otherwise
// max(jaccard, containment_bonus if the shorter text is a substring of the longer).
double text_similarity(const std::string& a, const std::string& b, double containment_bonus = 0.3);

// Whitespace-separated word count of the trimmed text.
size_t word_count(const std::string& text);

} // namespace app
