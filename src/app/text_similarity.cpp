// Copyright (c) 2025 Dualscribe
#include "app/text_similarity.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace app {

namespace {
bool is_word_byte(unsigned char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c >= 0x80;
}

bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}
} // namespace

std::string normalize_text(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (unsigned char c : text) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (!is_word_byte(c)) continue;
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c));
    }
    return out;
}

std::vector<std::string> split_words(const std::string& normalized) {
    std::vector<std::string> words;
    std::istringstream iss(normalized);
    std::string w;
    while (iss >> w) words.push_back(w);
    return words;
}

double jaccard_similarity(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::set<std::string> sa(a.begin(), a.end());
    std::set<std::string> sb(b.begin(), b.end());
    if (sa.empty() || sb.empty()) return 0.0;

    size_t inter = 0;
    for (const auto& w : sa) {
        if (sb.count(w)) inter++;
    }
    const size_t uni = sa.size() + sb.size() - inter;
    return static_cast<double>(inter) / static_cast<double>(uni);
}

double text_similarity(const std::string& a, const std::string& b, double containment_bonus) {
    const std::string na = normalize_text(a);
    const std::string nb = normalize_text(b);
    if (na.empty() || nb.empty()) return 0.0;
    if (na == nb) return 1.0;

    const double jaccard = jaccard_similarity(split_words(na), split_words(nb));

    const std::string& longer = na.size() > nb.size() ? na : nb;
    const std::string& shorter = na.size() > nb.size() ? nb : na;
    const double containment = longer.find(shorter) != std::string::npos ? containment_bonus : 0.0;

    return std::clamp(std::max(jaccard, containment), 0.0, 1.0);
}

size_t word_count(const std::string& text) {
    std::istringstream iss(text);
    std::string w;
    size_t n = 0;
    while (iss >> w) n++;
    return n;
}

} // namespace app
