#include <evalforge/evaluation/text_similarity.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_map>
#include <unordered_set>

namespace evalforge::evaluation::text {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trimView(std::string_view s) {
    while (!s.empty() && isSpace(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back()))
        s.remove_suffix(1);
    return s;
}

std::size_t countWords(std::string_view s) {
    std::size_t n = 0;
    bool inWord = false;
    for (char c : s) {
        if (isSpace(c)) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++n;
        }
    }
    return n;
}

} // namespace

Tokens tokenize(std::string_view text) {
    Tokens out;
    std::string current;
    for (char c : text) {
        if (isSpace(c)) {
            if (!current.empty()) {
                out.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (!current.empty())
        out.push_back(std::move(current));
    return out;
}

Tokens bigrams(const Tokens& tokens) {
    Tokens out;
    if (tokens.size() < 2)
        return out;
    out.reserve(tokens.size() - 1);
    for (std::size_t i = 0; i + 1 < tokens.size(); ++i)
        out.push_back(tokens[i] + " " + tokens[i + 1]);
    return out;
}

double bleu(const Tokens& prediction, const Tokens& reference) {
    if (prediction.empty() || reference.empty())
        return 0.0;

    std::unordered_map<std::string, int> remaining;
    for (const auto& tok : reference)
        ++remaining[tok];

    std::size_t matches = 0;
    for (const auto& tok : prediction) {
        auto it = remaining.find(tok);
        if (it != remaining.end() && it->second > 0) {
            ++matches;
            --it->second;
        }
    }

    const double precision =
        static_cast<double>(matches) / static_cast<double>(prediction.size());
    double brevity = 1.0;
    if (prediction.size() < reference.size()) {
        brevity = std::exp(1.0 - static_cast<double>(reference.size()) /
                                     static_cast<double>(prediction.size()));
    }
    return brevity * precision;
}

double overlapRecall(const Tokens& prediction, const Tokens& reference) {
    if (prediction.empty() || reference.empty())
        return 0.0;

    std::unordered_set<std::string> predSet(prediction.begin(), prediction.end());
    std::size_t overlap = 0;
    for (const auto& tok : reference) {
        if (predSet.count(tok))
            ++overlap;
    }
    return static_cast<double>(overlap) / static_cast<double>(reference.size());
}

double rouge1(const Tokens& prediction, const Tokens& reference) {
    return overlapRecall(prediction, reference);
}

double rouge2(const Tokens& prediction, const Tokens& reference) {
    if (prediction.size() < 2 || reference.size() < 2)
        return 0.0;
    return overlapRecall(bigrams(prediction), bigrams(reference));
}

double rougeL(const Tokens& prediction, const Tokens& reference) {
    if (prediction.empty() || reference.empty())
        return 0.0;
    const auto lcs = longestCommonSubsequence(prediction, reference);
    return static_cast<double>(lcs) /
           static_cast<double>(std::max(prediction.size(), reference.size()));
}

std::size_t longestCommonSubsequence(const Tokens& a, const Tokens& b) {
    if (a.empty() || b.empty())
        return 0;

    // Two rolling rows of the (m+1) x (n+1) table.
    std::vector<std::size_t> prev(b.size() + 1, 0);
    std::vector<std::size_t> curr(b.size() + 1, 0);
    for (std::size_t i = 1; i <= a.size(); ++i) {
        for (std::size_t j = 1; j <= b.size(); ++j) {
            if (a[i - 1] == b[j - 1])
                curr[j] = prev[j - 1] + 1;
            else
                curr[j] = std::max(prev[j], curr[j - 1]);
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

double lexicalDiversity(const Tokens& tokens) {
    if (tokens.empty())
        return 0.0;
    std::unordered_set<std::string> unique(tokens.begin(), tokens.end());
    return static_cast<double>(unique.size()) / static_cast<double>(tokens.size());
}

double coherence(std::string_view text) {
    std::vector<std::size_t> lengths;
    std::size_t parts = 0;
    std::size_t start = 0;
    while (true) {
        auto dot = text.find('.', start);
        auto piece = text.substr(start, dot == std::string_view::npos ? std::string_view::npos
                                                                      : dot - start);
        ++parts;
        auto trimmed = trimView(piece);
        if (!trimmed.empty())
            lengths.push_back(countWords(trimmed));
        if (dot == std::string_view::npos)
            break;
        start = dot + 1;
    }

    if (parts < 2 || lengths.size() < 2)
        return 1.0;

    double mean = 0.0;
    for (auto len : lengths)
        mean += static_cast<double>(len);
    mean /= static_cast<double>(lengths.size());
    if (mean <= 0.0)
        return 1.0;

    double variance = 0.0;
    for (auto len : lengths) {
        const double d = static_cast<double>(len) - mean;
        variance += d * d;
    }
    variance /= static_cast<double>(lengths.size());

    const double cv = std::sqrt(variance) / mean;
    return std::max(0.0, 1.0 - cv / 2.0);
}

double relevance(const Tokens& prediction, const Tokens& reference) {
    return overlapRecall(prediction, reference);
}

} // namespace evalforge::evaluation::text
