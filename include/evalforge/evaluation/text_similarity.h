#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Token-overlap approximations of BLEU and ROUGE. These follow a simplified unigram,
// bigram and LCS model and are not interchangeable with the published reference scorers.
namespace evalforge::evaluation::text {

using Tokens = std::vector<std::string>;

// Lowercases and splits on whitespace.
Tokens tokenize(std::string_view text);

Tokens bigrams(const Tokens& tokens);

// Clipped unigram precision times brevity penalty exp(1 - |ref|/|pred|) when pred is shorter.
double bleu(const Tokens& prediction, const Tokens& reference);

// Fraction of reference items that occur anywhere in the prediction.
double overlapRecall(const Tokens& prediction, const Tokens& reference);

double rouge1(const Tokens& prediction, const Tokens& reference);

// Zero unless both sides have at least two tokens.
double rouge2(const Tokens& prediction, const Tokens& reference);

// LCS / max(|pred|, |ref|)
double rougeL(const Tokens& prediction, const Tokens& reference);

std::size_t longestCommonSubsequence(const Tokens& a, const Tokens& b);

// Type-token ratio.
double lexicalDiversity(const Tokens& tokens);

/**
 * @brief Sentence-length regularity of a text.
 *
 * Splits on '.', counts words per non-empty sentence and returns 1 - cv/2 clamped at 0,
 * where cv is the coefficient of variation. Fewer than two sentences scores 1.0.
 */
double coherence(std::string_view text);

double relevance(const Tokens& prediction, const Tokens& reference);

} // namespace evalforge::evaluation::text
