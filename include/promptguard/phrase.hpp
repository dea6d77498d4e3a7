#pragma once

#include "promptguard/text.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

struct PhraseSlot {
    std::vector<std::string> words;   // alternatives
    bool optional = false;
};

/**
 * PhrasePattern
 *
 * A fixed-length word sequence. Source syntax: slots separated by spaces,
 * alternatives joined with '|', optional slots wrapped in brackets:
 *
 *     "ignore|disregard [all] [the|your] previous|prior instructions|rules"
 *
 * Matching is greedy and never backtracks, so one scan costs
 * O(tokens * slots * alternatives).
 */
struct PhrasePattern {
    std::string             id;
    std::vector<PhraseSlot> slots;
    double                  confidence = 0.0;
    std::string             rationale;
};

struct PhraseMatch {
    std::size_t first_token = 0;
    std::size_t token_count = 0;
    std::size_t begin = 0;   // byte span of the matched words
    std::size_t end   = 0;
};

/// Parses `source` into slots. On failure returns nullopt and sets `error`.
std::optional<std::vector<PhraseSlot>> parse_phrase(std::string_view source, std::string& error);

/// Builds a pattern from trusted source text; throws std::invalid_argument on bad syntax.
PhrasePattern make_phrase(std::string id, std::string_view source, double confidence,
                          std::string rationale);

/// Leftmost, non-overlapping matches of `pattern` in `tokens`.
std::vector<PhraseMatch> find_phrase(const std::vector<Token>& tokens, const PhrasePattern& pattern);

} // namespace promptguard
