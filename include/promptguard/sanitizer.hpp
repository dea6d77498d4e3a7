#pragma once

#include "promptguard/types.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

inline constexpr std::string_view kRedactionPlaceholder = "[REDACTED]";
inline constexpr std::string_view kDelimiterPlaceholder = "[DELIMITER REMOVED]";
inline constexpr std::string_view kEncodedPlaceholder   = "[ENCODED DATA]";

constexpr std::array<std::string_view, 3> kPlaceholders = {
    kRedactionPlaceholder, kDelimiterPlaceholder, kEncodedPlaceholder,
};

/**
 * Rewrites `text` for one category using findings computed on that same text.
 *
 *   instructionOverride, roleManipulation, systemPromptLeak
 *       matched spans -> [REDACTED]
 *   delimiterInjection
 *       matched tokens -> [DELIMITER REMOVED]
 *
 * Encoding is not span-based; use sanitize_encoding().
 */
std::string sanitize_spans(ThreatCategory category, std::string_view text,
                           const std::vector<Finding>& findings);

/**
 * Deletes invisible, control and malformed characters, then replaces the
 * encoded runs left in the cleaned text with [ENCODED DATA].
 */
std::string sanitize_encoding(std::string_view text);

} // namespace promptguard
