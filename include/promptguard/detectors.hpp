#pragma once

#include "promptguard/phrase.hpp"
#include "promptguard/policy.hpp"
#include "promptguard/text.hpp"
#include "promptguard/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

// Every detector is a pure function of (text, policy): no state, no I/O, and
// linear in text length. Finding offsets refer to `text`.

std::vector<Finding> detect_instruction_override(std::string_view text, const Policy& policy);
std::vector<Finding> detect_role_manipulation(std::string_view text, const Policy& policy);
std::vector<Finding> detect_delimiter_injection(std::string_view text, const Policy& policy);
std::vector<Finding> detect_system_prompt_leak(std::string_view text, const Policy& policy);
std::vector<Finding> detect_encoding(std::string_view text, const Policy& policy);

// ── Scoring constants ────────────────────────────────────────────────────────

constexpr double      kFrontBoost               = 0.15;
constexpr std::size_t kFrontWindowBytes         = 48;
constexpr double      kCustomOverrideConfidence = 0.75;
constexpr double      kRoleReferenceWords       = 12.0;
constexpr double      kDelimiterBaseConfidence  = 0.75;
constexpr double      kDelimiterStep            = 0.1;
constexpr double      kLeakConfidence           = 0.9;
constexpr double      kAnomalyRatioWeight       = 2.0;
constexpr double      kHiddenPayloadConfidence  = 0.95;
constexpr std::size_t kMinEncodedRun            = 24;
constexpr std::size_t kMinEscapeUnits           = 4;

// ── Phrase tables ────────────────────────────────────────────────────────────

/// True for the categories whose detector is phrase-driven.
bool has_phrase_detector(ThreatCategory category);

/// Built-in patterns of a phrase-driven category; empty for the others.
const std::vector<PhrasePattern>& builtin_phrases(ThreatCategory category);

// ── Delimiters ───────────────────────────────────────────────────────────────

/**
 * Bare name of a delimiter used for tag forms (<name>, [name], <|name|>):
 * "SYSTEM:" -> "system". Empty when the delimiter is not a simple identifier.
 */
std::string delimiter_tag_name(std::string_view delimiter);

// ── Encoding helpers ─────────────────────────────────────────────────────────

/// Drops invisible code points, control characters and malformed bytes.
std::string strip_invisible(std::string_view text);

/// Base64-like, hex and escape-sequence runs.
std::vector<Span> find_encoded_runs(std::string_view text);

} // namespace promptguard
