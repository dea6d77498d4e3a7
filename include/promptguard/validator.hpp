#pragma once

#include "promptguard/policy.hpp"
#include "promptguard/result.hpp"
#include "promptguard/types.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

// A detector scans text for one category. Must be pure and thread-safe.
using DetectorFn = std::function<std::vector<Finding>(std::string_view, const Policy&)>;

struct Detector {
    ThreatCategory category;
    std::string    name;
    std::string    description;
    DetectorFn     detect;
};

/**
 * Validator
 *
 * Runs registered detectors over a text and applies the Policy's actions.
 *
 * Pipeline:
 *   1. Length guard: oversized input is rejected or truncated per Policy.
 *   2. Every category is scored on the guarded text (canonical order).
 *   3. The first Block in canonical order rejects; all Decisions are attached.
 *   4. Otherwise Sanitize rewrites run in canonical order on the progressively
 *      rewritten text, Warn decisions are collected, and Success is returned.
 *
 * A detector that throws, or reports a span outside the text, fails closed
 * for its category (see decide_faulted).
 */
class Validator {
public:
    void register_detector(Detector detector);

    ValidationResult validate(std::string_view text, const Policy& policy) const;

    std::size_t detector_count() const { return detectors_.size(); }

private:
    std::vector<Finding> run_detectors(ThreatCategory category, std::string_view text,
                                       const Policy& policy) const;
    Decision evaluate(ThreatCategory category, std::string_view text, const Policy& policy) const;
    std::string sanitize(ThreatCategory category, const std::string& text, const Policy& policy) const;

    std::vector<Detector> detectors_;
};

// ── Built-in detectors ───────────────────────────────────────────────────────

/// "ignore previous instructions" and kin, boosted near the start of the text.
Detector instruction_override_detector();

/// "you are now", "act as", "pretend to be", scored by match density.
Detector role_manipulation_detector();

/// Configured delimiters and chat-template markers embedded in the text.
Detector delimiter_injection_detector();

/// Requests to reveal hidden instructions; flat 0.9 per match.
Detector system_prompt_leak_detector();

/// Invisible characters, control bytes and encoded runs.
Detector encoding_detector();

/// Returns a Validator pre-loaded with all built-in detectors in canonical order.
Validator default_validator();

/// Validates with a process-wide default Validator.
ValidationResult validate(std::string_view text, const Policy& policy);

} // namespace promptguard
