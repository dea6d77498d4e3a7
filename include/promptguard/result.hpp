#pragma once

#include "promptguard/types.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace promptguard {

struct Success {
    std::string              text;       // sanitized (or untouched) input
    std::vector<Decision>    warnings;   // Decisions resolved to Warn
    std::vector<std::string> notes;      // e.g. truncation

    bool has_warnings() const { return !warnings.empty(); }
};

enum class RejectionKind { Threat, InputTooLong };

inline std::ostream& operator<<(std::ostream& os, RejectionKind k) {
    return os << (k == RejectionKind::Threat ? "Threat" : "InputTooLong");
}

/**
 * Rejection
 *
 * Expected outcome when a category resolves to Block (or the input exceeds the
 * length limit). Carries every Decision in canonical order for diagnosis;
 * `category` is the first blocking one and is empty only for InputTooLong.
 */
struct Rejection {
    RejectionKind                 kind = RejectionKind::Threat;
    std::optional<ThreatCategory> category;
    double                        score     = 0.0;
    double                        threshold = 0.0;
    std::vector<Decision>         decisions;
    std::vector<std::string>      notes;

    /// Multi-line operator report. Same input, same bytes.
    std::string debug_summary() const;

    /// Short message that reveals nothing about detection internals.
    std::string user_message() const;
};

using ValidationResult = std::variant<Success, Rejection>;

inline bool is_success(const ValidationResult& r) {
    return std::holds_alternative<Success>(r);
}

} // namespace promptguard
