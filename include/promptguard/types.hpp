#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

enum class ThreatCategory {
    InstructionOverride,
    RoleManipulation,
    DelimiterInjection,
    SystemPromptLeak,
    Encoding
};

constexpr std::size_t kCategoryCount = 5;

// Processing and tie-break order.
constexpr std::array<ThreatCategory, kCategoryCount> kCanonicalOrder = {
    ThreatCategory::InstructionOverride,
    ThreatCategory::RoleManipulation,
    ThreatCategory::DelimiterInjection,
    ThreatCategory::SystemPromptLeak,
    ThreatCategory::Encoding,
};

constexpr std::size_t index_of(ThreatCategory c) {
    return static_cast<std::size_t>(c);
}

enum class Action { Block, Sanitize, Warn, Allow };

/// Tie-break rank only: block > sanitize > warn > allow.
constexpr int severity(Action a) {
    switch (a) {
        case Action::Block:    return 3;
        case Action::Sanitize: return 2;
        case Action::Warn:     return 1;
        case Action::Allow:    return 0;
    }
    return 0;
}

// A single detector match. Offsets are byte offsets into the scanned text.
struct Finding {
    ThreatCategory category = ThreatCategory::InstructionOverride;
    std::size_t    begin = 0;
    std::size_t    end   = 0;
    double         confidence = 0.0;
    std::string    detector_id;   // e.g. "override.ignore-prior"
    std::string    rationale;
};

// Per-category outcome of one validation call.
struct Decision {
    ThreatCategory       category  = ThreatCategory::InstructionOverride;
    double               score     = 0.0;   // max finding confidence, 0 if none
    double               threshold = 0.0;   // effective threshold applied
    bool                 triggered = false;
    Action               action    = Action::Allow;
    std::vector<Finding> findings;
    std::string          fault;             // non-empty when a detector threw

    std::size_t finding_count() const { return findings.size(); }
    bool faulted() const { return !fault.empty(); }
};

// ── Stable identifiers ───────────────────────────────────────────────────────

inline const char* to_string(ThreatCategory c) {
    switch (c) {
        case ThreatCategory::InstructionOverride: return "instructionOverride";
        case ThreatCategory::RoleManipulation:    return "roleManipulation";
        case ThreatCategory::DelimiterInjection:  return "delimiterInjection";
        case ThreatCategory::SystemPromptLeak:    return "systemPromptLeak";
        case ThreatCategory::Encoding:            return "encoding";
        default:                                  return "unknown";
    }
}

inline const char* to_string(Action a) {
    switch (a) {
        case Action::Block:    return "block";
        case Action::Sanitize: return "sanitize";
        case Action::Warn:     return "warn";
        case Action::Allow:    return "allow";
        default:               return "unknown";
    }
}

inline std::optional<ThreatCategory> parse_category(std::string_view id) {
    for (auto c : kCanonicalOrder) {
        if (id == to_string(c)) return c;
    }
    return std::nullopt;
}

inline std::optional<Action> parse_action(std::string_view id) {
    for (auto a : { Action::Block, Action::Sanitize, Action::Warn, Action::Allow }) {
        if (id == to_string(a)) return a;
    }
    return std::nullopt;
}

inline std::ostream& operator<<(std::ostream& os, ThreatCategory c) {
    return os << to_string(c);
}

inline std::ostream& operator<<(std::ostream& os, Action a) {
    return os << to_string(a);
}

} // namespace promptguard
