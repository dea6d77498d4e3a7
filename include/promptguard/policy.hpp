#pragma once

#include "promptguard/phrase.hpp"
#include "promptguard/types.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace promptguard {

// ── Presets ──────────────────────────────────────────────────────────────────

struct PresetInfo {
    const char* name;
    double      threshold;
};

constexpr std::array<PresetInfo, 3> kPresets = {{
    { "strict",   0.5  },
    { "moderate", 0.7  },
    { "lenient",  0.85 },
}};

constexpr std::size_t kDefaultMaxInputLength = 10000;
constexpr std::size_t kMaxDelimiterLength    = 64;
constexpr std::size_t kMaxDelimiterCount     = 32;

// ── Errors ───────────────────────────────────────────────────────────────────

enum class ConfigErrorCode {
    UnknownPreset,
    ThresholdOutOfRange,
    UnknownCategory,
    UnknownAction,
    InvalidDelimiter,
    InvalidPhrase,
    InvalidLimit,
    UnsupportedCategory
};

inline const char* to_string(ConfigErrorCode c) {
    switch (c) {
        case ConfigErrorCode::UnknownPreset:       return "UnknownPreset";
        case ConfigErrorCode::ThresholdOutOfRange: return "ThresholdOutOfRange";
        case ConfigErrorCode::UnknownCategory:     return "UnknownCategory";
        case ConfigErrorCode::UnknownAction:       return "UnknownAction";
        case ConfigErrorCode::InvalidDelimiter:    return "InvalidDelimiter";
        case ConfigErrorCode::InvalidPhrase:       return "InvalidPhrase";
        case ConfigErrorCode::InvalidLimit:        return "InvalidLimit";
        case ConfigErrorCode::UnsupportedCategory: return "UnsupportedCategory";
        default:                                   return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, ConfigErrorCode c) {
    return os << to_string(c);
}

struct ConfigError {
    ConfigErrorCode code;
    std::string     message;
};

// ── Policy ───────────────────────────────────────────────────────────────────

enum class OversizeMode { Reject, Truncate };

using WarnHandler = std::function<void(const Decision&)>;

/**
 * Policy
 *
 * Frozen validation settings. Only PolicyBuilder::build() creates one; there
 * are no mutators, so a Policy can be shared across threads without locking.
 */
class Policy {
public:
    const std::string& preset() const { return preset_; }

    double global_threshold() const { return global_threshold_; }

    std::optional<double> category_threshold(ThreatCategory c) const {
        return thresholds_[index_of(c)];
    }

    /// Category-specific threshold when set, else the global one.
    double threshold(ThreatCategory c) const {
        const auto& t = thresholds_[index_of(c)];
        return t ? *t : global_threshold_;
    }

    Action action(ThreatCategory c) const { return actions_[index_of(c)]; }

    const std::vector<std::string>& delimiters() const { return delimiters_; }

    std::size_t  max_input_length() const { return max_input_length_; }
    OversizeMode oversize_mode() const { return oversize_mode_; }

    const std::vector<PhrasePattern>& custom_phrases(ThreatCategory c) const {
        return custom_phrases_[index_of(c)];
    }

    const WarnHandler& warn_handler() const { return warn_handler_; }

private:
    friend class PolicyBuilder;
    Policy() = default;

    std::string                                                     preset_;
    double                                                          global_threshold_ = 0.7;
    std::array<std::optional<double>, kCategoryCount>               thresholds_{};
    std::array<Action, kCategoryCount>                              actions_{};
    std::vector<std::string>                                        delimiters_;
    std::size_t                                                     max_input_length_ = kDefaultMaxInputLength;
    OversizeMode                                                    oversize_mode_ = OversizeMode::Reject;
    std::array<std::vector<PhrasePattern>, kCategoryCount>          custom_phrases_;
    WarnHandler                                                     warn_handler_;
};

using BuildResult = std::variant<Policy, ConfigError>;

/**
 * PolicyBuilder
 *
 * Immutable builder: every with_* call leaves *this untouched and returns the
 * extended copy. Nothing is checked until build(), which reports the first
 * invalid setting: preset, then thresholds, actions, delimiters, length limit
 * and phrases, each group in the order given.
 */
class PolicyBuilder {
public:
    static PolicyBuilder from_preset(std::string name);

    /// Sets the global threshold and drops earlier per-category thresholds.
    PolicyBuilder with_threshold(double value) const;
    PolicyBuilder with_threshold(ThreatCategory category, double value) const;
    /// `category` is a category id or "all".
    PolicyBuilder with_threshold(const std::string& category, double value) const;

    PolicyBuilder with_action(ThreatCategory category, Action action) const;
    PolicyBuilder with_action(const std::string& category, const std::string& action) const;

    PolicyBuilder with_delimiters(std::vector<std::string> delimiters) const;
    PolicyBuilder with_max_length(std::size_t bytes, OversizeMode mode = OversizeMode::Reject) const;

    /// Adds a custom phrase to a phrase-based category (see PhrasePattern for syntax).
    PolicyBuilder with_phrase(ThreatCategory category, std::string phrase) const;
    PolicyBuilder with_phrase(const std::string& category, std::string phrase) const;

    PolicyBuilder with_warn_handler(WarnHandler handler) const;

    BuildResult build() const;

private:
    explicit PolicyBuilder(std::string preset) : preset_(std::move(preset)) {}

    struct ThresholdSetting { std::string category; double value; };
    struct ActionSetting    { std::string category; std::string action; };
    struct PhraseSetting    { std::string category; std::string phrase; };

    std::string                             preset_;
    std::vector<ThresholdSetting>           thresholds_;
    std::vector<ActionSetting>              actions_;
    std::optional<std::vector<std::string>> delimiters_;
    std::optional<std::size_t>              max_length_;
    OversizeMode                            oversize_mode_ = OversizeMode::Reject;
    std::vector<PhraseSetting>              phrases_;
    WarnHandler                             warn_handler_;
};

/// Delimiters used when with_delimiters() is never called.
const std::vector<std::string>& default_delimiters();

// ── Host-facing construction ─────────────────────────────────────────────────

/// Raw control values as a host UI collects them; ids are validated by build().
struct PolicyOverrides {
    std::optional<double>                           threshold;
    std::map<std::string, double>                   thresholds;
    std::map<std::string, std::string>              actions;
    std::optional<std::vector<std::string>>         delimiters;
    std::optional<std::size_t>                      max_input_length;
    OversizeMode                                    oversize_mode = OversizeMode::Reject;
    std::map<std::string, std::vector<std::string>> phrases;
};

BuildResult build_policy(const std::string& preset, const PolicyOverrides& overrides = {});

/// Adds each default action whose category `overrides` leaves unset.
PolicyOverrides with_default_actions(PolicyOverrides overrides,
                                     const std::map<std::string, std::string>& defaults);

} // namespace promptguard
