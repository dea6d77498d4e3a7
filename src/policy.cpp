#include "promptguard/policy.hpp"
#include "promptguard/detectors.hpp"
#include "promptguard/sanitizer.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <unordered_set>

namespace promptguard {

namespace {

constexpr const char* kAllCategories = "all";

std::optional<double> preset_threshold(const std::string& name) {
    for (const auto& p : kPresets) {
        if (name == p.name) return p.threshold;
    }
    return std::nullopt;
}

bool in_unit_range(double v) {
    return !std::isnan(v) && v >= 0.0 && v <= 1.0;
}

ConfigError error(ConfigErrorCode code, std::string message) {
    spdlog::debug("promptguard: policy rejected ({}): {}", to_string(code), message);
    return { code, std::move(message) };
}

// Words that appear in sanitizer output; a phrase or delimiter matching one of
// them would re-trigger on already sanitized text.
const std::unordered_set<std::string>& placeholder_words() {
    static const std::unordered_set<std::string> words = [] {
        std::unordered_set<std::string> w;
        for (auto p : kPlaceholders) {
            for (const auto& t : tokenize(p)) w.insert(t.word);
        }
        return w;
    }();
    return words;
}

std::optional<ConfigError> check_delimiter(const std::string& delimiter) {
    if (delimiter.find_first_not_of(" \t") == std::string::npos) {
        return error(ConfigErrorCode::InvalidDelimiter, "delimiter must not be empty");
    }
    if (delimiter.size() > kMaxDelimiterLength) {
        return error(ConfigErrorCode::InvalidDelimiter,
                     "delimiter '" + delimiter.substr(0, 16) + "...' exceeds " +
                     std::to_string(kMaxDelimiterLength) + " bytes");
    }
    const auto folded = to_lower_ascii(delimiter);
    for (auto p : kPlaceholders) {
        if (to_lower_ascii(p).find(folded) != std::string::npos) {
            return error(ConfigErrorCode::InvalidDelimiter,
                         "delimiter '" + delimiter + "' occurs in sanitizer output");
        }
    }
    const auto name = delimiter_tag_name(delimiter);
    if (!name.empty() && placeholder_words().count(name) > 0) {
        return error(ConfigErrorCode::InvalidDelimiter,
                     "delimiter '" + delimiter + "' occurs in sanitizer output");
    }
    return std::nullopt;
}

} // namespace

const std::vector<std::string>& default_delimiters() {
    static const std::vector<std::string> delimiters = { "CONTEXT:", "USER:", "SYSTEM:", "ASSISTANT:" };
    return delimiters;
}

// ── PolicyBuilder ─────────────────────────────────────────────────────────────

PolicyBuilder PolicyBuilder::from_preset(std::string name) {
    return PolicyBuilder(std::move(name));
}

PolicyBuilder PolicyBuilder::with_threshold(double value) const {
    return with_threshold(std::string(kAllCategories), value);
}

PolicyBuilder PolicyBuilder::with_threshold(ThreatCategory category, double value) const {
    return with_threshold(std::string(to_string(category)), value);
}

PolicyBuilder PolicyBuilder::with_threshold(const std::string& category, double value) const {
    PolicyBuilder next = *this;
    next.thresholds_.push_back({ category, value });
    return next;
}

PolicyBuilder PolicyBuilder::with_action(ThreatCategory category, Action action) const {
    return with_action(std::string(to_string(category)), std::string(to_string(action)));
}

PolicyBuilder PolicyBuilder::with_action(const std::string& category, const std::string& action) const {
    PolicyBuilder next = *this;
    next.actions_.push_back({ category, action });
    return next;
}

PolicyBuilder PolicyBuilder::with_delimiters(std::vector<std::string> delimiters) const {
    PolicyBuilder next = *this;
    next.delimiters_ = std::move(delimiters);
    return next;
}

PolicyBuilder PolicyBuilder::with_max_length(std::size_t bytes, OversizeMode mode) const {
    PolicyBuilder next = *this;
    next.max_length_    = bytes;
    next.oversize_mode_ = mode;
    return next;
}

PolicyBuilder PolicyBuilder::with_phrase(ThreatCategory category, std::string phrase) const {
    return with_phrase(std::string(to_string(category)), std::move(phrase));
}

PolicyBuilder PolicyBuilder::with_phrase(const std::string& category, std::string phrase) const {
    PolicyBuilder next = *this;
    next.phrases_.push_back({ category, std::move(phrase) });
    return next;
}

PolicyBuilder PolicyBuilder::with_warn_handler(WarnHandler handler) const {
    PolicyBuilder next = *this;
    next.warn_handler_ = std::move(handler);
    return next;
}

BuildResult PolicyBuilder::build() const {
    Policy policy;

    const auto base = preset_threshold(preset_);
    if (!base) {
        return error(ConfigErrorCode::UnknownPreset,
                     "unknown preset '" + preset_ + "' (expected strict, moderate or lenient)");
    }
    policy.preset_           = preset_;
    policy.global_threshold_ = *base;
    policy.actions_.fill(Action::Block);

    for (const auto& t : thresholds_) {
        if (!in_unit_range(t.value)) {
            return error(ConfigErrorCode::ThresholdOutOfRange,
                         "threshold for '" + t.category + "' must be within [0, 1], got " +
                         std::to_string(t.value));
        }
        if (t.category == kAllCategories) {
            policy.global_threshold_ = t.value;
            policy.thresholds_.fill(std::nullopt);
            continue;
        }
        const auto category = parse_category(t.category);
        if (!category) {
            return error(ConfigErrorCode::UnknownCategory, "unknown category '" + t.category + "'");
        }
        policy.thresholds_[index_of(*category)] = t.value;
    }

    for (const auto& a : actions_) {
        const auto category = parse_category(a.category);
        if (!category) {
            return error(ConfigErrorCode::UnknownCategory, "unknown category '" + a.category + "'");
        }
        const auto action = parse_action(a.action);
        if (!action) {
            return error(ConfigErrorCode::UnknownAction,
                         "unknown action '" + a.action + "' for '" + a.category + "'");
        }
        policy.actions_[index_of(*category)] = *action;
    }

    policy.delimiters_ = delimiters_ ? *delimiters_ : default_delimiters();
    if (policy.delimiters_.size() > kMaxDelimiterCount) {
        return error(ConfigErrorCode::InvalidDelimiter,
                     "at most " + std::to_string(kMaxDelimiterCount) + " delimiters are supported");
    }
    std::unordered_set<std::string> seen;
    for (const auto& d : policy.delimiters_) {
        if (auto err = check_delimiter(d)) return *err;
        if (!seen.insert(to_lower_ascii(d)).second) {
            return error(ConfigErrorCode::InvalidDelimiter,
                         "delimiter '" + d + "' is listed more than once (case-insensitive)");
        }
    }

    if (max_length_) {
        if (*max_length_ == 0) {
            return error(ConfigErrorCode::InvalidLimit, "maximum input length must be positive");
        }
        policy.max_input_length_ = *max_length_;
        policy.oversize_mode_    = oversize_mode_;
    }

    for (const auto& p : phrases_) {
        const auto category = parse_category(p.category);
        if (!category) {
            return error(ConfigErrorCode::UnknownCategory, "unknown category '" + p.category + "'");
        }
        if (!has_phrase_detector(*category)) {
            return error(ConfigErrorCode::UnsupportedCategory,
                         std::string("category '") + to_string(*category) + "' takes no custom phrases");
        }

        std::string reason;
        auto slots = parse_phrase(p.phrase, reason);
        if (!slots) {
            return error(ConfigErrorCode::InvalidPhrase, "phrase '" + p.phrase + "': " + reason);
        }
        for (const auto& slot : *slots) {
            for (const auto& word : slot.words) {
                if (placeholder_words().count(word) > 0) {
                    return error(ConfigErrorCode::InvalidPhrase,
                                 "phrase '" + p.phrase + "' matches sanitizer output ('" + word + "')");
                }
            }
        }

        auto& custom = policy.custom_phrases_[index_of(*category)];
        const double confidence = *category == ThreatCategory::InstructionOverride ? kCustomOverrideConfidence
                                : *category == ThreatCategory::SystemPromptLeak    ? kLeakConfidence
                                                                                   : 1.0;
        custom.push_back({ "custom." + std::to_string(custom.size() + 1), std::move(*slots),
                           confidence, "matches custom phrase '" + p.phrase + "'" });
    }

    policy.warn_handler_ = warn_handler_;
    return policy;
}

// ── Host-facing construction ──────────────────────────────────────────────────

BuildResult build_policy(const std::string& preset, const PolicyOverrides& overrides) {
    auto builder = PolicyBuilder::from_preset(preset);
    if (overrides.threshold) {
        builder = builder.with_threshold(*overrides.threshold);
    }
    for (const auto& [category, value] : overrides.thresholds) {
        builder = builder.with_threshold(category, value);
    }
    for (const auto& [category, action] : overrides.actions) {
        builder = builder.with_action(category, action);
    }
    if (overrides.delimiters) {
        builder = builder.with_delimiters(*overrides.delimiters);
    }
    if (overrides.max_input_length) {
        builder = builder.with_max_length(*overrides.max_input_length, overrides.oversize_mode);
    }
    for (const auto& [category, phrases] : overrides.phrases) {
        for (const auto& phrase : phrases) {
            builder = builder.with_phrase(category, phrase);
        }
    }
    return builder.build();
}

PolicyOverrides with_default_actions(PolicyOverrides overrides,
                                     const std::map<std::string, std::string>& defaults) {
    for (const auto& entry : defaults) {
        overrides.actions.insert(entry);
    }
    return overrides;
}

} // namespace promptguard
