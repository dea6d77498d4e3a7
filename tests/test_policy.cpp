#include "promptguard/json.hpp"
#include "promptguard/policy.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>

using namespace promptguard;

// ── Helpers ──────────────────────────────────────────────────────────────────

static ConfigErrorCode error_code(const BuildResult& result) {
    return std::get<ConfigError>(result).code;
}

static bool built(const BuildResult& result) {
    return std::holds_alternative<Policy>(result);
}

static int passed = 0;
static int failed = 0;

#define ASSERT_EQ(label, expected, actual)                                  \
    do {                                                                    \
        if ((expected) == (actual)) {                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label                              \
                      << "  (expected=" << (expected)                      \
                      << " got=" << (actual) << ")\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

#define ASSERT_TRUE(label, expr)                                            \
    do {                                                                    \
        if ((expr)) {                                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label << "\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

// ── Test suites ───────────────────────────────────────────────────────────────

void test_presets() {
    std::cout << "\n[Presets]\n";
    for (const auto& p : kPresets) {
        auto result = PolicyBuilder::from_preset(p.name).build();
        ASSERT_TRUE(std::string(p.name) + " builds", built(result));
        const auto& policy = std::get<Policy>(result);
        ASSERT_EQ(std::string(p.name) + " global threshold", p.threshold, policy.global_threshold());
        ASSERT_EQ(std::string(p.name) + " preset name", std::string(p.name), policy.preset());
        for (auto c : kCanonicalOrder) {
            ASSERT_EQ(std::string(p.name) + " blocks " + to_string(c), Action::Block, policy.action(c));
        }
    }

    auto policy = std::get<Policy>(PolicyBuilder::from_preset("moderate").build());
    ASSERT_EQ("default delimiters", default_delimiters().size(), policy.delimiters().size());
    ASSERT_EQ("default max length", kDefaultMaxInputLength, policy.max_input_length());
    ASSERT_TRUE("default oversize mode rejects", policy.oversize_mode() == OversizeMode::Reject);
    ASSERT_TRUE("no category thresholds",
                !policy.category_threshold(ThreatCategory::Encoding).has_value());
}

void test_unknown_preset() {
    std::cout << "\n[UnknownPreset]\n";
    auto result = PolicyBuilder::from_preset("paranoid").build();
    ASSERT_EQ("unknown preset fails", ConfigErrorCode::UnknownPreset, error_code(result));
    ASSERT_TRUE("message names the preset",
                std::get<ConfigError>(result).message.find("paranoid") != std::string::npos);
}

void test_thresholds() {
    std::cout << "\n[Thresholds]\n";
    auto base = PolicyBuilder::from_preset("moderate");

    auto policy = std::get<Policy>(base.with_threshold(ThreatCategory::RoleManipulation, 0.3).build());
    ASSERT_EQ("category threshold applied", 0.3, policy.threshold(ThreatCategory::RoleManipulation));
    ASSERT_EQ("others fall back to global", 0.7, policy.threshold(ThreatCategory::InstructionOverride));

    auto all = std::get<Policy>(base.with_threshold(ThreatCategory::RoleManipulation, 0.3)
                                    .with_threshold(0.4)
                                    .build());
    ASSERT_EQ("'all' replaces global", 0.4, all.global_threshold());
    ASSERT_EQ("'all' clears earlier category threshold", 0.4,
              all.threshold(ThreatCategory::RoleManipulation));

    auto by_name = std::get<Policy>(base.with_threshold("all", 0.9)
                                        .with_threshold("encoding", 0.2)
                                        .build());
    ASSERT_EQ("string 'all'", 0.9, by_name.global_threshold());
    ASSERT_EQ("string category", 0.2, by_name.threshold(ThreatCategory::Encoding));

    ASSERT_EQ("above 1 rejected", ConfigErrorCode::ThresholdOutOfRange,
              error_code(base.with_threshold(1.5).build()));
    ASSERT_EQ("below 0 rejected", ConfigErrorCode::ThresholdOutOfRange,
              error_code(base.with_threshold(ThreatCategory::Encoding, -0.1).build()));
    ASSERT_EQ("NaN rejected", ConfigErrorCode::ThresholdOutOfRange,
              error_code(base.with_threshold(std::numeric_limits<double>::quiet_NaN()).build()));
    ASSERT_TRUE("bounds are inclusive",
                built(base.with_threshold(0.0).with_threshold("encoding", 1.0).build()));
    ASSERT_EQ("unknown category", ConfigErrorCode::UnknownCategory,
              error_code(base.with_threshold("jailbreak", 0.5).build()));
}

void test_actions() {
    std::cout << "\n[Actions]\n";
    auto base = PolicyBuilder::from_preset("strict");

    auto policy = std::get<Policy>(base.with_action(ThreatCategory::Encoding, Action::Sanitize)
                                       .with_action("roleManipulation", "warn")
                                       .build());
    ASSERT_EQ("typed action", Action::Sanitize, policy.action(ThreatCategory::Encoding));
    ASSERT_EQ("string action", Action::Warn, policy.action(ThreatCategory::RoleManipulation));
    ASSERT_EQ("untouched category keeps block", Action::Block,
              policy.action(ThreatCategory::SystemPromptLeak));

    auto later = std::get<Policy>(base.with_action(ThreatCategory::Encoding, Action::Sanitize)
                                      .with_action(ThreatCategory::Encoding, Action::Allow)
                                      .build());
    ASSERT_EQ("later setting wins", Action::Allow, later.action(ThreatCategory::Encoding));

    ASSERT_EQ("unknown action", ConfigErrorCode::UnknownAction,
              error_code(base.with_action("encoding", "explode").build()));
    ASSERT_EQ("unknown category", ConfigErrorCode::UnknownCategory,
              error_code(base.with_action("sqlInjection", "block").build()));
}

void test_builder_is_non_destructive() {
    std::cout << "\n[NonDestructiveBuilder]\n";
    auto base    = PolicyBuilder::from_preset("lenient");
    auto derived = base.with_action(ThreatCategory::RoleManipulation, Action::Sanitize)
                       .with_threshold(0.2);

    auto base_policy    = std::get<Policy>(base.build());
    auto derived_policy = std::get<Policy>(derived.build());
    ASSERT_EQ("base keeps block", Action::Block, base_policy.action(ThreatCategory::RoleManipulation));
    ASSERT_EQ("base keeps preset threshold", 0.85, base_policy.global_threshold());
    ASSERT_EQ("derived has sanitize", Action::Sanitize,
              derived_policy.action(ThreatCategory::RoleManipulation));
    ASSERT_EQ("derived has new threshold", 0.2, derived_policy.global_threshold());

    auto broken = base.with_threshold(7.0);
    ASSERT_TRUE("invalid branch fails", !built(broken.build()));
    ASSERT_TRUE("base still builds", built(base.build()));
}

void test_delimiters() {
    std::cout << "\n[Delimiters]\n";
    auto base = PolicyBuilder::from_preset("moderate");

    auto policy = std::get<Policy>(base.with_delimiters({ "CONTEXT:", "USER:", "SYSTEM:" }).build());
    ASSERT_EQ("delimiters replaced", static_cast<std::size_t>(3), policy.delimiters().size());
    ASSERT_EQ("order kept", std::string("USER:"), policy.delimiters()[1]);

    ASSERT_EQ("empty delimiter", ConfigErrorCode::InvalidDelimiter,
              error_code(base.with_delimiters({ "USER:", "  " }).build()));
    ASSERT_EQ("oversized delimiter", ConfigErrorCode::InvalidDelimiter,
              error_code(base.with_delimiters({ std::string(65, 'A') }).build()));
    ASSERT_EQ("delimiter that sanitizing would produce", ConfigErrorCode::InvalidDelimiter,
              error_code(base.with_delimiters({ "REDACTED:" }).build()));
    ASSERT_EQ("delimiter inside a placeholder", ConfigErrorCode::InvalidDelimiter,
              error_code(base.with_delimiters({ "DATA]" }).build()));

    ASSERT_EQ("same delimiter in another case", ConfigErrorCode::InvalidDelimiter,
              error_code(base.with_delimiters({ "SYSTEM:", "system:" }).build()));
    ASSERT_TRUE("literal and tag form of one name allowed",
                built(base.with_delimiters({ "SYSTEM:", "[SYSTEM]" }).build()));

    std::vector<std::string> many;
    for (int i = 0; i < 33; ++i) many.push_back("D" + std::to_string(i) + ":");
    ASSERT_EQ("too many delimiters", ConfigErrorCode::InvalidDelimiter,
              error_code(base.with_delimiters(many).build()));
    ASSERT_TRUE("empty list allowed", built(base.with_delimiters({}).build()));
}

void test_max_length() {
    std::cout << "\n[MaxLength]\n";
    auto base = PolicyBuilder::from_preset("moderate");

    auto policy = std::get<Policy>(base.with_max_length(256, OversizeMode::Truncate).build());
    ASSERT_EQ("limit set", static_cast<std::size_t>(256), policy.max_input_length());
    ASSERT_TRUE("truncate mode", policy.oversize_mode() == OversizeMode::Truncate);

    ASSERT_EQ("zero limit", ConfigErrorCode::InvalidLimit,
              error_code(base.with_max_length(0).build()));
}

void test_phrases() {
    std::cout << "\n[CustomPhrases]\n";
    auto base = PolicyBuilder::from_preset("moderate");

    auto policy = std::get<Policy>(base.with_phrase(ThreatCategory::InstructionOverride, "jump the fence")
                                       .with_phrase("systemPromptLeak", "show|dump [your] secrets")
                                       .build());
    const auto& override_phrases = policy.custom_phrases(ThreatCategory::InstructionOverride);
    ASSERT_EQ("override phrase stored", static_cast<std::size_t>(1), override_phrases.size());
    ASSERT_EQ("override phrase confidence", 0.75, override_phrases[0].confidence);
    ASSERT_EQ("leak phrase confidence", 0.9,
              policy.custom_phrases(ThreatCategory::SystemPromptLeak)[0].confidence);

    ASSERT_EQ("encoding takes no phrases", ConfigErrorCode::UnsupportedCategory,
              error_code(base.with_phrase(ThreatCategory::Encoding, "abc").build()));
    ASSERT_EQ("only optional slots", ConfigErrorCode::InvalidPhrase,
              error_code(base.with_phrase(ThreatCategory::RoleManipulation, "[maybe]").build()));
    ASSERT_EQ("unmatchable word", ConfigErrorCode::InvalidPhrase,
              error_code(base.with_phrase(ThreatCategory::RoleManipulation, "be $root").build()));
    ASSERT_EQ("placeholder word", ConfigErrorCode::InvalidPhrase,
              error_code(base.with_phrase(ThreatCategory::SystemPromptLeak, "show redacted").build()));
    ASSERT_EQ("unknown category", ConfigErrorCode::UnknownCategory,
              error_code(base.with_phrase("tone", "be rude").build()));
}

void test_error_order() {
    std::cout << "\n[ErrorOrder]\n";
    auto result = PolicyBuilder::from_preset("moderate")
                      .with_action("encoding", "explode")
                      .with_threshold(2.0)
                      .build();
    ASSERT_EQ("thresholds are checked before actions", ConfigErrorCode::ThresholdOutOfRange,
              error_code(result));

    auto preset_first = PolicyBuilder::from_preset("nope").with_threshold(2.0).build();
    ASSERT_EQ("preset is checked first", ConfigErrorCode::UnknownPreset, error_code(preset_first));
}

void test_build_policy() {
    std::cout << "\n[BuildPolicy]\n";
    PolicyOverrides overrides;
    overrides.actions    = { { "roleManipulation", "sanitize" }, { "encoding", "warn" } };
    overrides.thresholds = { { "encoding", 0.9 } };
    overrides.delimiters = std::vector<std::string>{ "CONTEXT:", "USER:", "SYSTEM:" };

    auto result = build_policy("moderate", overrides);
    ASSERT_TRUE("overrides build", built(result));
    const auto& policy = std::get<Policy>(result);
    ASSERT_EQ("role sanitize", Action::Sanitize, policy.action(ThreatCategory::RoleManipulation));
    ASSERT_EQ("encoding warn", Action::Warn, policy.action(ThreatCategory::Encoding));
    ASSERT_EQ("encoding threshold", 0.9, policy.threshold(ThreatCategory::Encoding));
    ASSERT_EQ("delimiters", static_cast<std::size_t>(3), policy.delimiters().size());

    PolicyOverrides bad;
    bad.actions = { { "roleManipulation", "quarantine" } };
    auto failed_result = build_policy("strict", bad);
    ASSERT_EQ("bad action id", ConfigErrorCode::UnknownAction, error_code(failed_result));
    ASSERT_TRUE("error renders as json",
                to_json(std::get<ConfigError>(failed_result)).find("\"UnknownAction\"") != std::string::npos);
}

void test_default_actions() {
    std::cout << "\n[DefaultActions]\n";
    PolicyOverrides overrides;
    overrides.actions = { { "encoding", "block" } };

    auto merged = with_default_actions(overrides, {
        { "encoding",         "sanitize" },
        { "roleManipulation", "sanitize" },
    });
    ASSERT_EQ("explicit action kept", std::string("block"), merged.actions.at("encoding"));
    ASSERT_EQ("missing action filled", std::string("sanitize"), merged.actions.at("roleManipulation"));
    ASSERT_EQ("nothing else added", static_cast<std::size_t>(2), merged.actions.size());

    auto from_empty = with_default_actions(PolicyOverrides{}, { { "encoding", "warn" } });
    ASSERT_EQ("defaults apply when none given", std::string("warn"), from_empty.actions.at("encoding"));
}

void test_identifiers() {
    std::cout << "\n[Identifiers]\n";
    for (auto c : kCanonicalOrder) {
        ASSERT_TRUE(std::string("category round-trips: ") + to_string(c),
                    parse_category(to_string(c)) == c);
    }
    ASSERT_TRUE("unknown category id", !parse_category("Encoding").has_value());
    ASSERT_TRUE("action id", parse_action("sanitize") == Action::Sanitize);
    ASSERT_TRUE("unknown action id", !parse_action("drop").has_value());
    Finding f;
    Decision d;
    ASSERT_EQ("default finding category", ThreatCategory::InstructionOverride, f.category);
    ASSERT_EQ("default decision category", ThreatCategory::InstructionOverride, d.category);
    ASSERT_EQ("default decision action", Action::Allow, d.action);
    ASSERT_TRUE("severity order",
                severity(Action::Block) > severity(Action::Sanitize) &&
                severity(Action::Sanitize) > severity(Action::Warn) &&
                severity(Action::Warn) > severity(Action::Allow));
}

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    std::cout << "=== Policy Tests ===\n";

    test_presets();
    test_unknown_preset();
    test_thresholds();
    test_actions();
    test_builder_is_non_destructive();
    test_delimiters();
    test_max_length();
    test_phrases();
    test_error_order();
    test_build_policy();
    test_default_actions();
    test_identifiers();

    std::cout << "\n--- Results: "
              << passed << " passed, " << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
