#include "promptguard/detectors.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace promptguard {

namespace {

// ── Built-in phrase families ──────────────────────────────────────────────────

std::vector<PhrasePattern> override_phrases() {
    return {
        make_phrase("override.ignore-prior",
            "ignore|disregard|forget|skip|neglect|overlook|drop [all] [of] "
            "[the|your|my|any|these|those] "
            "previous|prior|above|earlier|preceding|former|original|past|foregoing|initial|existing "
            "instructions|instruction|directions|directives|rules|prompts|prompt|commands|"
            "guidelines|context|messages|orders",
            0.8, "asks to discard earlier instructions"),
        make_phrase("override.ignore-rules",
            "ignore|disregard|forget [all] [of] [your|the|any|these|my] "
            "instructions|rules|directives|guidelines|programming|training|constraints|"
            "restrictions|guardrails|filters",
            0.7, "asks to drop the model's rules"),
        make_phrase("override.disregard-above",
            "ignore|disregard|forget [all] [of] [the|everything|anything] "
            "above|before|previously|earlier|aforementioned",
            0.75, "asks to disregard preceding text"),
        make_phrase("override.forget-everything",
            "forget|disregard|ignore everything|anything [that] [you] "
            "[were|have|had|know|learned] [been] [told|taught|said]",
            0.65, "asks to forget prior context"),
        make_phrase("override.do-not-follow",
            "do not follow|obey [the|your|any] [previous|prior|above|original|system|earlier] "
            "instructions|rules|guidelines|directives|prompt",
            0.7, "tells the model not to follow its instructions"),
        make_phrase("override.stop-following",
            "don't|dont|stop|quit|cease follow|following|obey|obeying "
            "[the|your|any] [previous|prior|above|original|system|earlier] "
            "instructions|rules|guidelines|directives|prompt",
            0.7, "tells the model to stop following its instructions"),
        make_phrase("override.bypass",
            "override|bypass|circumvent|overwrite|disable|deactivate [all] [of] [your|the|any] "
            "[previous|prior|safety|security|system|content|original|ethical|moral] "
            "instructions|rules|guidelines|restrictions|filters|safeguards|guardrails|"
            "protocols|programming|policies|limitations",
            0.75, "asks to bypass safety rules"),
        make_phrase("override.reset",
            "reset|clear|wipe|erase [all] [of] [your|the] [previous|prior|current|existing] "
            "instructions|memory|context|rules|programming|conversation|directives",
            0.6, "asks to reset the model's context"),
        make_phrase("override.new-instructions",
            "[your|the|my|these] new|updated|revised instructions|directives|orders",
            0.5, "announces replacement instructions"),
    };
}

std::vector<PhrasePattern> role_phrases() {
    return {
        make_phrase("role.you-are-now", "you are now", 1.0, "reassigns the model's identity"),
        make_phrase("role.you-are-now", "you're|youre now", 1.0, "reassigns the model's identity"),
        make_phrase("role.from-now-on",
            "from now on [you|you're|youre] [are|will|shall|must] [be|act]",
            1.0, "redefines behaviour from this point on"),
        make_phrase("role.you-will-be",
            "you will|shall|must now be|act|become|behave|respond",
            1.0, "redefines behaviour from this point on"),
        make_phrase("role.act-as", "act|acting as [if] [you] [are|were]",
            1.0, "asks the model to act as someone else"),
        make_phrase("role.pretend", "pretend|pretending [that] [to] [you] be|are|you're|youre",
            1.0, "asks the model to pretend to be someone else"),
        make_phrase("role.roleplay", "roleplay|roleplaying as", 1.0, "requests a role-play persona"),
        make_phrase("role.roleplay", "role play|playing as", 1.0, "requests a role-play persona"),
        make_phrase("role.assume-role",
            "assume|take|adopt|play [on] the|a|an|your|this [new] role|persona|identity|character [of]",
            1.0, "assigns a new persona"),
        make_phrase("role.new-role", "your new role|persona|identity|name is",
            1.0, "assigns a new persona"),
        make_phrase("role.impersonate", "impersonate", 1.0, "asks the model to impersonate someone"),
        make_phrase("role.mode-switch",
            "enable|enter|activate|switch [to|into|on] "
            "developer|dan|jailbreak|god|unrestricted|unfiltered mode",
            1.0, "switches to an unrestricted mode"),
    };
}

std::vector<PhrasePattern> leak_phrases() {
    return {
        make_phrase("leak.reveal-yours",
            "reveal|show|print|display|output|repeat|tell|give|leak|dump|share|expose|recite|"
            "disclose|list|write [me|us] [out] your "
            "[hidden|secret|original|initial|full|entire|exact|complete|internal|confidential|underlying] "
            "[system|initial|hidden|original|internal] "
            "prompt|prompts|instructions|instruction|rules|guidelines|directives|configuration|programming",
            kLeakConfidence, "requests the hidden system instructions"),
        make_phrase("leak.reveal-system",
            "reveal|show|print|display|output|repeat|tell|give|leak|dump|share|expose|recite|"
            "disclose [me|us] [out] [the|this|that] "
            "[hidden|secret|original|initial|full|entire|exact|complete|internal|confidential] "
            "system|developer|hidden|secret prompt|prompts|instructions|message|rules",
            kLeakConfidence, "requests the hidden system instructions"),
        make_phrase("leak.what-are-yours",
            "what|what's|whats [is|are|was|were] your [hidden|secret|original|initial|exact|real] "
            "[system] prompt|prompts|instructions|rules|guidelines|directives|constraints|programming",
            kLeakConfidence, "asks what the hidden instructions are"),
        make_phrase("leak.repeat-above",
            "repeat|print|output|echo|copy|recite [back] [all] [of] [the] "
            "text|words|content|everything|messages|lines|instructions above|before|verbatim",
            kLeakConfidence, "asks to echo the preceding context"),
        make_phrase("leak.how-programmed",
            "how were|are you programmed|instructed|prompted|configured",
            kLeakConfidence, "asks how the model was instructed"),
    };
}

// ── Shared helpers ────────────────────────────────────────────────────────────

double clamp01(double v) {
    return std::max(0.0, std::min(1.0, v));
}

struct PhraseHit {
    const PhrasePattern* pattern;
    PhraseMatch          match;
};

struct PhraseScan {
    std::vector<PhraseHit> hits;    // sorted by position
    std::size_t            words = 0;
};

// Scans both invisible-character readings of `text` and merges the matches.
// A pattern matching the same words in both readings is reported once.
PhraseScan scan_phrases(ThreatCategory category, std::string_view text, const Policy& policy) {
    PhraseScan scan;
    const auto joined = tokenize(text, InvisibleMode::Skip);
    const auto split  = tokenize(text, InvisibleMode::Break);
    scan.words = joined.size();

    auto collect = [&](const std::vector<Token>& tokens) {
        for (const auto* patterns : { &builtin_phrases(category), &policy.custom_phrases(category) }) {
            for (const auto& pattern : *patterns) {
                for (const auto& m : find_phrase(tokens, pattern)) {
                    scan.hits.push_back({ &pattern, m });
                }
            }
        }
    };
    collect(joined);
    // Same token count means no word held an invisible character.
    if (split.size() != joined.size()) collect(split);

    auto& hits = scan.hits;
    std::sort(hits.begin(), hits.end(), [](const PhraseHit& a, const PhraseHit& b) {
        return a.match.begin < b.match.begin ||
               (a.match.begin == b.match.begin && a.match.end > b.match.end);
    });

    std::unordered_map<const PhrasePattern*, std::size_t> kept_end;
    std::vector<PhraseHit> merged;
    merged.reserve(hits.size());
    for (const auto& hit : hits) {
        auto it = kept_end.find(hit.pattern);
        if (it != kept_end.end() && hit.match.begin < it->second) continue;
        kept_end[hit.pattern] = hit.match.end;
        merged.push_back(hit);
    }
    hits = std::move(merged);
    return scan;
}

Finding make_finding(ThreatCategory category, std::size_t begin, std::size_t end,
                     double confidence, const std::string& id, const std::string& rationale) {
    return { category, begin, end, clamp01(confidence), id, rationale };
}

// ── Delimiter scanning ────────────────────────────────────────────────────────

struct Marker {
    const char* literal;   // lower case
    const char* key;       // distinct-token identity
};

// Chat-template markers scanned regardless of configuration.
constexpr Marker kBuiltinMarkers[] = {
    { "<|im_start|>",  "<|im_*|>" },
    { "<|im_end|>",    "<|im_*|>" },
    { "<|endoftext|>", "<|endoftext|>" },
    { "[inst]",        "[INST]" },
    { "[/inst]",       "[INST]" },
    { "<<sys>>",       "<<SYS>>" },
    { "<</sys>>",      "<<SYS>>" },
};

bool is_alnum_byte(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool is_name_byte(char c) {
    return is_alnum_byte(c) || c == '_' || c == '-';
}

char lower_byte(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

// Case-insensitive occurrences of `needle` (already lower case). Cost is
// O(text * needle) and needles are bounded by kMaxDelimiterLength.
std::vector<std::size_t> find_folded(std::string_view text, std::string_view needle,
                                     bool word_boundary) {
    std::vector<std::size_t> hits;
    if (needle.empty() || needle.size() > text.size()) return hits;
    const bool check_boundary = word_boundary && is_alnum_byte(needle.front());

    std::size_t i = 0;
    while (i + needle.size() <= text.size()) {
        std::size_t k = 0;
        while (k < needle.size() && lower_byte(text[i + k]) == needle[k]) ++k;
        if (k == needle.size() && !(check_boundary && i > 0 && is_alnum_byte(text[i - 1]))) {
            hits.push_back(i);
            i += needle.size();
        } else {
            ++i;
        }
    }
    return hits;
}

// Parses "<name>", "</name>", "[name]", "[/name]" or "<|name|>" at `pos`.
// Returns the end offset, or 0 when no tag starts there.
std::size_t parse_tag(std::string_view text, std::size_t pos, std::string& name) {
    const char open = text[pos];
    const char close = open == '<' ? '>' : ']';
    std::size_t i = pos + 1;
    auto skip_spaces = [&]() { while (i < text.size() && text[i] == ' ') ++i; };

    if (i < text.size() && text[i] == '/') ++i;
    if (i < text.size() && text[i] == '|') ++i;
    skip_spaces();

    name.clear();
    while (i < text.size() && is_name_byte(text[i]) && name.size() < kMaxDelimiterLength) {
        name.push_back(lower_byte(text[i]));
        ++i;
    }
    if (name.empty()) return 0;

    skip_spaces();
    if (i < text.size() && text[i] == '|') ++i;
    if (i < text.size() && text[i] == close) return i + 1;
    return 0;
}

} // namespace

// ── Phrase tables ─────────────────────────────────────────────────────────────

bool has_phrase_detector(ThreatCategory category) {
    return category == ThreatCategory::InstructionOverride ||
           category == ThreatCategory::RoleManipulation ||
           category == ThreatCategory::SystemPromptLeak;
}

const std::vector<PhrasePattern>& builtin_phrases(ThreatCategory category) {
    static const std::vector<PhrasePattern> overrides = override_phrases();
    static const std::vector<PhrasePattern> roles     = role_phrases();
    static const std::vector<PhrasePattern> leaks     = leak_phrases();
    static const std::vector<PhrasePattern> none;

    switch (category) {
        case ThreatCategory::InstructionOverride: return overrides;
        case ThreatCategory::RoleManipulation:    return roles;
        case ThreatCategory::SystemPromptLeak:    return leaks;
        default:                                  return none;
    }
}

// ── instructionOverride ───────────────────────────────────────────────────────

std::vector<Finding> detect_instruction_override(std::string_view text, const Policy& policy) {
    const auto category = ThreatCategory::InstructionOverride;
    const std::size_t front_window = std::max(kFrontWindowBytes, text.size() / 10);

    const auto scan = scan_phrases(category, text, policy);
    std::vector<Finding> findings;
    for (const auto& hit : scan.hits) {
        double confidence = hit.pattern->confidence;
        std::string rationale = hit.pattern->rationale;
        if (hit.match.begin < front_window) {
            confidence += kFrontBoost;
            rationale += " (near start of input)";
        }
        findings.push_back(make_finding(category, hit.match.begin, hit.match.end,
                                        confidence, hit.pattern->id, rationale));
    }
    return findings;
}

// ── roleManipulation ──────────────────────────────────────────────────────────

std::vector<Finding> detect_role_manipulation(std::string_view text, const Policy& policy) {
    const auto category = ThreatCategory::RoleManipulation;
    const auto scan = scan_phrases(category, text, policy);
    const auto& hits = scan.hits;
    if (hits.empty()) return {};

    // Match density: one hit in a short message is decisive, in a long
    // document it is not.
    const double words = std::max(kRoleReferenceWords, static_cast<double>(scan.words));
    const double confidence = clamp01(static_cast<double>(hits.size()) * kRoleReferenceWords / words);

    std::vector<Finding> findings;
    for (const auto& hit : hits) {
        findings.push_back(make_finding(category, hit.match.begin, hit.match.end,
                                        confidence, hit.pattern->id, hit.pattern->rationale));
    }
    return findings;
}

// ── delimiterInjection ────────────────────────────────────────────────────────

std::string delimiter_tag_name(std::string_view delimiter) {
    std::size_t b = 0, e = delimiter.size();
    auto is_trim = [](char c) {
        return c == ' ' || c == '\t' || c == ':' || c == '<' || c == '>' ||
               c == '[' || c == ']' || c == '|' || c == '/';
    };
    while (b < e && is_trim(delimiter[b])) ++b;
    while (e > b && is_trim(delimiter[e - 1])) --e;
    if (b == e || e - b > kMaxDelimiterLength) return {};

    std::string name;
    for (std::size_t i = b; i < e; ++i) {
        if (!is_name_byte(delimiter[i])) return {};
        name.push_back(lower_byte(delimiter[i]));
    }
    return name;
}

std::vector<Finding> detect_delimiter_injection(std::string_view text, const Policy& policy) {
    const auto category = ThreatCategory::DelimiterInjection;

    // `key` identifies the token for scoring, `label` is what the rationale shows.
    struct Hit { std::size_t begin; std::size_t end; std::string key; std::string label; std::string id; };
    std::vector<Hit> hits;

    std::unordered_map<std::string, std::string> names;   // tag name -> delimiter
    for (const auto& delimiter : policy.delimiters()) {
        const auto folded = to_lower_ascii(delimiter);
        auto name = delimiter_tag_name(delimiter);
        const std::string key = name.empty() ? folded : name;
        for (auto pos : find_folded(text, folded, true)) {
            hits.push_back({ pos, pos + delimiter.size(), key, delimiter, "delimiter.literal" });
        }
        if (!name.empty()) names.emplace(std::move(name), delimiter);
    }

    for (const auto& marker : kBuiltinMarkers) {
        std::string_view literal = marker.literal;
        for (auto pos : find_folded(text, literal, false)) {
            hits.push_back({ pos, pos + literal.size(), marker.key, marker.key, "delimiter.template-marker" });
        }
    }

    if (!names.empty()) {
        std::string name;
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] != '<' && text[i] != '[') continue;
            const std::size_t end = parse_tag(text, i, name);
            if (end == 0) continue;
            auto it = names.find(name);
            if (it == names.end()) continue;
            hits.push_back({ i, end, it->first, it->second, "delimiter.tag" });
            i = end - 1;
        }
    }

    if (hits.empty()) return {};

    std::stable_sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
        return a.begin < b.begin || (a.begin == b.begin && a.end > b.end);
    });
    // One span is one token, however many settings or markers matched it.
    hits.erase(std::unique(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
                   return a.begin == b.begin && a.end == b.end;
               }),
               hits.end());

    // Distinct tokens, not occurrences, drive the score.
    std::unordered_set<std::string> distinct;
    for (const auto& h : hits) distinct.insert(h.key);
    const double confidence = clamp01(kDelimiterBaseConfidence +
                                      kDelimiterStep * static_cast<double>(distinct.size() - 1));

    std::vector<Finding> findings;
    for (const auto& h : hits) {
        findings.push_back(make_finding(category, h.begin, h.end, confidence, h.id,
                                        "embedded delimiter '" + h.label + "'"));
    }
    return findings;
}

// ── systemPromptLeak ──────────────────────────────────────────────────────────

std::vector<Finding> detect_system_prompt_leak(std::string_view text, const Policy& policy) {
    const auto category = ThreatCategory::SystemPromptLeak;
    const auto scan = scan_phrases(category, text, policy);
    std::vector<Finding> findings;
    for (const auto& hit : scan.hits) {
        findings.push_back(make_finding(category, hit.match.begin, hit.match.end,
                                        kLeakConfidence, hit.pattern->id, hit.pattern->rationale));
    }
    return findings;
}

} // namespace promptguard
