#include "promptguard/detectors.hpp"

#include <algorithm>

namespace promptguard {

namespace {

struct AnomalyKind {
    const char* id;
    double      base;
    const char* rationale;
};

constexpr AnomalyKind kZeroWidth  { "encoding.zero-width",        0.45, "zero-width characters" };
constexpr AnomalyKind kBidi       { "encoding.bidi-control",      0.75, "bidirectional control characters" };
constexpr AnomalyKind kTagChars   { "encoding.tag-characters",    0.9,  "Unicode tag characters" };
constexpr AnomalyKind kControl    { "encoding.control-characters", 0.3, "non-printable control characters" };
constexpr AnomalyKind kMalformed  { "encoding.malformed-utf8",    0.4,  "malformed UTF-8 bytes" };
constexpr AnomalyKind kBase64Run  { "encoding.base64-run",        0.6,  "base64-like encoded run" };
constexpr AnomalyKind kHexRun     { "encoding.hex-run",           0.5,  "hex-encoded run" };
constexpr AnomalyKind kEscapeRun  { "encoding.escape-run",        0.6,  "run of escape sequences" };

const AnomalyKind* kind_of(CharClass c) {
    switch (c) {
        case CharClass::ZeroWidth: return &kZeroWidth;
        case CharClass::Bidi:      return &kBidi;
        case CharClass::TagChar:   return &kTagChars;
        case CharClass::Control:   return &kControl;
        case CharClass::Malformed: return &kMalformed;
        default:                   return nullptr;
    }
}

struct Anomaly {
    const AnomalyKind* kind;
    std::size_t        begin;
    std::size_t        end;
    bool               hidden_payload = false;
};

bool is_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool is_base64_body(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '+' || c == '/';
}

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::string decode_base64(std::string_view run) {
    std::string out;
    int acc = 0, bits = -8;
    for (char c : run) {
        const int v = base64_value(c);
        if (v < 0) break;
        acc = ((acc << 6) | v) & 0xFFFFFF;
        bits += 6;
        if (bits >= 0) {
            out.push_back(static_cast<char>((acc >> bits) & 0xFF));
            bits -= 8;
        }
    }
    return out;
}

bool mostly_printable(std::string_view bytes) {
    if (bytes.empty()) return false;
    std::size_t printable = 0;
    for (char ch : bytes) {
        const auto c = static_cast<unsigned char>(ch);
        if ((c >= 0x20 && c < 0x7F) || c == '\n' || c == '\r' || c == '\t') ++printable;
    }
    return printable * 10 >= bytes.size() * 9;
}

// True when a decoded payload reads like an injection in its own right.
bool carries_instructions(std::string_view decoded, const Policy& policy) {
    if (!mostly_printable(decoded)) return false;
    for (auto mode : { InvisibleMode::Skip, InvisibleMode::Break }) {
        const auto tokens = tokenize(decoded, mode);
        for (auto category : { ThreatCategory::InstructionOverride, ThreatCategory::RoleManipulation,
                               ThreatCategory::SystemPromptLeak }) {
            for (const auto* patterns : { &builtin_phrases(category), &policy.custom_phrases(category) }) {
                for (const auto& pattern : *patterns) {
                    if (!find_phrase(tokens, pattern).empty()) return true;
                }
            }
        }
    }
    return false;
}

// Maximal runs of the base64 alphabet, with trailing padding.
void scan_alphabet_runs(std::string_view text, std::vector<Anomaly>& out) {
    std::size_t i = 0;
    while (i < text.size()) {
        if (!is_base64_body(text[i])) { ++i; continue; }

        const std::size_t begin = i;
        bool upper = false, lower = false, digit = false, symbol = false, all_hex = true;
        while (i < text.size() && is_base64_body(text[i])) {
            const char c = text[i];
            upper  = upper  || (c >= 'A' && c <= 'Z');
            lower  = lower  || (c >= 'a' && c <= 'z');
            digit  = digit  || (c >= '0' && c <= '9');
            symbol = symbol || c == '+' || c == '/';
            all_hex = all_hex && is_hex(c);
            ++i;
        }
        const std::size_t body_end = i;
        while (i < text.size() && text[i] == '=') ++i;
        const bool padded = i > body_end;

        std::size_t hex_begin = begin;
        if (!all_hex && body_end - begin > 2 && text[begin] == '0' &&
            (text[begin + 1] == 'x' || text[begin + 1] == 'X')) {
            all_hex = std::all_of(text.begin() + begin + 2, text.begin() + body_end, is_hex);
            hex_begin = begin + 2;
        }

        const std::size_t length = i - begin;
        if (length < kMinEncodedRun) continue;

        if (all_hex && !padded && body_end - hex_begin >= kMinEncodedRun && digit &&
            std::any_of(text.begin() + hex_begin, text.begin() + body_end,
                        [](char c) { return !(c >= '0' && c <= '9'); })) {
            out.push_back({ &kHexRun, begin, i });
        } else if (upper && lower && (digit || symbol || padded)) {
            out.push_back({ &kBase64Run, begin, i });
        }
    }
}

// \xNN, \uNNNN, %NN, &#NNN; and &#xHH; units. Returns 0 when none starts at pos.
std::size_t escape_unit(std::string_view text, std::size_t pos) {
    const std::size_t n = text.size();
    auto hex_count = [&](std::size_t from, std::size_t max) {
        std::size_t k = 0;
        while (k < max && from + k < n && is_hex(text[from + k])) ++k;
        return k;
    };

    if (text[pos] == '\\' && pos + 1 < n) {
        if (text[pos + 1] == 'x' && hex_count(pos + 2, 2) == 2) return 4;
        if (text[pos + 1] == 'u' && hex_count(pos + 2, 4) == 4) return 6;
        return 0;
    }
    if (text[pos] == '%') {
        return hex_count(pos + 1, 2) == 2 ? 3 : 0;
    }
    if (text[pos] == '&' && pos + 1 < n && text[pos + 1] == '#') {
        std::size_t i = pos + 2;
        std::size_t digits = 0;
        if (i < n && (text[i] == 'x' || text[i] == 'X')) {
            ++i;
            digits = hex_count(i, 6);
        } else {
            while (digits < 7 && i + digits < n && text[i + digits] >= '0' && text[i + digits] <= '9') ++digits;
        }
        i += digits;
        if (digits > 0 && i < n && text[i] == ';') return i + 1 - pos;
    }
    return 0;
}

void scan_escape_runs(std::string_view text, std::vector<Anomaly>& out) {
    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t len = escape_unit(text, i);
        if (len == 0) { ++i; continue; }

        const std::size_t begin = i;
        std::size_t units = 0;
        while (len > 0) {
            i += len;
            ++units;
            len = i < text.size() ? escape_unit(text, i) : 0;
        }
        if (units >= kMinEscapeUnits) out.push_back({ &kEscapeRun, begin, i });
    }
}

// Consecutive code points of the same anomalous class become one run.
void scan_characters(std::string_view text, std::vector<Anomaly>& out) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto cp = decode_utf8(text, pos);
        const AnomalyKind* kind = kind_of(classify(cp));
        if (kind && !out.empty() && out.back().kind == kind && out.back().end == pos) {
            out.back().end = pos + cp.length;
        } else if (kind) {
            out.push_back({ kind, pos, pos + cp.length });
        }
        pos += cp.length;
    }
}

} // namespace

// ── encoding ──────────────────────────────────────────────────────────────────

std::vector<Finding> detect_encoding(std::string_view text, const Policy& policy) {
    std::vector<Anomaly> anomalies;
    scan_characters(text, anomalies);
    scan_alphabet_runs(text, anomalies);
    scan_escape_runs(text, anomalies);
    if (anomalies.empty()) return {};

    std::size_t anomalous = 0;
    for (auto& a : anomalies) {
        anomalous += a.end - a.begin;
        if (a.kind == &kBase64Run) {
            a.hidden_payload = carries_instructions(decode_base64(text.substr(a.begin, a.end - a.begin)), policy);
        }
    }
    const double ratio = std::min(1.0, static_cast<double>(anomalous) / static_cast<double>(text.size()));

    std::sort(anomalies.begin(), anomalies.end(), [](const Anomaly& a, const Anomaly& b) {
        return a.begin < b.begin || (a.begin == b.begin && a.end > b.end);
    });

    std::vector<Finding> findings;
    for (const auto& a : anomalies) {
        Finding f { ThreatCategory::Encoding, a.begin, a.end,
                    std::min(1.0, a.kind->base + kAnomalyRatioWeight * ratio),
                    a.kind->id, a.kind->rationale };
        if (a.hidden_payload) {
            f.confidence  = std::max(f.confidence, kHiddenPayloadConfidence);
            f.detector_id = "encoding.hidden-instructions";
            f.rationale   = "encoded run decodes to injected instructions";
        }
        findings.push_back(std::move(f));
    }
    return findings;
}

std::string strip_invisible(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto cp = decode_utf8(text, pos);
        if (!kind_of(classify(cp))) out.append(text.substr(pos, cp.length));
        pos += cp.length;
    }
    return out;
}

std::vector<Span> find_encoded_runs(std::string_view text) {
    std::vector<Anomaly> runs;
    scan_alphabet_runs(text, runs);
    scan_escape_runs(text, runs);

    std::vector<Span> spans;
    spans.reserve(runs.size());
    for (const auto& r : runs) spans.push_back({ r.begin, r.end });
    return spans;
}

} // namespace promptguard
