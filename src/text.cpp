#include "promptguard/text.hpp"

#include <algorithm>

namespace promptguard {

namespace {

bool is_continuation(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

bool is_ascii_alnum(char32_t c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

// ASCII apostrophe, right single quotation mark, modifier letter apostrophe.
bool is_apostrophe(char32_t c) {
    return c == '\'' || c == 0x2019 || c == 0x02BC;
}

char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // namespace

// ── UTF-8 ─────────────────────────────────────────────────────────────────────

CodePoint decode_utf8(std::string_view text, std::size_t pos) {
    CodePoint cp;
    if (pos >= text.size()) return cp;

    const auto b0 = static_cast<unsigned char>(text[pos]);
    if (b0 < 0x80) {
        cp.value = b0;
        cp.valid = true;
        return cp;
    }

    std::size_t len = 0;
    char32_t value = 0;
    unsigned char lo = 0x80, hi = 0xBF;   // allowed range of the second byte
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2; value = b0 & 0x1F;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3; value = b0 & 0x0F;
        if (b0 == 0xE0) lo = 0xA0;        // overlong
        if (b0 == 0xED) hi = 0x9F;        // surrogates
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4; value = b0 & 0x07;
        if (b0 == 0xF0) lo = 0x90;
        if (b0 == 0xF4) hi = 0x8F;
    } else {
        return cp;
    }

    if (pos + len > text.size()) return cp;
    const auto b1 = static_cast<unsigned char>(text[pos + 1]);
    if (b1 < lo || b1 > hi) return cp;
    for (std::size_t i = 1; i < len; ++i) {
        const auto b = static_cast<unsigned char>(text[pos + i]);
        if (!is_continuation(b)) return cp;
        value = (value << 6) | (b & 0x3F);
    }

    cp.value  = value;
    cp.length = len;
    cp.valid  = true;
    return cp;
}

CharClass classify(const CodePoint& cp) {
    if (!cp.valid) return CharClass::Malformed;
    const char32_t c = cp.value;

    if (c < 0x80) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') return CharClass::Whitespace;
        if (c < 0x20 || c == 0x7F) return CharClass::Control;
        return CharClass::Printable;
    }
    if (c <= 0x9F) return CharClass::Control;

    if ((c >= 0x200B && c <= 0x200D) || (c >= 0x2060 && c <= 0x2064) ||
        c == 0xFEFF || c == 0x180E || c == 0x00AD) {
        return CharClass::ZeroWidth;
    }
    if (c == 0x200E || c == 0x200F || (c >= 0x202A && c <= 0x202E) ||
        (c >= 0x2066 && c <= 0x2069) || c == 0x061C) {
        return CharClass::Bidi;
    }
    if (c >= 0xE0000 && c <= 0xE007F) return CharClass::TagChar;

    if (c == 0x00A0 || (c >= 0x2000 && c <= 0x200A) || c == 0x2028 ||
        c == 0x2029 || c == 0x202F || c == 0x3000) {
        return CharClass::Whitespace;
    }
    return CharClass::Printable;
}

std::size_t utf8_floor(std::string_view text, std::size_t limit) {
    if (limit >= text.size()) return text.size();
    std::size_t pos = limit;
    // At most three continuation bytes precede a boundary.
    for (int back = 0; back < 3 && pos > 0; ++back) {
        if (!is_continuation(static_cast<unsigned char>(text[pos]))) break;
        --pos;
    }
    if (pos < limit) {
        const auto cp = decode_utf8(text, pos);
        if (!cp.valid || pos + cp.length > limit) return pos;
        return limit;
    }
    return pos;
}

// ── Words ─────────────────────────────────────────────────────────────────────

std::vector<Token> tokenize(std::string_view text, InvisibleMode mode) {
    std::vector<Token> tokens;
    Token current;
    bool in_word = false;
    std::size_t last_alnum_end = 0;

    auto finish = [&]() {
        if (!in_word) return;
        while (!current.word.empty() && current.word.back() == '\'') {
            current.word.pop_back();
        }
        if (!current.word.empty()) {
            current.end = last_alnum_end;
            tokens.push_back(std::move(current));
        }
        current = Token{};
        in_word = false;
    };

    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto cp = decode_utf8(text, pos);
        const char32_t c = cp.valid ? cp.value : 0xFFFD;

        if (is_ascii_alnum(c)) {
            if (!in_word) {
                in_word = true;
                current.begin = pos;
            }
            current.word.push_back(ascii_lower(static_cast<char>(c)));
            last_alnum_end = pos + 1;
        } else if (is_apostrophe(c) && in_word) {
            current.word.push_back('\'');
        } else if (in_word && mode == InvisibleMode::Skip && is_invisible(classify(cp))) {
            // skipped; keeps the word intact
        } else {
            finish();
        }
        pos += cp.length;
    }
    finish();
    return tokens;
}

bool is_token_word(std::string_view word) {
    if (word.empty() || word.front() == '\'' || word.back() == '\'') return false;
    for (char c : word) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '\'';
        if (!ok) return false;
    }
    return true;
}

std::string to_lower_ascii(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = ascii_lower(c);
    return out;
}

// ── Rewriting ─────────────────────────────────────────────────────────────────

std::string replace_spans(std::string_view text, std::vector<Span> spans,
                          std::string_view replacement) {
    std::sort(spans.begin(), spans.end(), [](const Span& a, const Span& b) {
        return a.begin < b.begin || (a.begin == b.begin && a.end > b.end);
    });

    std::string out;
    out.reserve(text.size());
    std::size_t cursor = 0;
    std::size_t i = 0;
    while (i < spans.size()) {
        std::size_t begin = std::min(spans[i].begin, text.size());
        std::size_t end   = std::min(spans[i].end, text.size());
        for (++i; i < spans.size() && spans[i].begin <= end; ++i) {
            end = std::max(end, std::min(spans[i].end, text.size()));
        }
        if (end <= begin) continue;
        begin = std::max(begin, cursor);
        out.append(text.substr(cursor, begin - cursor));
        out.append(replacement);
        cursor = end;
    }
    out.append(text.substr(cursor));
    return out;
}

} // namespace promptguard
