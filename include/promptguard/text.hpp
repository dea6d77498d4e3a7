#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

// ── UTF-8 ────────────────────────────────────────────────────────────────────

struct CodePoint {
    char32_t    value  = 0;
    std::size_t length = 1;      // bytes consumed, always >= 1
    bool        valid  = false;  // false for malformed or truncated sequences
};

/// Decodes the code point starting at `pos`. Malformed input consumes one byte.
CodePoint decode_utf8(std::string_view text, std::size_t pos);

enum class CharClass {
    Printable,
    Whitespace,
    ZeroWidth,   // U+200B..U+200D, U+2060..U+2064, U+FEFF, U+180E, U+00AD
    Bidi,        // U+200E, U+200F, U+202A..U+202E, U+2066..U+2069, U+061C
    TagChar,     // U+E0000..U+E007F
    Control,     // C0 (except tab, LF, CR), DEL, C1
    Malformed
};

CharClass classify(const CodePoint& cp);

/// Characters that render as nothing but survive copy/paste.
inline bool is_invisible(CharClass c) {
    return c == CharClass::ZeroWidth || c == CharClass::Bidi || c == CharClass::TagChar;
}

/// Largest code point boundary that is <= limit.
std::size_t utf8_floor(std::string_view text, std::size_t limit);

// ── Words ────────────────────────────────────────────────────────────────────

struct Token {
    std::string word;        // lower-cased ASCII
    std::size_t begin = 0;   // byte offsets into the tokenized text
    std::size_t end   = 0;
};

// How invisible code points inside a word are treated.
enum class InvisibleMode {
    Skip,    // "ig<U+200B>nore" reads as "ignore"
    Break    // "ignore<U+200B>all" reads as "ignore", "all"
};

/**
 * Splits text into lower-cased words of ASCII letters, digits and inner
 * apostrophes (', U+2019 and U+02BC all read as '). Phrase scanning runs over
 * both invisible modes, so a hidden character can neither split a keyword
 * nor join two of them.
 */
std::vector<Token> tokenize(std::string_view text, InvisibleMode mode = InvisibleMode::Skip);

/// True when `word` is exactly what tokenize() could produce for some input.
bool is_token_word(std::string_view word);

std::string to_lower_ascii(std::string_view s);

// ── Rewriting ────────────────────────────────────────────────────────────────

struct Span {
    std::size_t begin = 0;
    std::size_t end   = 0;
};

/**
 * Replaces every span with `replacement` (empty to delete). Spans may arrive
 * unsorted and overlapping; overlapping or touching spans are merged first.
 */
std::string replace_spans(std::string_view text, std::vector<Span> spans,
                          std::string_view replacement);

} // namespace promptguard
