#include "promptguard/phrase.hpp"

#include <algorithm>
#include <stdexcept>

namespace promptguard {

namespace {

bool slot_accepts(const PhraseSlot& slot, const std::string& word) {
    return std::find(slot.words.begin(), slot.words.end(), word) != slot.words.end();
}

} // namespace

std::optional<std::vector<PhraseSlot>> parse_phrase(std::string_view source, std::string& error) {
    std::vector<PhraseSlot> slots;
    bool has_required = false;

    std::size_t pos = 0;
    while (pos < source.size()) {
        while (pos < source.size() && source[pos] == ' ') ++pos;
        if (pos >= source.size()) break;

        std::size_t end = source.find(' ', pos);
        if (end == std::string_view::npos) end = source.size();
        std::string_view item = source.substr(pos, end - pos);
        pos = end;

        PhraseSlot slot;
        if (item.front() == '[') {
            if (item.size() < 3 || item.back() != ']') {
                error = "unterminated optional slot '" + std::string(item) + "'";
                return std::nullopt;
            }
            slot.optional = true;
            item = item.substr(1, item.size() - 2);
        }

        std::size_t start = 0;
        while (start <= item.size()) {
            std::size_t bar = item.find('|', start);
            if (bar == std::string_view::npos) bar = item.size();
            std::string word = to_lower_ascii(item.substr(start, bar - start));
            if (!is_token_word(word)) {
                error = "'" + word + "' is not a matchable word";
                return std::nullopt;
            }
            slot.words.push_back(std::move(word));
            start = bar + 1;
        }

        has_required = has_required || !slot.optional;
        slots.push_back(std::move(slot));
    }

    if (!has_required) {
        error = "phrase needs at least one required word";
        return std::nullopt;
    }
    return slots;
}

PhrasePattern make_phrase(std::string id, std::string_view source, double confidence,
                          std::string rationale) {
    std::string error;
    auto slots = parse_phrase(source, error);
    if (!slots) {
        throw std::invalid_argument("phrase '" + id + "': " + error);
    }
    return { std::move(id), std::move(*slots), confidence, std::move(rationale) };
}

std::vector<PhraseMatch> find_phrase(const std::vector<Token>& tokens, const PhrasePattern& pattern) {
    std::vector<PhraseMatch> matches;
    std::size_t i = 0;
    while (i < tokens.size()) {
        std::size_t t = i;
        bool ok = true;
        for (const auto& slot : pattern.slots) {
            if (t < tokens.size() && slot_accepts(slot, tokens[t].word)) {
                ++t;
            } else if (!slot.optional) {
                ok = false;
                break;
            }
        }
        if (ok && t > i) {
            matches.push_back({ i, t - i, tokens[i].begin, tokens[t - 1].end });
            i = t;
        } else {
            ++i;
        }
    }
    return matches;
}

} // namespace promptguard
