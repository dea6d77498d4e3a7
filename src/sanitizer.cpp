#include "promptguard/sanitizer.hpp"
#include "promptguard/detectors.hpp"
#include "promptguard/text.hpp"

namespace promptguard {

std::string sanitize_spans(ThreatCategory category, std::string_view text,
                           const std::vector<Finding>& findings) {
    std::vector<Span> spans;
    spans.reserve(findings.size());
    for (const auto& f : findings) {
        if (f.category == category) spans.push_back({ f.begin, f.end });
    }
    if (spans.empty()) return std::string(text);

    const auto placeholder = category == ThreatCategory::DelimiterInjection
                                 ? kDelimiterPlaceholder
                                 : kRedactionPlaceholder;
    return replace_spans(text, std::move(spans), placeholder);
}

std::string sanitize_encoding(std::string_view text) {
    // Stripping first means runs split by hidden characters are seen whole.
    const std::string cleaned = strip_invisible(text);
    return replace_spans(cleaned, find_encoded_runs(cleaned), kEncodedPlaceholder);
}

} // namespace promptguard
