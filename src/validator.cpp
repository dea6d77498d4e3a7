#include "promptguard/validator.hpp"
#include "promptguard/decision.hpp"
#include "promptguard/detectors.hpp"
#include "promptguard/sanitizer.hpp"
#include "promptguard/text.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace promptguard {

// ── Validator ─────────────────────────────────────────────────────────────────

void Validator::register_detector(Detector detector) {
    detectors_.push_back(std::move(detector));
}

std::vector<Finding> Validator::run_detectors(ThreatCategory category, std::string_view text,
                                              const Policy& policy) const {
    std::vector<Finding> findings;
    for (const auto& detector : detectors_) {
        if (detector.category != category) continue;
        for (auto& f : detector.detect(text, policy)) {
            if (f.category != category || f.begin > f.end || f.end > text.size()) {
                throw std::out_of_range(detector.name + " reported an invalid finding [" +
                                        std::to_string(f.begin) + "," + std::to_string(f.end) + ")");
            }
            findings.push_back(std::move(f));
        }
    }
    return findings;
}

Decision Validator::evaluate(ThreatCategory category, std::string_view text,
                             const Policy& policy) const {
    try {
        return decide(category, run_detectors(category, text, policy), policy);
    } catch (const std::exception& ex) {
        spdlog::warn("promptguard: detector for {} failed, treating as triggered: {}",
                     to_string(category), ex.what());
        return decide_faulted(category, ex.what(), policy);
    }
}

std::string Validator::sanitize(ThreatCategory category, const std::string& text,
                                const Policy& policy) const {
    if (category == ThreatCategory::Encoding) {
        return sanitize_encoding(text);
    }
    // Spans from the original scan are stale once earlier rewrites ran.
    return sanitize_spans(category, text, run_detectors(category, text, policy));
}

ValidationResult Validator::validate(std::string_view input, const Policy& policy) const {
    std::vector<std::string> notes;
    std::string_view text = input;

    if (input.size() > policy.max_input_length()) {
        const std::string size_note = "input is " + std::to_string(input.size()) +
                                      " bytes, limit is " + std::to_string(policy.max_input_length());
        if (policy.oversize_mode() == OversizeMode::Reject) {
            spdlog::debug("promptguard: rejected oversized input ({} bytes)", input.size());
            Rejection r;
            r.kind = RejectionKind::InputTooLong;
            r.notes.push_back(size_note);
            return r;
        }
        text = input.substr(0, utf8_floor(input, policy.max_input_length()));
        notes.push_back(size_note + "; truncated to " + std::to_string(text.size()));
        spdlog::warn("promptguard: truncated input from {} to {} bytes", input.size(), text.size());
    }

    std::vector<Decision> decisions;
    decisions.reserve(kCanonicalOrder.size());
    for (auto category : kCanonicalOrder) {
        decisions.push_back(evaluate(category, text, policy));
        const auto& d = decisions.back();
        if (d.triggered) {
            spdlog::debug("promptguard: {} triggered, score={:.2f} threshold={:.2f} action={}",
                          to_string(d.category), d.score, d.threshold, to_string(d.action));
        }
    }

    auto reject = [&](const Decision& cause) {
        Rejection r;
        r.kind      = RejectionKind::Threat;
        r.category  = cause.category;
        r.score     = cause.score;
        r.threshold = cause.threshold;
        r.notes     = notes;
        spdlog::debug("promptguard: rejected, cause={} score={:.2f}", to_string(cause.category), cause.score);
        return r;
    };

    if (const Decision* blocking = first_blocking(decisions)) {
        Rejection r = reject(*blocking);
        r.decisions = std::move(decisions);
        return r;
    }

    Success ok;
    std::string current(text);
    for (auto& d : decisions) {
        if (d.action == Action::Sanitize) {
            try {
                current = sanitize(d.category, current, policy);
            } catch (const std::exception& ex) {
                spdlog::warn("promptguard: sanitizer for {} failed, rejecting: {}",
                             to_string(d.category), ex.what());
                d.action = Action::Block;
                d.fault  = ex.what();
                Rejection r = reject(d);
                r.decisions = std::move(decisions);
                return r;
            }
        } else if (d.action == Action::Warn) {
            ok.warnings.push_back(d);
        }
    }

    if (const auto& on_warn = policy.warn_handler()) {
        for (const auto& w : ok.warnings) on_warn(w);
    }

    ok.text  = std::move(current);
    ok.notes = std::move(notes);
    return ok;
}

// ── Built-in detectors ────────────────────────────────────────────────────────

Detector instruction_override_detector() {
    return {
        ThreatCategory::InstructionOverride,
        "instructionOverride.phrases",
        "Phrases that tell the model to discard its prior instructions.",
        detect_instruction_override
    };
}

Detector role_manipulation_detector() {
    return {
        ThreatCategory::RoleManipulation,
        "roleManipulation.phrases",
        "Phrases that reassign the model's role or persona.",
        detect_role_manipulation
    };
}

Detector delimiter_injection_detector() {
    return {
        ThreatCategory::DelimiterInjection,
        "delimiterInjection.tokens",
        "Prompt delimiters and chat-template markers inside user text.",
        detect_delimiter_injection
    };
}

Detector system_prompt_leak_detector() {
    return {
        ThreatCategory::SystemPromptLeak,
        "systemPromptLeak.phrases",
        "Requests to reveal the hidden system prompt.",
        detect_system_prompt_leak
    };
}

Detector encoding_detector() {
    return {
        ThreatCategory::Encoding,
        "encoding.characters",
        "Invisible characters, control bytes and encoded payloads.",
        detect_encoding
    };
}

Validator default_validator() {
    Validator validator;
    validator.register_detector(instruction_override_detector());
    validator.register_detector(role_manipulation_detector());
    validator.register_detector(delimiter_injection_detector());
    validator.register_detector(system_prompt_leak_detector());
    validator.register_detector(encoding_detector());
    return validator;
}

ValidationResult validate(std::string_view text, const Policy& policy) {
    static const Validator shared = default_validator();
    return shared.validate(text, policy);
}

} // namespace promptguard
