#include "promptguard/decision.hpp"

#include <algorithm>

namespace promptguard {

Decision decide(ThreatCategory category, std::vector<Finding> findings, const Policy& policy) {
    Decision d;
    d.category  = category;
    d.threshold = policy.threshold(category);
    for (const auto& f : findings) {
        d.score = std::max(d.score, f.confidence);
    }
    d.findings  = std::move(findings);
    d.triggered = !d.findings.empty() && d.score >= d.threshold;
    d.action    = d.triggered ? policy.action(category) : Action::Allow;
    return d;
}

Decision decide_faulted(ThreatCategory category, std::string fault, const Policy& policy) {
    Decision d;
    d.category  = category;
    d.threshold = policy.threshold(category);
    d.score     = 1.0;
    d.triggered = true;
    d.action    = policy.action(category) == Action::Sanitize ? Action::Block
                                                              : policy.action(category);
    d.fault     = std::move(fault);
    return d;
}

const Decision* first_blocking(const std::vector<Decision>& decisions) {
    const Decision* first = nullptr;
    for (const auto& d : decisions) {
        if (d.action != Action::Block) continue;
        if (!first || index_of(d.category) < index_of(first->category)) first = &d;
    }
    return first;
}

Action strongest_action(const std::vector<Decision>& decisions) {
    Action strongest = Action::Allow;
    for (const auto& d : decisions) {
        if (severity(d.action) > severity(strongest)) strongest = d.action;
    }
    return strongest;
}

} // namespace promptguard
