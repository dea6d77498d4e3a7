#pragma once

#include "promptguard/policy.hpp"
#include "promptguard/types.hpp"

#include <array>
#include <string>
#include <vector>

namespace promptguard {

/**
 * Resolves one category.
 *
 *   score     = max confidence over `findings` (0 when there are none)
 *   triggered = score >= policy.threshold(category)
 *   action    = policy.action(category) if triggered, else Allow
 *
 * Max rather than sum keeps many weak matches from adding up to a strong one.
 */
Decision decide(ThreatCategory category, std::vector<Finding> findings, const Policy& policy);

/**
 * Fail-closed decision for a category whose detector threw: score 1.0,
 * triggered, configured action applied. A configured Sanitize becomes Block
 * since there are no spans to rewrite.
 */
Decision decide_faulted(ThreatCategory category, std::string fault, const Policy& policy);

/// First Block decision in canonical order, or nullptr.
const Decision* first_blocking(const std::vector<Decision>& decisions);

/// Most severe resolved action across decisions (Allow when empty).
Action strongest_action(const std::vector<Decision>& decisions);

} // namespace promptguard
