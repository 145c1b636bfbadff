#pragma once

#include <string>
#include <vector>
#include <optional>

#include "parse_error.hpp"
#include "rule_model.hpp"

// Recovers the top level "(KIND,payload)" groups of a logic rule body,
// e.g. "(DOMAIN,a.com),(NETWORK,UDP)". Groups that do not parse are dropped
// and reported through p_diagnostics, text outside any group is ignored.
// The groups are never parsed as logic rules themselves, so the result
// only holds simple rules.
std::vector<rule_t>
decompose_logic_body(
    const std::string               &p_body,
    std::vector<diagnostic_t> *const p_diagnostics
);

// "KIND,payload" split on the first comma, no action
std::optional<simple_rule_t>
parse_logic_condition(
    const std::string               &p_text,
    std::vector<diagnostic_t> *const p_diagnostics
);
