#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "parse_error.hpp"
#include "rule_model.hpp"

// Normalizes a structured rule into the rule line accepted by
// rule_parser::parse_line. Throws rule_parse_error.
std::string
structured_to_line(
    const nlohmann::json            &p_json,
    std::vector<diagnostic_t> *const p_diagnostics
);

nlohmann::json rule_to_json(const rule_t &p_rule);

nlohmann::json rules_to_json(const std::vector<rule_t> &p_rules);
