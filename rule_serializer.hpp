#pragma once

#include <string>
#include <vector>

#include "rule_model.hpp"

// full canonical line, the inverse of rule_parser::parse_line. A simple
// rule without an action renders as its bare condition, which only parses
// inside a logic body
std::string render_rule(const rule_t &p_rule);

std::vector<std::string> render_rules(const std::vector<rule_t> &p_rules);
