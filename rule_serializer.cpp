#include "misc.hpp"
#include "rule_serializer.hpp"

std::string
render_rule(const rule_t &p_rule)
{
    std::vector<std::string> l_fields = { condition_string(p_rule) };

    if (const auto *const l_simple = std::get_if<simple_rule_t>(&p_rule.m_value)) {
        if (l_simple->m_action) {
            l_fields.push_back(l_simple->m_action->to_string());
        }

        l_fields.insert(
            l_fields.end(),
            l_simple->m_extra_params.begin(),
            l_simple->m_extra_params.end()
        );
    } else if (const auto *const l_logic = std::get_if<logic_rule_t>(&p_rule.m_value)) {
        l_fields.push_back(l_logic->m_action.to_string());
    } else {
        l_fields.push_back(std::get<match_rule_t>(p_rule.m_value).m_action.to_string());
    }

    return join(l_fields, ",");
}

std::vector<std::string>
render_rules(const std::vector<rule_t> &p_rules)
{
    std::vector<std::string> l_lines;

    for (const auto &l_rule : p_rules) {
        l_lines.push_back(render_rule(l_rule));
    }

    return l_lines;
}
