#include "parse_error.hpp"

std::string
parse_error_kind_to_string(const parse_error_kind_t p_kind)
{
    switch (p_kind) {
        case parse_error_kind_t::empty:
            return std::string("empty"); break;
        case parse_error_kind_t::unknown_rule_kind:
            return std::string("unknown_rule_kind"); break;
        case parse_error_kind_t::invalid_match_format:
            return std::string("invalid_match_format"); break;
        case parse_error_kind_t::invalid_rule_format:
            return std::string("invalid_rule_format"); break;
        case parse_error_kind_t::invalid_logic_format:
            return std::string("invalid_logic_format"); break;
        case parse_error_kind_t::missing_field:
            return std::string("missing_field"); break;
        case parse_error_kind_t::empty_conditions:
            return std::string("empty_conditions"); break;
        case parse_error_kind_t::invalid_field_type:
            return std::string("invalid_field_type"); break;
    }

    return std::string("unknown");
}

rule_parse_error::rule_parse_error(
    const parse_error_kind_t p_kind,
    const std::string       &p_text
):
    std::runtime_error(parse_error_kind_to_string(p_kind) + ": " + p_text),
    m_kind(p_kind),
    m_text(p_text)
{}

parse_error_kind_t
rule_parse_error::get_kind() const
{
    return m_kind;
}

const std::string &
rule_parse_error::get_text() const
{
    return m_text;
}

std::string
diagnostic_kind_to_string(const diagnostic_kind_t p_kind)
{
    switch (p_kind) {
        case diagnostic_kind_t::invalid_condition_format:
            return std::string("invalid_condition_format"); break;
        case diagnostic_kind_t::unknown_condition_kind:
            return std::string("unknown_condition_kind"); break;
        case diagnostic_kind_t::unmatched_parenthesis:
            return std::string("unmatched_parenthesis"); break;
        case diagnostic_kind_t::nested_logic_condition:
            return std::string("nested_logic_condition"); break;
        case diagnostic_kind_t::not_multiple_conditions:
            return std::string("not_multiple_conditions"); break;
    }

    return std::string("unknown");
}
