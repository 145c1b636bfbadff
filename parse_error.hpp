#pragma once

#include <string>
#include <stdexcept>

enum class parse_error_kind_t {
    // blank line, callers skip it
    empty,
    unknown_rule_kind,
    invalid_match_format,
    invalid_rule_format,
    invalid_logic_format,
    missing_field,
    empty_conditions,
    invalid_field_type
};

std::string parse_error_kind_to_string(const parse_error_kind_t p_kind);

class rule_parse_error : public std::runtime_error {
public:
    // p_text is the offending token, field name or line
    rule_parse_error(const parse_error_kind_t p_kind, const std::string &p_text);

    parse_error_kind_t get_kind() const;

    const std::string &get_text() const;

private:
    parse_error_kind_t m_kind;
    std::string        m_text;
};

// non fatal findings, the enclosing rule is still produced
enum class diagnostic_kind_t {
    invalid_condition_format,
    unknown_condition_kind,
    unmatched_parenthesis,
    nested_logic_condition,
    not_multiple_conditions
};

std::string diagnostic_kind_to_string(const diagnostic_kind_t p_kind);

struct diagnostic_t {
    diagnostic_kind_t m_kind;
    std::string       m_text;

    bool operator==(const diagnostic_t &p_other) const = default;
};
