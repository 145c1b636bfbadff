#include "misc.hpp"
#include "logic_decomposer.hpp"

static void
add_diagnostic(
    std::vector<diagnostic_t> *const p_diagnostics,
    const diagnostic_kind_t          p_kind,
    const std::string               &p_text
) {
    if (p_diagnostics != nullptr) {
        p_diagnostics->push_back(diagnostic_t{p_kind, p_text});
    }
}

std::optional<simple_rule_t>
parse_logic_condition(
    const std::string               &p_text,
    std::vector<diagnostic_t> *const p_diagnostics
) {
    const size_t l_comma = p_text.find(',');

    if (l_comma == std::string::npos) {
        add_diagnostic(
            p_diagnostics, diagnostic_kind_t::invalid_condition_format, p_text
        );

        return std::nullopt;
    }

    const std::string l_token   = trim(p_text.substr(0, l_comma));
    const std::string l_payload = trim(p_text.substr(l_comma + 1));

    if (l_token.empty() || l_payload.empty()) {
        add_diagnostic(
            p_diagnostics, diagnostic_kind_t::invalid_condition_format, p_text
        );

        return std::nullopt;
    }

    const std::optional<rule_kind_t> l_kind =
        rule_kind_from_string(to_upper(l_token));

    if (!l_kind) {
        add_diagnostic(
            p_diagnostics, diagnostic_kind_t::unknown_condition_kind, l_token
        );

        return std::nullopt;
    }

    if (is_logic_kind(l_kind.value()) || l_kind.value() == rule_kind_t::match) {
        add_diagnostic(
            p_diagnostics, diagnostic_kind_t::nested_logic_condition, p_text
        );

        return std::nullopt;
    }

    simple_rule_t l_rule;
    l_rule.m_kind     = l_kind.value();
    l_rule.m_payload  = l_payload;
    l_rule.m_raw_text = p_text;

    return std::optional<simple_rule_t>(std::move(l_rule));
}

std::vector<rule_t>
decompose_logic_body(
    const std::string               &p_body,
    std::vector<diagnostic_t> *const p_diagnostics
) {
    std::vector<rule_t> l_result;
    std::string         l_current;
    uint32_t            l_depth = 0;

    for (const char l_char : p_body) {
        if (l_char == '(') {
            if (l_depth > 0) {
                l_current += l_char;
            }

            l_depth++;
        } else if (l_char == ')') {
            if (l_depth == 0) {
                add_diagnostic(
                    p_diagnostics,
                    diagnostic_kind_t::unmatched_parenthesis,
                    p_body
                );

                continue;
            }

            l_depth--;

            if (l_depth == 0) {
                const std::optional<simple_rule_t> l_condition =
                    parse_logic_condition(l_current, p_diagnostics);

                if (l_condition) {
                    l_result.push_back(rule_t(l_condition.value()));
                }

                l_current.clear();
            } else {
                l_current += l_char;
            }
        } else if (l_depth > 0) {
            l_current += l_char;
        }
    }

    if (l_depth > 0) {
        add_diagnostic(
            p_diagnostics, diagnostic_kind_t::unmatched_parenthesis, p_body
        );
    }

    return l_result;
}
