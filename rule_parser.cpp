#include <cctype>

#include "misc.hpp"
#include "rule_json.hpp"
#include "logic_decomposer.hpp"
#include "rule_parser.hpp"

bool
parse_result_t::is_empty() const
{
    return m_error.has_value()
        && m_error.value().get_kind() == parse_error_kind_t::empty;
}

rule_parser::rule_parser(std::shared_ptr<spdlog::logger> p_log):
    m_log(p_log)
{}

rule_parser::~rule_parser(){};

rule_t
rule_parser::parse_line(
    const std::string               &p_line,
    std::vector<diagnostic_t> *const p_diagnostics
) const {
    const std::string l_line = trim(p_line);

    if (l_line.empty()) {
        throw rule_parse_error(parse_error_kind_t::empty, l_line);
    }

    if (l_line.starts_with("AND,") ||
        l_line.starts_with("OR,")  ||
        l_line.starts_with("NOT,"))
    {
        std::vector<diagnostic_t> l_diagnostics;

        rule_t l_rule = parse_logic_rule(l_line, &l_diagnostics);

        report_diagnostics(l_line, l_diagnostics, p_diagnostics);

        return l_rule;
    } else if (to_upper(l_line).starts_with("MATCH,")) {
        return parse_match_rule(l_line);
    }

    return parse_simple_rule(l_line);
}

rule_t
rule_parser::parse_structured(
    const nlohmann::json            &p_json,
    std::vector<diagnostic_t> *const p_diagnostics
) const {
    std::vector<diagnostic_t> l_diagnostics;

    const std::string l_line = structured_to_line(p_json, &l_diagnostics);

    report_diagnostics(l_line, l_diagnostics, p_diagnostics);

    return parse_line(l_line, p_diagnostics);
}

void
rule_parser::report_diagnostics(
    const std::string               &p_line,
    const std::vector<diagnostic_t> &p_found,
    std::vector<diagnostic_t> *const p_diagnostics
) const {
    for (const auto &l_diagnostic : p_found) {
        m_log->warn(
            "{} in '{}': {}",
            diagnostic_kind_to_string(l_diagnostic.m_kind),
            p_line,
            l_diagnostic.m_text
        );
    }

    if (p_diagnostics != nullptr) {
        p_diagnostics->insert(
            p_diagnostics->end(),
            p_found.begin(),
            p_found.end()
        );
    }
}

rule_t
rule_parser::parse_match_rule(const std::string &p_line)
{
    const std::vector<std::string> l_fields = split_fields(p_line);

    if (l_fields.size() != 2) {
        throw rule_parse_error(parse_error_kind_t::invalid_match_format, p_line);
    }

    match_rule_t l_rule{action_t::from_string(l_fields[1])};
    l_rule.m_raw_text = p_line;

    return rule_t(std::move(l_rule));
}

rule_t
rule_parser::parse_simple_rule(const std::string &p_line)
{
    const std::vector<std::string> l_fields = split_fields(p_line);

    if (l_fields.size() < 3) {
        throw rule_parse_error(parse_error_kind_t::invalid_rule_format, p_line);
    }

    const std::string l_token = to_upper(l_fields[0]);

    const std::optional<rule_kind_t> l_kind = rule_kind_from_string(l_token);

    if (!l_kind) {
        throw rule_parse_error(parse_error_kind_t::unknown_rule_kind, l_token);
    }

    // logic keywords only count in upper case followed by a comma
    if (is_logic_kind(l_kind.value())) {
        throw rule_parse_error(parse_error_kind_t::invalid_logic_format, p_line);
    } else if (l_kind.value() == rule_kind_t::match) {
        throw rule_parse_error(parse_error_kind_t::invalid_match_format, p_line);
    }

    simple_rule_t l_rule;
    l_rule.m_kind     = l_kind.value();
    l_rule.m_payload  = l_fields[1];
    l_rule.m_action   = action_t::from_string(l_fields[2]);
    l_rule.m_raw_text = p_line;

    l_rule.m_extra_params.assign(l_fields.begin() + 3, l_fields.end());

    return rule_t(std::move(l_rule));
}

// KIND,(BODY),ACTION where BODY ends at the parenthesis matching the first
// one and ACTION holds no comma
rule_t
rule_parser::parse_logic_rule(
    const std::string               &p_line,
    std::vector<diagnostic_t> *const p_diagnostics
) {
    const size_t l_comma = p_line.find(',');

    const std::optional<rule_kind_t> l_kind =
        rule_kind_from_string(p_line.substr(0, l_comma));

    if (!l_kind || !is_logic_kind(l_kind.value())) {
        throw rule_parse_error(parse_error_kind_t::invalid_logic_format, p_line);
    }

    size_t l_open = l_comma + 1;

    while (l_open < p_line.size() &&
        std::isspace(static_cast<unsigned char>(p_line[l_open])))
    {
        l_open++;
    }

    if (l_open >= p_line.size() || p_line[l_open] != '(') {
        throw rule_parse_error(parse_error_kind_t::invalid_logic_format, p_line);
    }

    std::optional<size_t> l_close;
    uint32_t              l_depth = 0;

    for (size_t l_iter = l_open; l_iter < p_line.size(); l_iter++) {
        if (p_line[l_iter] == '(') {
            l_depth++;
        } else if (p_line[l_iter] == ')') {
            l_depth--;

            if (l_depth == 0) {
                l_close = l_iter;

                break;
            }
        }
    }

    if (!l_close) {
        throw rule_parse_error(parse_error_kind_t::invalid_logic_format, p_line);
    }

    const std::string l_body =
        trim(p_line.substr(l_open + 1, l_close.value() - l_open - 1));

    const std::string l_suffix = trim(p_line.substr(l_close.value() + 1));

    if (l_body.empty() || !l_suffix.starts_with(",")) {
        throw rule_parse_error(parse_error_kind_t::invalid_logic_format, p_line);
    }

    const std::string l_action = trim(l_suffix.substr(1));

    if (l_action.empty() || l_action.find(',') != std::string::npos) {
        throw rule_parse_error(parse_error_kind_t::invalid_logic_format, p_line);
    }

    std::vector<rule_t> l_conditions =
        decompose_logic_body(l_body, p_diagnostics);

    if (l_conditions.empty()) {
        throw rule_parse_error(parse_error_kind_t::empty_conditions, p_line);
    }

    if (l_kind.value() == rule_kind_t::logic_not && l_conditions.size() > 1) {
        p_diagnostics->push_back(diagnostic_t{
            diagnostic_kind_t::not_multiple_conditions,
            std::to_string(l_conditions.size())
        });
    }

    logic_rule_t l_rule{
        l_kind.value(),
        std::move(l_conditions),
        action_t::from_string(l_action)
    };
    l_rule.m_raw_text = p_line;

    return rule_t(std::move(l_rule));
}

template<typename parse_fn_t>
parse_result_t
rule_parser::parse_entry(const size_t p_index, const parse_fn_t &p_parse) const
{
    parse_result_t l_result{p_index};

    try {
        rule_t l_rule = p_parse(&l_result.m_diagnostics);

        std::visit([&](auto &p_value) {
            p_value.m_priority = static_cast<int32_t>(p_index);
        }, l_rule.m_value);

        l_result.m_rule = std::move(l_rule);
    } catch (const rule_parse_error &p_error) {
        if (p_error.get_kind() != parse_error_kind_t::empty) {
            m_log->debug("entry {} rejected: {}", p_index, p_error.what());
        }

        l_result.m_error = p_error;
    }

    return l_result;
}

std::vector<parse_result_t>
rule_parser::parse_lines(const std::vector<std::string> &p_lines) const
{
    std::vector<parse_result_t> l_results;

    for (size_t l_index = 0; l_index < p_lines.size(); l_index++) {
        l_results.push_back(parse_entry(l_index,
            [&](std::vector<diagnostic_t> *const p_diagnostics) {
                return parse_line(p_lines[l_index], p_diagnostics);
            }
        ));
    }

    return l_results;
}

std::vector<parse_result_t>
rule_parser::parse_structured_list(const nlohmann::json &p_list) const
{
    if (!p_list.is_array()) {
        throw rule_parse_error(
            parse_error_kind_t::invalid_field_type,
            "rule list is not an array"
        );
    }

    std::vector<parse_result_t> l_results;

    for (size_t l_index = 0; l_index < p_list.size(); l_index++) {
        l_results.push_back(parse_entry(l_index,
            [&](std::vector<diagnostic_t> *const p_diagnostics) {
                return parse_structured(p_list[l_index], p_diagnostics);
            }
        ));
    }

    return l_results;
}
