#include "misc.hpp"
#include "rule_json.hpp"

static std::optional<std::string>
get_string_field(const nlohmann::json &p_json, const std::string &p_field)
{
    const auto l_iter = p_json.find(p_field);

    if (l_iter == p_json.end() || l_iter->is_null()) {
        return std::nullopt;
    }

    if (l_iter->is_string()) {
        return std::optional<std::string>(l_iter->get<std::string>());
    } else if (l_iter->is_number()) {
        // ports and uids are often written as numbers
        return std::optional<std::string>(l_iter->dump());
    }

    throw rule_parse_error(parse_error_kind_t::invalid_field_type, p_field);
}

static std::string
require_string_field(const nlohmann::json &p_json, const std::string &p_field)
{
    const std::optional<std::string> l_value =
        get_string_field(p_json, p_field);

    if (!l_value || trim(l_value.value()).empty()) {
        throw rule_parse_error(parse_error_kind_t::missing_field, p_field);
    }

    return trim(l_value.value());
}

// payload, action and extras are joined with ',' into one line, a comma
// inside any of them would move the field boundaries
static std::string
require_single_field(const nlohmann::json &p_json, const std::string &p_field)
{
    const std::string l_value = require_string_field(p_json, p_field);

    if (l_value.find(',') != std::string::npos) {
        throw rule_parse_error(parse_error_kind_t::invalid_field_type, p_field);
    }

    return l_value;
}

static bool
has_balanced_parens(const std::string &p_text)
{
    int l_depth = 0;

    for (const char l_char : p_text) {
        if (l_char == '(') {
            l_depth++;
        } else if (l_char == ')') {
            if (--l_depth < 0) {
                return false;
            }
        }
    }

    return l_depth == 0;
}

static std::vector<std::string>
get_extra_params(const nlohmann::json &p_json)
{
    auto l_iter = p_json.find("extra_params");

    if (l_iter == p_json.end()) {
        l_iter = p_json.find("additional_params");
    }

    std::vector<std::string> l_result;

    if (l_iter == p_json.end() || l_iter->is_null()) {
        return l_result;
    }

    if (!l_iter->is_array()) {
        throw rule_parse_error(
            parse_error_kind_t::invalid_field_type, "extra_params"
        );
    }

    for (const auto &l_param : *l_iter) {
        if (!l_param.is_string()
            || l_param.get<std::string>().find(',') != std::string::npos
        ) {
            throw rule_parse_error(
                parse_error_kind_t::invalid_field_type, "extra_params"
            );
        }

        l_result.push_back(l_param.get<std::string>());
    }

    return l_result;
}

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

static std::optional<std::string>
condition_to_group(
    const nlohmann::json            &p_condition,
    std::vector<diagnostic_t> *const p_diagnostics
) {
    if (p_condition.is_string()) {
        const std::string l_text = trim(p_condition.get<std::string>());

        if (l_text.empty()) {
            return std::nullopt;
        } else if (!has_balanced_parens(l_text)) {
            throw rule_parse_error(
                parse_error_kind_t::invalid_field_type, "conditions"
            );
        } else if (l_text.starts_with("(")) {
            return std::optional<std::string>(l_text);
        }

        return std::optional<std::string>("(" + l_text + ")");
    }

    if (p_condition.is_object()) {
        const std::optional<std::string> l_type =
            get_string_field(p_condition, "type");
        const std::optional<std::string> l_payload =
            get_string_field(p_condition, "payload");

        if (l_type && l_payload && !l_type->empty() && !l_payload->empty()) {
            // the group must close where the logic body expects it to
            if (!has_balanced_parens(l_type.value())) {
                throw rule_parse_error(
                    parse_error_kind_t::invalid_field_type, "type"
                );
            } else if (!has_balanced_parens(l_payload.value())) {
                throw rule_parse_error(
                    parse_error_kind_t::invalid_field_type, "payload"
                );
            }

            return std::optional<std::string>(
                "(" + to_upper(l_type.value()) + "," + l_payload.value() + ")"
            );
        }

        if (p_condition.contains("conditions")) {
            add_diagnostic(
                p_diagnostics,
                diagnostic_kind_t::nested_logic_condition,
                p_condition.dump()
            );

            return std::nullopt;
        }
    }

    add_diagnostic(
        p_diagnostics,
        diagnostic_kind_t::invalid_condition_format,
        p_condition.dump()
    );

    return std::nullopt;
}

std::string
structured_to_line(
    const nlohmann::json            &p_json,
    std::vector<diagnostic_t> *const p_diagnostics
) {
    if (p_json.is_string()) {
        return p_json.get<std::string>();
    }

    if (!p_json.is_object()) {
        throw rule_parse_error(
            parse_error_kind_t::invalid_field_type, p_json.dump()
        );
    }

    const std::string l_type = to_upper(require_string_field(p_json, "type"));

    const std::optional<rule_kind_t> l_kind = rule_kind_from_string(l_type);

    if (!l_kind) {
        throw rule_parse_error(parse_error_kind_t::unknown_rule_kind, l_type);
    }

    if (is_logic_kind(l_kind.value())) {
        const auto l_iter = p_json.find("conditions");

        if (l_iter == p_json.end() || l_iter->is_null()) {
            throw rule_parse_error(
                parse_error_kind_t::empty_conditions, p_json.dump()
            );
        } else if (!l_iter->is_array()) {
            throw rule_parse_error(
                parse_error_kind_t::invalid_field_type, "conditions"
            );
        }

        std::vector<std::string> l_groups;

        for (const auto &l_condition : *l_iter) {
            const std::optional<std::string> l_group =
                condition_to_group(l_condition, p_diagnostics);

            if (l_group) {
                l_groups.push_back(l_group.value());
            }
        }

        if (l_groups.empty()) {
            throw rule_parse_error(
                parse_error_kind_t::empty_conditions, p_json.dump()
            );
        }

        return l_type + ",(" + join(l_groups, ",") + "),"
            + require_single_field(p_json, "action");
    } else if (l_kind.value() == rule_kind_t::match) {
        return "MATCH," + require_single_field(p_json, "action");
    }

    const std::string l_payload = require_single_field(p_json, "payload");

    std::vector<std::string> l_fields = {
        l_type,
        l_payload,
        require_single_field(p_json, "action")
    };

    const std::vector<std::string> l_extra = get_extra_params(p_json);

    l_fields.insert(l_fields.end(), l_extra.begin(), l_extra.end());

    return join(l_fields, ",");
}

nlohmann::json
rule_to_json(const rule_t &p_rule)
{
    if (const auto *const l_simple = std::get_if<simple_rule_t>(&p_rule.m_value)) {
        nlohmann::json l_json = {
            { "type",    rule_kind_to_string(l_simple->m_kind) },
            { "payload", l_simple->m_payload                   }
        };

        if (l_simple->m_action) {
            l_json["action"] = l_simple->m_action->to_string();
        }

        if (!l_simple->m_extra_params.empty()) {
            l_json["extra_params"] = l_simple->m_extra_params;
        }

        return l_json;
    } else if (const auto *const l_logic = std::get_if<logic_rule_t>(&p_rule.m_value)) {
        std::vector<nlohmann::json> l_conditions;

        for (const auto &l_condition : l_logic->m_conditions) {
            l_conditions.push_back(rule_to_json(l_condition));
        }

        return {
            { "type",       rule_kind_to_string(l_logic->m_kind) },
            { "action",     l_logic->m_action.to_string()        },
            { "conditions", l_conditions                         }
        };
    }

    const match_rule_t &l_match = std::get<match_rule_t>(p_rule.m_value);

    return {
        { "type",   rule_kind_to_string(rule_kind_t::match) },
        { "action", l_match.m_action.to_string()            }
    };
}

nlohmann::json
rules_to_json(const std::vector<rule_t> &p_rules)
{
    nlohmann::json l_result = nlohmann::json::array();

    for (const auto &l_rule : p_rules) {
        l_result.push_back(rule_to_json(l_rule));
    }

    return l_result;
}
