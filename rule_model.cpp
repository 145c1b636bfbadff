#include <stdexcept>
#include <type_traits>

#include <boost/bimap.hpp>
#include <boost/assign.hpp>

#include "misc.hpp"
#include "rule_model.hpp"

typedef boost::bimaps::bimap<rule_kind_t, std::string> g_kind_map_type;

// the single table of recognized rule tokens
const g_kind_map_type g_kind_map =
    boost::assign::list_of<g_kind_map_type::relation>
        ( rule_kind_t::domain,             "DOMAIN"             )
        ( rule_kind_t::domain_suffix,      "DOMAIN-SUFFIX"      )
        ( rule_kind_t::domain_keyword,     "DOMAIN-KEYWORD"     )
        ( rule_kind_t::domain_regex,       "DOMAIN-REGEX"       )
        ( rule_kind_t::geosite,            "GEOSITE"            )
        ( rule_kind_t::ip_cidr,            "IP-CIDR"            )
        ( rule_kind_t::ip_cidr6,           "IP-CIDR6"           )
        ( rule_kind_t::ip_suffix,          "IP-SUFFIX"          )
        ( rule_kind_t::ip_asn,             "IP-ASN"             )
        ( rule_kind_t::geoip,              "GEOIP"              )
        ( rule_kind_t::src_geoip,          "SRC-GEOIP"          )
        ( rule_kind_t::src_ip_asn,         "SRC-IP-ASN"         )
        ( rule_kind_t::src_ip_cidr,        "SRC-IP-CIDR"        )
        ( rule_kind_t::src_ip_suffix,      "SRC-IP-SUFFIX"      )
        ( rule_kind_t::dst_port,           "DST-PORT"           )
        ( rule_kind_t::src_port,           "SRC-PORT"           )
        ( rule_kind_t::in_port,            "IN-PORT"            )
        ( rule_kind_t::in_type,            "IN-TYPE"            )
        ( rule_kind_t::in_user,            "IN-USER"            )
        ( rule_kind_t::in_name,            "IN-NAME"            )
        ( rule_kind_t::process_path,       "PROCESS-PATH"       )
        ( rule_kind_t::process_path_regex, "PROCESS-PATH-REGEX" )
        ( rule_kind_t::process_name,       "PROCESS-NAME"       )
        ( rule_kind_t::process_name_regex, "PROCESS-NAME-REGEX" )
        ( rule_kind_t::uid,                "UID"                )
        ( rule_kind_t::network,            "NETWORK"            )
        ( rule_kind_t::dscp,               "DSCP"               )
        ( rule_kind_t::rule_set,           "RULE-SET"           )
        ( rule_kind_t::logic_and,          "AND"                )
        ( rule_kind_t::logic_or,           "OR"                 )
        ( rule_kind_t::logic_not,          "NOT"                )
        ( rule_kind_t::sub_rule,           "SUB-RULE"           )
        ( rule_kind_t::match,              "MATCH"              );

typedef boost::bimaps::bimap<builtin_action_t, std::string> g_action_map_type;

const g_action_map_type g_action_map =
    boost::assign::list_of<g_action_map_type::relation>
        ( builtin_action_t::direct,      "DIRECT"      )
        ( builtin_action_t::reject,      "REJECT"      )
        ( builtin_action_t::reject_drop, "REJECT-DROP" )
        ( builtin_action_t::pass,        "PASS"        )
        ( builtin_action_t::compatible,  "COMPATIBLE"  );

std::optional<rule_kind_t>
rule_kind_from_string(const std::string &p_token)
{
    const auto l_iter = g_kind_map.right.find(p_token);

    if (l_iter == g_kind_map.right.end()) {
        return std::nullopt;
    }

    return std::optional<rule_kind_t>(l_iter->second);
}

std::string
rule_kind_to_string(const rule_kind_t p_kind)
{
    return g_kind_map.left.find(p_kind)->second;
}

bool
is_logic_kind(const rule_kind_t p_kind)
{
    return p_kind == rule_kind_t::logic_and
        || p_kind == rule_kind_t::logic_or
        || p_kind == rule_kind_t::logic_not;
}

std::optional<builtin_action_t>
builtin_action_from_string(const std::string &p_token)
{
    const auto l_iter = g_action_map.right.find(to_upper(p_token));

    if (l_iter == g_action_map.right.end()) {
        return std::nullopt;
    }

    return std::optional<builtin_action_t>(l_iter->second);
}

std::string
builtin_action_to_string(const builtin_action_t p_action)
{
    return g_action_map.left.find(p_action)->second;
}

action_t::action_t(const builtin_action_t p_builtin):
    m_value(p_builtin)
{}

action_t::action_t(std::string p_group):
    m_value(std::move(p_group))
{}

action_t
action_t::from_string(const std::string &p_token)
{
    const std::optional<builtin_action_t> l_builtin =
        builtin_action_from_string(p_token);

    if (l_builtin) {
        return action_t(l_builtin.value());
    }

    return action_t(p_token);
}

bool
action_t::is_builtin() const
{
    return std::holds_alternative<builtin_action_t>(m_value);
}

builtin_action_t
action_t::get_builtin() const
{
    return std::get<builtin_action_t>(m_value);
}

const std::string &
action_t::get_group() const
{
    return std::get<std::string>(m_value);
}

std::string
action_t::to_string() const
{
    if (is_builtin()) {
        return builtin_action_to_string(get_builtin());
    }

    return get_group();
}

bool
action_t::operator==(const action_t &p_other) const
{
    return m_value == p_other.m_value;
}

bool
simple_rule_t::operator==(const simple_rule_t &p_other) const
{
    return m_kind         == p_other.m_kind
        && m_payload      == p_other.m_payload
        && m_action       == p_other.m_action
        && m_extra_params == p_other.m_extra_params;
}

bool
logic_rule_t::operator==(const logic_rule_t &p_other) const
{
    return m_kind       == p_other.m_kind
        && m_conditions == p_other.m_conditions
        && m_action     == p_other.m_action;
}

bool
match_rule_t::operator==(const match_rule_t &p_other) const
{
    return m_action == p_other.m_action;
}

rule_t::rule_t(simple_rule_t p_rule):
    m_value(std::move(p_rule))
{
    if (is_logic_kind(kind()) || kind() == rule_kind_t::match) {
        throw std::invalid_argument("simple rule with logic or match kind");
    }
}

rule_t::rule_t(logic_rule_t p_rule):
    m_value(std::move(p_rule))
{}

rule_t::rule_t(match_rule_t p_rule):
    m_value(std::move(p_rule))
{}

rule_kind_t
rule_t::kind() const
{
    if (const auto *const l_simple = std::get_if<simple_rule_t>(&m_value)) {
        return l_simple->m_kind;
    } else if (const auto *const l_logic = std::get_if<logic_rule_t>(&m_value)) {
        return l_logic->m_kind;
    }

    return rule_kind_t::match;
}

bool
rule_t::operator==(const rule_t &p_other) const
{
    return m_value == p_other.m_value;
}

std::string
condition_string(const simple_rule_t &p_rule)
{
    return rule_kind_to_string(p_rule.m_kind) + "," + p_rule.m_payload;
}

std::string
condition_string(const logic_rule_t &p_rule)
{
    std::vector<std::string> l_conditions;

    for (const auto &l_condition : p_rule.m_conditions) {
        l_conditions.push_back("(" + condition_string(l_condition) + ")");
    }

    return rule_kind_to_string(p_rule.m_kind) + ",(" + join(l_conditions, ",")
        + ")";
}

std::string
condition_string(const rule_t &p_rule)
{
    return std::visit([](const auto &p_value) -> std::string {
        typedef std::decay_t<decltype(p_value)> l_type;

        if constexpr (std::is_same_v<l_type, match_rule_t>) {
            return "MATCH";
        } else {
            return condition_string(p_value);
        }
    }, p_rule.m_value);
}
