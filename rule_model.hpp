#pragma once

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>

enum class rule_kind_t {
    domain,
    domain_suffix,
    domain_keyword,
    domain_regex,
    geosite,

    ip_cidr,
    ip_cidr6,
    ip_suffix,
    ip_asn,
    geoip,

    src_geoip,
    src_ip_asn,
    src_ip_cidr,
    src_ip_suffix,

    dst_port,
    src_port,

    in_port,
    in_type,
    in_user,
    in_name,

    process_path,
    process_path_regex,
    process_name,
    process_name_regex,

    uid,
    network,
    dscp,

    rule_set,
    logic_and,
    logic_or,
    logic_not,
    sub_rule,

    match
};

enum class builtin_action_t {
    direct,
    reject,
    reject_drop,
    pass,
    compatible
};

// upper case token, e.g. "DOMAIN-SUFFIX"
std::optional<rule_kind_t> rule_kind_from_string(const std::string &p_token);

std::string rule_kind_to_string(const rule_kind_t p_kind);

bool is_logic_kind(const rule_kind_t p_kind);

// case insensitive
std::optional<builtin_action_t>
builtin_action_from_string(const std::string &p_token);

std::string builtin_action_to_string(const builtin_action_t p_action);

// either a built in disposition or the name of a proxy group
class action_t {
public:
    action_t(const builtin_action_t p_builtin);

    explicit action_t(std::string p_group);

    // built in lookup first, proxy group name otherwise
    static action_t from_string(const std::string &p_token);

    bool is_builtin() const;

    builtin_action_t get_builtin() const;

    const std::string &get_group() const;

    std::string to_string() const;

    bool operator==(const action_t &p_other) const;

private:
    std::variant<builtin_action_t, std::string> m_value;
};

struct rule_t;

// equality on the rule structs compares structure only, raw text and
// priority are ignored

struct simple_rule_t {
    rule_kind_t              m_kind;
    std::string              m_payload;
    // unset for conditions nested in a logic rule
    std::optional<action_t>  m_action;
    std::vector<std::string> m_extra_params;
    std::string              m_raw_text;
    int32_t                  m_priority = 0;

    bool operator==(const simple_rule_t &p_other) const;
};

// m_conditions only ever holds simple rules when produced by the parser,
// the element type stays rule_t so the grammar can grow nested logic
struct logic_rule_t {
    rule_kind_t          m_kind;
    std::vector<rule_t>  m_conditions;
    action_t             m_action;
    std::string          m_raw_text;
    int32_t              m_priority = 0;

    bool operator==(const logic_rule_t &p_other) const;
};

struct match_rule_t {
    action_t    m_action;
    std::string m_raw_text;
    int32_t     m_priority = 0;

    bool operator==(const match_rule_t &p_other) const;
};

struct rule_t {
    typedef std::variant<simple_rule_t, logic_rule_t, match_rule_t> value_t;

    rule_t(simple_rule_t p_rule);
    rule_t(logic_rule_t p_rule);
    rule_t(match_rule_t p_rule);

    rule_kind_t kind() const;

    bool operator==(const rule_t &p_other) const;

    value_t m_value;
};

// "KIND,payload", "KIND,((..),(..))" or "MATCH"
std::string condition_string(const rule_t &p_rule);

std::string condition_string(const simple_rule_t &p_rule);

std::string condition_string(const logic_rule_t &p_rule);
