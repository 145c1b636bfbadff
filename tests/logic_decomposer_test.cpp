#include <cassert>

#include "logic_decomposer.hpp"

static void
test_two_top_level_groups()
{
    std::vector<diagnostic_t> l_diagnostics;

    const std::vector<rule_t> l_conditions = decompose_logic_body(
        "(DOMAIN,ad.com),(NETWORK,UDP)", &l_diagnostics
    );

    assert(l_conditions.size() == 2);
    assert(l_conditions[0] == rule_t(simple_rule_t{rule_kind_t::domain, "ad.com"}));
    assert(l_conditions[1] == rule_t(simple_rule_t{rule_kind_t::network, "UDP"}));
    assert(l_diagnostics.empty());
}

static void
test_conditions_have_no_action()
{
    const std::vector<rule_t> l_conditions =
        decompose_logic_body("(GEOIP,CN)", nullptr);

    assert(l_conditions.size() == 1);

    const simple_rule_t &l_rule = std::get<simple_rule_t>(l_conditions[0].m_value);

    assert(l_rule.m_action.has_value() == false);
    assert(l_rule.m_raw_text == "GEOIP,CN");
}

static void
test_text_outside_groups_is_ignored()
{
    std::vector<diagnostic_t> l_diagnostics;

    const std::vector<rule_t> l_conditions = decompose_logic_body(
        "junk(DOMAIN,a.com) , more(DST-PORT,443)tail", &l_diagnostics
    );

    assert(l_conditions.size() == 2);
    assert(condition_string(l_conditions[0]) == "DOMAIN,a.com");
    assert(condition_string(l_conditions[1]) == "DST-PORT,443");
    assert(l_diagnostics.empty());
}

static void
test_adjacent_groups_without_separator()
{
    const std::vector<rule_t> l_conditions =
        decompose_logic_body("(DOMAIN,a.com)(DOMAIN,b.com)", nullptr);

    assert(l_conditions.size() == 2);
    assert(condition_string(l_conditions[1]) == "DOMAIN,b.com");
}

static void
test_unknown_kind_is_dropped()
{
    std::vector<diagnostic_t> l_diagnostics;

    const std::vector<rule_t> l_conditions = decompose_logic_body(
        "(DOMAIN,a.com),(BAD_KIND,x)", &l_diagnostics
    );

    assert(l_conditions.size() == 1);
    assert(condition_string(l_conditions[0]) == "DOMAIN,a.com");
    assert(l_diagnostics.size() == 1);
    assert(l_diagnostics[0] == (diagnostic_t{
        diagnostic_kind_t::unknown_condition_kind, "BAD_KIND"
    }));
}

static void
test_group_without_payload_is_dropped()
{
    std::vector<diagnostic_t> l_diagnostics;

    const std::vector<rule_t> l_conditions = decompose_logic_body(
        "(DOMAIN),(DOMAIN, ),(NETWORK,TCP)", &l_diagnostics
    );

    assert(l_conditions.size() == 1);
    assert(condition_string(l_conditions[0]) == "NETWORK,TCP");
    assert(l_diagnostics.size() == 2);
    assert(l_diagnostics[0].m_kind == diagnostic_kind_t::invalid_condition_format);
    assert(l_diagnostics[0].m_text == "DOMAIN");
    assert(l_diagnostics[1].m_kind == diagnostic_kind_t::invalid_condition_format);
}

static void
test_unmatched_closing_parenthesis_is_ignored()
{
    std::vector<diagnostic_t> l_diagnostics;

    const std::vector<rule_t> l_conditions = decompose_logic_body(
        ")(DOMAIN,a.com))", &l_diagnostics
    );

    assert(l_conditions.size() == 1);
    assert(l_diagnostics.size() == 2);
    assert(l_diagnostics[0].m_kind == diagnostic_kind_t::unmatched_parenthesis);
    assert(l_diagnostics[1].m_kind == diagnostic_kind_t::unmatched_parenthesis);
}

static void
test_unclosed_group_is_reported()
{
    std::vector<diagnostic_t> l_diagnostics;

    const std::vector<rule_t> l_conditions = decompose_logic_body(
        "(DOMAIN,a.com),(NETWORK,UDP", &l_diagnostics
    );

    assert(l_conditions.size() == 1);
    assert(l_diagnostics.size() == 1);
    assert(l_diagnostics[0].m_kind == diagnostic_kind_t::unmatched_parenthesis);
}

static void
test_nested_logic_group_is_not_expanded()
{
    std::vector<diagnostic_t> l_diagnostics;

    const std::vector<rule_t> l_conditions = decompose_logic_body(
        "(OR,((DOMAIN,a.com),(DOMAIN,b.com))),(NETWORK,UDP)", &l_diagnostics
    );

    assert(l_conditions.size() == 1);
    assert(condition_string(l_conditions[0]) == "NETWORK,UDP");
    assert(l_diagnostics.size() == 1);
    assert(l_diagnostics[0].m_kind == diagnostic_kind_t::nested_logic_condition);
    assert(l_diagnostics[0].m_text == "OR,((DOMAIN,a.com),(DOMAIN,b.com))");
}

static void
test_payload_keeps_inner_commas_and_parentheses()
{
    const std::vector<rule_t> l_conditions = decompose_logic_body(
        "(DOMAIN-REGEX,^(a|b)\\.com$),(IP-CIDR,10.0.0.0/8,no-resolve)", nullptr
    );

    assert(l_conditions.size() == 2);
    assert(condition_string(l_conditions[0]) == "DOMAIN-REGEX,^(a|b)\\.com$");
    assert(condition_string(l_conditions[1]) == "IP-CIDR,10.0.0.0/8,no-resolve");
}

static void
test_lower_case_kind_is_accepted()
{
    const std::optional<simple_rule_t> l_rule =
        parse_logic_condition(" domain-keyword , google ", nullptr);

    assert(l_rule.has_value());
    assert(l_rule->m_kind == rule_kind_t::domain_keyword);
    assert(l_rule->m_payload == "google");
}

static void
test_empty_body()
{
    std::vector<diagnostic_t> l_diagnostics;

    assert(decompose_logic_body("", &l_diagnostics).empty());
    assert(decompose_logic_body("()", &l_diagnostics).empty());
    assert(l_diagnostics.size() == 1);
    assert(l_diagnostics[0].m_kind == diagnostic_kind_t::invalid_condition_format);
}

int
main()
{
    test_two_top_level_groups();
    test_conditions_have_no_action();
    test_text_outside_groups_is_ignored();
    test_adjacent_groups_without_separator();
    test_unknown_kind_is_dropped();
    test_group_without_payload_is_dropped();
    test_unmatched_closing_parenthesis_is_ignored();
    test_unclosed_group_is_reported();
    test_nested_logic_group_is_not_expanded();
    test_payload_keeps_inner_commas_and_parentheses();
    test_lower_case_kind_is_accepted();
    test_empty_body();

    return 0;
}
