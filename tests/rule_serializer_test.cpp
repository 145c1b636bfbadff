#include <cassert>
#include <algorithm>
#include <cctype>

#include <spdlog/sinks/null_sink.h>

#include "rule_parser.hpp"
#include "rule_serializer.hpp"

static const rule_parser g_parser(
    spdlog::null_logger_mt("rule_serializer_test")
);

static std::string
strip_whitespace(std::string p_text)
{
    p_text.erase(
        std::remove_if(p_text.begin(), p_text.end(), [](const char l_char) {
            return std::isspace(static_cast<unsigned char>(l_char));
        }),
        p_text.end()
    );

    return p_text;
}

static const std::vector<std::string> g_lines = {
    "DOMAIN-SUFFIX,google.com,Proxy",
    "DOMAIN , example.org , DIRECT",
    "IP-CIDR,10.0.0.0/8,REJECT,no-resolve",
    "SRC-IP-CIDR,192.168.1.0/24,PASS,no-resolve,extra",
    "PROCESS-NAME,curl,COMPATIBLE",
    "RULE-SET,ads,REJECT-DROP",
    "AND,((DOMAIN,ad.com),(NETWORK,UDP)),REJECT",
    "OR, ((GEOIP,CN), (DST-PORT,22)) , Proxy",
    "NOT,((DOMAIN-KEYWORD,google)),DIRECT",
    "MATCH,DIRECT",
    "MATCH, Final"
};

static void
test_render_reproduces_canonical_text()
{
    for (const auto &l_line : g_lines) {
        const std::string l_rendered = render_rule(g_parser.parse_line(l_line));

        assert(l_rendered == strip_whitespace(l_line));
    }
}

static void
test_parse_render_is_idempotent()
{
    for (const auto &l_line : g_lines) {
        const rule_t l_rule = g_parser.parse_line(l_line);

        assert(g_parser.parse_line(render_rule(l_rule)) == l_rule);
    }
}

static void
test_render_normalizes_case()
{
    assert(render_rule(g_parser.parse_line("domain-suffix,a.com,direct")) ==
        "DOMAIN-SUFFIX,a.com,DIRECT");
    assert(render_rule(g_parser.parse_line("match,reject")) == "MATCH,REJECT");
}

static void
test_render_condition_without_action()
{
    const rule_t l_rule(simple_rule_t{rule_kind_t::network, "TCP"});

    assert(render_rule(l_rule) == "NETWORK,TCP");
}

static void
test_render_drops_malformed_conditions()
{
    assert(render_rule(
        g_parser.parse_line("AND,((DOMAIN,a.com),(BAD_KIND,x)),DIRECT")
    ) == "AND,((DOMAIN,a.com)),DIRECT");
}

static void
test_render_rules()
{
    const std::vector<rule_t> l_rules = {
        g_parser.parse_line("DOMAIN,a.com,DIRECT"),
        g_parser.parse_line("MATCH,Proxy")
    };

    assert(render_rules(l_rules) ==
        (std::vector<std::string>{"DOMAIN,a.com,DIRECT", "MATCH,Proxy"}));
}

int
main()
{
    test_render_reproduces_canonical_text();
    test_parse_render_is_idempotent();
    test_render_normalizes_case();
    test_render_condition_without_action();
    test_render_drops_malformed_conditions();
    test_render_rules();

    return 0;
}
