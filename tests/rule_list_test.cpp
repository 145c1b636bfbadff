#include <cassert>
#include <stdexcept>
#include <thread>

#include <spdlog/sinks/null_sink.h>

#include "rule_parser.hpp"
#include "rule_list.hpp"

static const rule_parser g_parser(spdlog::null_logger_mt("rule_list_test"));

static void
test_append_and_insert()
{
    rule_list_t l_list;

    l_list.append(g_parser.parse_line("DOMAIN,a.com,DIRECT"));
    l_list.append(g_parser.parse_line("MATCH,Proxy"));
    l_list.insert(1, g_parser.parse_line("GEOIP,CN,DIRECT"));
    l_list.insert(100, g_parser.parse_line("NETWORK,UDP,REJECT"));

    assert(l_list.size() == 4);
    assert(l_list.to_lines() == (std::vector<std::string>{
        "DOMAIN,a.com,DIRECT",
        "GEOIP,CN,DIRECT",
        "MATCH,Proxy",
        "NETWORK,UDP,REJECT"
    }));
}

static void
test_rejects_rule_without_action()
{
    rule_list_t l_list;

    l_list.append(g_parser.parse_line("DOMAIN,a.com,DIRECT"));

    const rule_t l_bare(simple_rule_t{rule_kind_t::network, "TCP"});

    bool l_thrown = false;

    try {
        l_list.append(l_bare);
    } catch (const std::invalid_argument &) {
        l_thrown = true;
    }

    assert(l_thrown);

    l_thrown = false;

    try {
        l_list.insert(0, l_bare);
    } catch (const std::invalid_argument &) {
        l_thrown = true;
    }

    assert(l_thrown);
    assert(l_list.size() == 1);

    for (const auto &l_line : l_list.to_lines()) {
        g_parser.parse_line(l_line);
    }
}

static void
test_remove_by_condition()
{
    rule_list_t l_list;

    l_list.append(g_parser.parse_line("DOMAIN,a.com,DIRECT"));
    l_list.append(g_parser.parse_line("DOMAIN,a.com,Proxy"));
    l_list.append(g_parser.parse_line("DOMAIN,b.com,DIRECT"));

    assert(l_list.contains("DOMAIN,a.com"));
    assert(l_list.remove("DOMAIN,a.com") == 2);
    assert(l_list.contains("DOMAIN,a.com") == false);
    assert(l_list.remove("DOMAIN,a.com") == 0);
    assert(l_list.size() == 1);
}

static void
test_deduplicate_keeps_first()
{
    rule_list_t l_list;

    l_list.append(g_parser.parse_line("DOMAIN,a.com,DIRECT"));
    l_list.append(g_parser.parse_line("AND,((DOMAIN,x.com),(NETWORK,UDP)),REJECT"));
    l_list.append(g_parser.parse_line("DOMAIN,a.com,Proxy"));
    l_list.append(g_parser.parse_line("AND,( (DOMAIN,x.com) ,(NETWORK,UDP)),DIRECT"));
    l_list.append(g_parser.parse_line("MATCH,DIRECT"));

    assert(l_list.deduplicate() == 2);
    assert(l_list.to_lines() == (std::vector<std::string>{
        "DOMAIN,a.com,DIRECT",
        "AND,((DOMAIN,x.com),(NETWORK,UDP)),REJECT",
        "MATCH,DIRECT"
    }));
}

static void
test_to_json()
{
    rule_list_t l_list;

    l_list.append(g_parser.parse_line("DOMAIN,a.com,DIRECT"));
    l_list.append(g_parser.parse_line("MATCH,Proxy"));

    const nlohmann::json l_json = l_list.to_json();

    assert(l_json.is_array());
    assert(l_json.size() == 2);
    assert(l_json[0]["payload"] == "a.com");
    assert(l_json[1]["type"] == "MATCH");
    assert(l_json[1]["action"] == "Proxy");
}

static void
test_concurrent_append()
{
    rule_list_t l_list;

    std::vector<std::thread> l_threads;

    for (int l_thread = 0; l_thread < 4; l_thread++) {
        l_threads.emplace_back([&, l_thread](){
            for (int l_iter = 0; l_iter < 100; l_iter++) {
                l_list.append(g_parser.parse_line(
                    "DOMAIN," + std::to_string(l_thread) + "-"
                        + std::to_string(l_iter) + ".com,DIRECT"
                ));
            }
        });
    }

    for (auto &l_thread : l_threads) {
        l_thread.join();
    }

    assert(l_list.size() == 400);
    assert(l_list.deduplicate() == 0);
    assert(l_list.get_rules().size() == 400);
}

int
main()
{
    test_append_and_insert();
    test_rejects_rule_without_action();
    test_remove_by_condition();
    test_deduplicate_keeps_first();
    test_to_json();
    test_concurrent_append();

    return 0;
}
