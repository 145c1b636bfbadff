#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

#include "rule_json.hpp"
#include "rule_serializer.hpp"
#include "rule_list.hpp"

rule_list_t::rule_list_t(){};

rule_list_t::~rule_list_t(){};

static void
check_top_level(const rule_t &p_rule)
{
    const auto *const l_simple = std::get_if<simple_rule_t>(&p_rule.m_value);

    if (l_simple != nullptr && !l_simple->m_action) {
        throw std::invalid_argument(
            "rule without action: " + condition_string(p_rule)
        );
    }
}

void
rule_list_t::append(rule_t p_rule)
{
    check_top_level(p_rule);

    std::unique_lock l_guard(m_lock);

    m_rules.push_back(std::move(p_rule));
}

void
rule_list_t::insert(const size_t p_index, rule_t p_rule)
{
    check_top_level(p_rule);

    std::unique_lock l_guard(m_lock);

    const size_t l_index = std::min(p_index, m_rules.size());

    m_rules.insert(m_rules.begin() + l_index, std::move(p_rule));
}

size_t
rule_list_t::remove(const std::string &p_condition)
{
    std::unique_lock l_guard(m_lock);

    const size_t l_before = m_rules.size();

    m_rules.erase(
        std::remove_if(m_rules.begin(), m_rules.end(), [&](const auto &l_rule) {
            return condition_string(l_rule) == p_condition;
        }),
        m_rules.end()
    );

    return l_before - m_rules.size();
}

bool
rule_list_t::contains(const std::string &p_condition)
{
    std::shared_lock l_guard(m_lock);

    return std::any_of(m_rules.begin(), m_rules.end(), [&](const auto &l_rule) {
        return condition_string(l_rule) == p_condition;
    });
}

size_t
rule_list_t::size()
{
    std::shared_lock l_guard(m_lock);

    return m_rules.size();
}

size_t
rule_list_t::deduplicate()
{
    std::unique_lock l_guard(m_lock);

    std::unordered_set<std::string> l_seen;

    const size_t l_before = m_rules.size();

    m_rules.erase(
        std::remove_if(m_rules.begin(), m_rules.end(), [&](const auto &l_rule) {
            return l_seen.insert(condition_string(l_rule)).second == false;
        }),
        m_rules.end()
    );

    return l_before - m_rules.size();
}

std::vector<rule_t>
rule_list_t::get_rules()
{
    std::shared_lock l_guard(m_lock);

    return m_rules;
}

std::vector<std::string>
rule_list_t::to_lines()
{
    std::shared_lock l_guard(m_lock);

    return render_rules(m_rules);
}

const nlohmann::json
rule_list_t::to_json()
{
    std::shared_lock l_guard(m_lock);

    return rules_to_json(m_rules);
}
