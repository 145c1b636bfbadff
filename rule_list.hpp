#pragma once

#include <vector>
#include <string>
#include <shared_mutex>

#include <nlohmann/json.hpp>

#include "rule_model.hpp"

// ordered rule list, rules are identified by their condition string
class rule_list_t {
public:
    rule_list_t();

    ~rule_list_t();

    // throws std::invalid_argument for a simple rule without an action
    void append(rule_t p_rule);

    // p_index past the end appends
    void insert(const size_t p_index, rule_t p_rule);

    // returns the number of rules removed
    size_t remove(const std::string &p_condition);

    bool contains(const std::string &p_condition);

    size_t size();

    // keeps the first rule of every condition string, returns the number
    // of rules dropped
    size_t deduplicate();

    std::vector<rule_t> get_rules();

    std::vector<std::string> to_lines();

    const nlohmann::json to_json();

private:
    std::shared_mutex m_lock;

    std::vector<rule_t> m_rules;
};
