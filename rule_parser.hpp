#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "parse_error.hpp"
#include "rule_model.hpp"

// outcome of one entry of a batch, exactly one of m_rule / m_error is set
struct parse_result_t {
    size_t                          m_index;
    std::optional<rule_t>           m_rule;
    std::optional<rule_parse_error> m_error;
    std::vector<diagnostic_t>       m_diagnostics;

    bool is_empty() const;
};

// Stateless, every method may be called concurrently.
class rule_parser {
public:
    rule_parser(std::shared_ptr<spdlog::logger> p_log);

    ~rule_parser();

    // throws rule_parse_error, non fatal findings are appended to
    // p_diagnostics when given
    rule_t
    parse_line(
        const std::string               &p_line,
        std::vector<diagnostic_t> *const p_diagnostics = nullptr
    ) const;

    // object with type / action / payload / extra_params / conditions,
    // or a plain string holding a rule line
    rule_t
    parse_structured(
        const nlohmann::json            &p_json,
        std::vector<diagnostic_t> *const p_diagnostics = nullptr
    ) const;

    std::vector<parse_result_t>
    parse_lines(const std::vector<std::string> &p_lines) const;

    std::vector<parse_result_t>
    parse_structured_list(const nlohmann::json &p_list) const;

private:
    const std::shared_ptr<spdlog::logger> m_log;

    static rule_t parse_match_rule(const std::string &p_line);

    static rule_t parse_simple_rule(const std::string &p_line);

    static rule_t
    parse_logic_rule(
        const std::string               &p_line,
        std::vector<diagnostic_t> *const p_diagnostics
    );

    void
    report_diagnostics(
        const std::string               &p_line,
        const std::vector<diagnostic_t> &p_found,
        std::vector<diagnostic_t> *const p_diagnostics
    ) const;

    template<typename parse_fn_t>
    parse_result_t
    parse_entry(const size_t p_index, const parse_fn_t &p_parse) const;
};
