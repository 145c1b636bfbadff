#include <exception>
#include <iostream>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "misc.hpp"
#include "rule_json.hpp"
#include "rule_list.hpp"
#include "rule_parser.hpp"

std::shared_ptr<spdlog::logger> g_log;

static std::optional<std::string>
get_option(
    const boost::program_options::variables_map &p_map,
    const std::string                           &p_name
) {
    if (p_map.count(p_name)) {
        return std::optional(p_map[p_name].as<std::string>());
    } else {
        return std::optional<std::string>();
    }
}

static std::vector<std::string>
load_rule_lines(const std::string &p_path)
{
    std::vector<std::string> l_lines;

    for (const auto &l_line : read_lines(p_path)) {
        if (trim(l_line).starts_with("#")) {
            // keep the line numbers of the results aligned with the file
            l_lines.push_back(std::string());
        } else {
            l_lines.push_back(l_line);
        }
    }

    return l_lines;
}

// returns false when a strict run hit a failing entry
static bool
collect_results(
    const std::vector<parse_result_t> &p_results,
    const bool                         p_strict,
    rule_list_t                       &p_list
) {
    size_t l_failed = 0;

    for (const auto &l_result : p_results) {
        if (l_result.is_empty()) {
            continue;
        }

        if (l_result.m_error) {
            g_log->error(
                "entry {}: {}",
                l_result.m_index + 1,
                l_result.m_error->what()
            );

            if (p_strict) {
                return false;
            }

            l_failed++;

            continue;
        }

        p_list.append(l_result.m_rule.value());
    }

    g_log->info("rule list holds {} rules, {} rejected", p_list.size(), l_failed);

    return true;
}

int
main(const int p_argc, const char** p_argv)
{
    g_log = spdlog::stderr_color_mt("console");
    g_log->set_level(spdlog::level::info);

    try {
        boost::program_options::options_description
            l_description("clashrule Allowed options");

        l_description.add_options()
            ( "help,h",    "produce help message"                      )
            ( "version,v", "print version"                             )
            ( "dedupe",    "drop rules with an already seen condition" )
            ( "strict",    "stop at the first rule that fails to parse" )
            (
                "input",
                boost::program_options::value<std::string>(),
                "file with one rule per line"
            )
            (
                "json",
                boost::program_options::value<std::string>(),
                "file with a json array of structured rules"
            )
            (
                "format",
                boost::program_options::value<std::string>()
                    ->default_value("text"),
                "output format, text or json"
            )
            (
                "output",
                boost::program_options::value<std::string>(),
                "file to write the normalized rules to"
            )
            (
                "log-level",
                boost::program_options::value<std::string>()
                    ->default_value("info"),
                "trace, debug, info, warn or error"
            );

        boost::program_options::variables_map l_map;

        boost::program_options::store(
            boost::program_options::parse_command_line(
                p_argc,
                p_argv,
                l_description
            ),
            l_map
        );

        boost::program_options::notify(l_map);

        if (l_map.count("help")) {
            std::cout << l_description;

            return 0;
        }

        if (l_map.count("version")) {
            std::cout << "0.1.2" << std::endl;

            return 0;
        }

        g_log->set_level(
            spdlog::level::from_str(l_map["log-level"].as<std::string>())
        );

        const std::optional<std::string> l_input  = get_option(l_map, "input");
        const std::optional<std::string> l_json   = get_option(l_map, "json");
        const std::optional<std::string> l_output = get_option(l_map, "output");
        const std::string l_format = l_map["format"].as<std::string>();

        if (!l_input && !l_json) {
            throw std::runtime_error("one of --input or --json is required");
        }

        if (l_format != "text" && l_format != "json") {
            throw std::runtime_error("unknown format " + l_format);
        }

        const rule_parser l_parser(g_log);
        rule_list_t       l_list;
        const bool        l_strict = l_map.count("strict") > 0;

        if (l_input) {
            g_log->info("reading rules from {}", l_input.value());

            const std::vector<parse_result_t> l_results =
                l_parser.parse_lines(load_rule_lines(l_input.value()));

            if (!collect_results(l_results, l_strict, l_list)) {
                return 1;
            }
        }

        if (l_json) {
            g_log->info("reading structured rules from {}", l_json.value());

            const std::vector<parse_result_t> l_results =
                l_parser.parse_structured_list(
                    nlohmann::json::parse(file_to_string(l_json.value()))
                );

            if (!collect_results(l_results, l_strict, l_list)) {
                return 1;
            }
        }

        if (l_map.count("dedupe")) {
            g_log->info("dropped {} duplicate rules", l_list.deduplicate());
        }

        const std::string l_data = [&](){
            if (l_format == "json") {
                return l_list.to_json().dump(4) + "\n";
            }

            std::string l_text;

            for (const auto &l_line : l_list.to_lines()) {
                l_text += l_line + "\n";
            }

            return l_text;
        }();

        if (l_output) {
            atomically_write_file(l_output.value(), l_data);
        } else {
            std::cout << l_data;
        }
    } catch (const std::exception &p_error) {
        g_log->error("main() exception: {}", p_error.what());

        return 1;
    }

    return 0;
}
