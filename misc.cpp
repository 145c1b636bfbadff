#include <fstream>
#include <cstdio>
#include <stdexcept>

#include <boost/algorithm/string.hpp>

#include "misc.hpp"

std::string
trim(const std::string &p_text)
{
    return boost::algorithm::trim_copy(p_text);
}

std::string
to_upper(const std::string &p_text)
{
    return boost::algorithm::to_upper_copy(p_text);
}

std::vector<std::string>
split_fields(const std::string &p_text)
{
    std::vector<std::string> l_parts;

    boost::algorithm::split(l_parts, p_text, boost::algorithm::is_any_of(","));

    std::vector<std::string> l_result;

    for (const auto &l_part : l_parts) {
        const std::string l_trimmed = trim(l_part);

        if (!l_trimmed.empty()) {
            l_result.push_back(l_trimmed);
        }
    }

    return l_result;
}

std::string
join(const std::vector<std::string> &p_parts, const std::string &p_separator)
{
    return boost::algorithm::join(p_parts, p_separator);
}

std::vector<std::string>
read_lines(const std::string &p_path)
{
    std::ifstream l_stream(p_path);

    if (l_stream.is_open() == false) {
        throw std::runtime_error("std::ifstream() failed: " + p_path);
    }

    std::vector<std::string> l_lines;
    std::string              l_line;

    while (std::getline(l_stream, l_line)) {
        l_lines.push_back(l_line);
    }

    return l_lines;
}

std::string
file_to_string(const std::string &p_path) {
    std::ifstream l_stream(p_path);

    if (l_stream.is_open() == false) {
        throw std::runtime_error("std::ifstream() failed: " + p_path);
    }

    return std::string(
        (std::istreambuf_iterator<char>(l_stream)),
        std::istreambuf_iterator<char>()
    );
}

void
atomically_write_file(const std::string &p_path, const std::string &p_data)
{
    const std::string l_temp_path = p_path + ".tmp";

    std::ofstream l_stream(l_temp_path);

    if (!l_stream) {
        throw std::runtime_error("std::of_stream() failed");
    }

    l_stream << p_data;

    l_stream.close();

    if (std::rename(l_temp_path.c_str(), p_path.c_str())) {
        throw std::runtime_error("std::rename failed");
    }
}
