#pragma once

#include <string>
#include <vector>

std::string trim(const std::string &p_text);

std::string to_upper(const std::string &p_text);

// splits on ',' and keeps only non empty trimmed fields
std::vector<std::string> split_fields(const std::string &p_text);

std::string
join(const std::vector<std::string> &p_parts, const std::string &p_separator);

std::vector<std::string> read_lines(const std::string &p_path);

std::string
file_to_string(const std::string &p_path);

void
atomically_write_file(const std::string &p_path, const std::string &p_data);
