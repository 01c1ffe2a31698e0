#pragma once

#include <string>
#include <vector>

namespace StringUtils {
std::vector<std::string> split(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string join(const std::vector<std::string>& parts, const std::string& sep);
bool starts_with(const std::string& str, const std::string& prefix);
}
