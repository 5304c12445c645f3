#pragma once

#include <string>
#include <vector>

namespace schemaforge {

// Small text helpers shared by the validators, synthesizers and config loader

std::string trim(const std::string& str);
bool isBlank(const std::string& str);
std::string toUpper(std::string text);
std::string toLower(std::string text);
bool iequals(const std::string& a, const std::string& b);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& separator);

}  // namespace schemaforge
