#pragma once

#include <string>

namespace composedeck {

std::string lower(std::string value);
std::string trim(const std::string &value);
bool equalsIgnoreCase(const std::string &a, const std::string &b);

} // namespace composedeck
