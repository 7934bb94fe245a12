/**
 * @file csv_fields.hpp
 * @brief Field splitting and numeric parsing shared by the text readers.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace edlsim::io::detail {

inline std::vector<std::string> split_fields(const std::string& line, const char delim) {
  std::vector<std::string> fields;
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, delim)) {
    fields.push_back(token);
  }
  return fields;
}

inline std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

/**
 * @brief Parse a whole field as a double; trailing garbage is rejected.
 */
inline bool parse_double(const std::string& text, double& value) {
  const std::string t = trim(text);
  if (t.empty()) {
    return false;
  }
  std::size_t used = 0;
  try {
    value = std::stod(t, &used);
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
  return used == t.size();
}

}  // namespace edlsim::io::detail
