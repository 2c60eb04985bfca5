//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/utils/misc.h"

#include <cerrno>
#include <cstdlib>

namespace mtlink {

vector<string> full_split(Slice s, char delimiter, size_t max_parts) {
  vector<string> result;
  if (s.empty()) {
    return result;
  }
  while (result.size() + 1 < max_parts) {
    auto delimiter_pos = s.find(delimiter);
    if (delimiter_pos == static_cast<size_t>(-1)) {
      break;
    }
    result.push_back(s.substr(0, delimiter_pos).str());
    s.remove_prefix(delimiter_pos + 1);
  }
  result.push_back(s.str());
  return result;
}

string to_lower(Slice slice) {
  auto result = slice.str();
  for (auto &c : result) {
    c = to_lower(c);
  }
  return result;
}

Slice trim(Slice str) {
  auto begin = str.begin();
  auto end = str.end();
  while (begin < end && is_space(*begin)) {
    begin++;
  }
  while (begin < end && is_space(end[-1])) {
    end--;
  }
  return Slice(begin, end);
}

string hex_encode(Slice data) {
  const char *hex = "0123456789abcdef";
  string res;
  res.reserve(2 * data.size());
  for (unsigned char c : data) {
    res.push_back(hex[c >> 4]);
    res.push_back(hex[c & 15]);
  }
  return res;
}

Result<double> to_double_safe(Slice str) {
  auto s = trim(str).str();
  if (s.empty()) {
    return Status::Error("Expected a number, but found an empty string");
  }
  errno = 0;
  char *end = nullptr;
  double result = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size() || errno == ERANGE) {
    return Status::Error(PSLICE() << "Can't parse \"" << str << "\" as a floating point number");
  }
  return result;
}

}  // namespace mtlink
