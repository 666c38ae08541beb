#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace srvkeeper {

bool ContainsCaseInsensitive(std::string_view haystack, std::string_view needle);
bool ContainsAnyCaseInsensitive(std::string_view haystack, const std::vector<std::string_view> &needles);

std::string Trim(std::string_view value);
std::string ToLower(std::string_view value);

// Splits on `separator`, trimming each piece and dropping empty ones.
std::vector<std::string> SplitList(std::string_view value, char separator);

}  // namespace srvkeeper
