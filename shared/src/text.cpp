#include "text.hpp"

#include <algorithm>
#include <cctype>

namespace srvkeeper {

bool ContainsCaseInsensitive(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) {
        return true;
    }
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) { return std::tolower(static_cast<unsigned char>(a)) ==
                                                    std::tolower(static_cast<unsigned char>(b)); });
    return it != haystack.end();
}

bool ContainsAnyCaseInsensitive(std::string_view haystack, const std::vector<std::string_view> &needles) {
    return std::any_of(needles.begin(), needles.end(),
                       [haystack](std::string_view needle) { return ContainsCaseInsensitive(haystack, needle); });
}

std::string Trim(std::string_view value) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && is_space(value[begin])) {
        ++begin;
    }
    while (end > begin && is_space(value[end - 1])) {
        --end;
    }
    return std::string(value.substr(begin, end - begin));
}

std::string ToLower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> SplitList(std::string_view value, char separator) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= value.size()) {
        auto end = value.find(separator, start);
        if (end == std::string_view::npos) {
            end = value.size();
        }
        std::string piece = Trim(value.substr(start, end - start));
        if (!piece.empty()) {
            out.push_back(std::move(piece));
        }
        start = end + 1;
    }
    return out;
}

}  // namespace srvkeeper
