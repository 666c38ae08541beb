#include "event.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace srvkeeper {
namespace {

std::string escape(std::string_view input) {
    std::string out;
    out.reserve(input.size() + 2);
    for (char c : input) {
        switch (c) {
            case '\\':
                out += "\\\\";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    out += oss.str();
                } else {
                    out += c;
                }
        }
    }
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

void append_utf8(std::string &out, unsigned int code) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

// Reads a JSON string body starting right after the opening quote. Returns false when the closing
// quote is missing (a line cut off mid-write).
bool read_string_body(std::string_view json, std::size_t pos, std::string &value,
                      std::size_t *end = nullptr) {
    std::string out;
    for (std::size_t i = pos; i < json.size(); ++i) {
        char c = json[i];
        if (c == '"') {
            value = std::move(out);
            if (end) {
                *end = i;
            }
            return true;
        }
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (++i >= json.size()) {
            return false;
        }
        char esc = json[i];
        switch (esc) {
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u': {
                if (i + 4 >= json.size()) {
                    return false;
                }
                unsigned int code = 0;
                for (std::size_t j = 1; j <= 4; ++j) {
                    int digit = hex_value(json[i + j]);
                    if (digit < 0) {
                        return false;
                    }
                    code = (code << 4) | static_cast<unsigned int>(digit);
                }
                i += 4;
                append_utf8(out, code);
                break;
            }
            default:
                out.push_back(esc);
                break;
        }
    }
    return false;
}

bool extract_string(std::string_view json, std::string_view key, std::string &value) {
    const std::string pattern = "\"" + std::string(key) + "\":\"";
    auto pos = json.find(pattern);
    if (pos == std::string_view::npos) {
        return false;
    }
    return read_string_body(json, pos + pattern.size(), value);
}

bool extract_uint64(std::string_view json, std::string_view key, std::uint64_t &value) {
    const std::string pattern = "\"" + std::string(key) + "\":";
    auto pos = json.find(pattern);
    if (pos == std::string_view::npos) {
        return false;
    }
    pos += pattern.size();
    std::uint64_t parsed = 0;
    std::size_t digits = 0;
    while (pos + digits < json.size() && std::isdigit(static_cast<unsigned char>(json[pos + digits]))) {
        parsed = parsed * 10 + static_cast<std::uint64_t>(json[pos + digits] - '0');
        ++digits;
        if (digits > 19) {
            return false;
        }
    }
    if (digits == 0) {
        return false;
    }
    value = parsed;
    return true;
}

bool parse_timestamp(std::string_view text, std::chrono::system_clock::time_point &tp) {
    if (text.size() < 19) {
        return false;
    }
    std::tm parsed{};
    std::istringstream ss(std::string(text.substr(0, 19)));
    ss >> std::get_time(&parsed, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return false;
    }
    std::time_t time_value = timegm(&parsed);
    if (time_value == static_cast<std::time_t>(-1)) {
        return false;
    }
    tp = std::chrono::system_clock::from_time_t(time_value);
    if (text.size() > 20 && text[19] == '.') {
        long long micros = 0;
        std::size_t digits = 0;
        for (std::size_t i = 20; i < text.size() && digits < 6; ++i, ++digits) {
            if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
                break;
            }
            micros = micros * 10 + (text[i] - '0');
        }
        for (; digits < 6; ++digits) {
            micros *= 10;
        }
        tp += std::chrono::microseconds(micros);
    }
    return true;
}

bool extract_attributes(std::string_view json, std::vector<EventAttribute> &attributes) {
    const std::string pattern = "\"attributes\":[";
    auto pos = json.find(pattern);
    if (pos == std::string_view::npos) {
        return false;
    }
    pos += pattern.size();
    attributes.clear();
    while (pos < json.size()) {
        auto start = json.find_first_of("{]", pos);
        if (start == std::string_view::npos || json[start] == ']') {
            return start != std::string_view::npos;
        }
        EventAttribute attribute;
        const std::string key_pattern = "{\"key\":\"";
        if (json.compare(start, key_pattern.size(), key_pattern) != 0) {
            return false;
        }
        std::size_t cursor = start + key_pattern.size();
        if (!read_string_body(json, cursor, attribute.key, &cursor)) {
            return false;
        }
        const std::string value_pattern = ",\"value\":\"";
        if (json.compare(cursor + 1, value_pattern.size(), value_pattern) != 0) {
            return false;
        }
        cursor += 1 + value_pattern.size();
        if (!read_string_body(json, cursor, attribute.value, &cursor)) {
            return false;
        }
        auto close = json.find('}', cursor);
        if (close == std::string_view::npos) {
            return false;
        }
        attributes.push_back(std::move(attribute));
        pos = close + 1;
    }
    return false;
}

}  // namespace

std::string FormatTimestampUtc(const std::chrono::system_clock::time_point &tp) {
    using namespace std::chrono;
    auto time_t_value = system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time_t_value, &tm);
    auto fractional = duration_cast<microseconds>(tp.time_since_epoch()).count() % 1000000;
    if (fractional < 0) {
        fractional += 1000000;
    }
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(6) << std::setfill('0') << fractional << "Z";
    return oss.str();
}

std::string SerializeEvent(const EventRecord &record) {
    std::ostringstream oss;
    oss << '{';
    oss << "\"timestamp\":\"" << FormatTimestampUtc(record.timestamp) << "\",";
    oss << "\"sequence\":" << record.sequence << ',';
    oss << "\"source\":\"" << escape(record.source) << "\",";
    oss << "\"category\":\"" << escape(record.category) << "\",";
    oss << "\"severity\":\"" << escape(record.severity) << "\",";
    oss << "\"message\":\"" << escape(record.message) << "\",";

    std::vector<EventAttribute> attributes = record.attributes;
    std::stable_sort(attributes.begin(), attributes.end(),
                     [](const auto &lhs, const auto &rhs) { return lhs.key < rhs.key; });

    oss << "\"attributes\":[";
    for (std::size_t i = 0; i < attributes.size(); ++i) {
        if (i > 0) {
            oss << ',';
        }
        oss << "{\"key\":\"" << escape(attributes[i].key) << "\",\"value\":\"" << escape(attributes[i].value)
            << "\"}";
    }
    oss << "]}";
    return oss.str();
}

bool DeserializeEvent(std::string_view json, EventRecord &record) {
    record = EventRecord{};
    std::string timestamp;
    if (!extract_string(json, "timestamp", timestamp) || !parse_timestamp(timestamp, record.timestamp)) {
        return false;
    }
    if (!extract_uint64(json, "sequence", record.sequence)) {
        record.sequence = 0;
    }
    extract_string(json, "source", record.source);
    extract_string(json, "category", record.category);
    extract_string(json, "severity", record.severity);
    extract_string(json, "message", record.message);
    extract_attributes(json, record.attributes);
    return true;
}

std::optional<std::string> FindAttribute(const EventRecord &record, std::string_view key) {
    for (const auto &attr : record.attributes) {
        if (attr.key == key) {
            return attr.value;
        }
    }
    return std::nullopt;
}

void SetAttribute(EventRecord &record, const std::string &key, const std::string &value) {
    for (auto &attr : record.attributes) {
        if (attr.key == key) {
            attr.value = value;
            return;
        }
    }
    record.attributes.push_back({key, value});
}

}  // namespace srvkeeper
