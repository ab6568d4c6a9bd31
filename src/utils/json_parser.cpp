#include "../../include/utils/json_parser.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <sstream>
#include <iomanip>
#include <cctype>
#include <cstdlib>
#include <cerrno>

namespace sealgate {

namespace pt = boost::property_tree;

bool JsonParser::parseObject(const std::string& json, pt::ptree& out) {
    size_t first = json.find_first_not_of(" \t\r\n");
    if (first == std::string::npos || json[first] != '{') {
        return false;
    }
    try {
        std::istringstream ss(json);
        pt::read_json(ss, out);
        return true;
    } catch (const pt::json_parser_error&) {
        return false;
    }
}

bool JsonParser::getString(const pt::ptree& tree, const std::string& key, std::string& out) {
    auto child = tree.get_child_optional(pt::ptree::path_type(key, '\0'));
    if (!child || !child->empty()) {
        return false;
    }
    const std::string& value = child->data();
    // read_json keeps the literal text of null.
    if (value == "null") {
        return false;
    }
    out = value;
    return true;
}

bool JsonParser::getInt64(const pt::ptree& tree, const std::string& key, int64_t& out) {
    std::string raw;
    if (!getString(tree, key, raw) || raw.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(raw.c_str(), &end, 10);
    if (errno != 0 || end == raw.c_str() || *end != '\0') {
        return false;
    }
    out = static_cast<int64_t>(value);
    return true;
}

bool JsonParser::getStringArray(const pt::ptree& tree, const std::string& key,
                                std::vector<std::string>& out) {
    auto child = tree.get_child_optional(pt::ptree::path_type(key, '\0'));
    if (!child) {
        return false;
    }
    // "[]" parses to a leaf with empty data; a scalar has non-empty data.
    if (child->empty()) {
        if (!child->data().empty()) {
            return false;
        }
        out.clear();
        return true;
    }
    out.clear();
    for (const auto& item : *child) {
        if (!item.first.empty() || !item.second.empty()) {
            return false;
        }
        out.push_back(item.second.data());
    }
    return true;
}

std::string JsonParser::createResponse(bool success, const std::string& message, const std::map<std::string, std::string>& data) {
    std::ostringstream oss;
    oss << "{\"success\":" << (success ? "true" : "false") 
        << ",\"message\":\"" << escapeJson(message) << "\"";
    
    if (!data.empty()) {
        oss << ",\"data\":{";
        bool first = true;
        for (const auto& pair : data) {
            if (!first) oss << ",";
            first = false;
            oss << "\"" << escapeJson(pair.first) << "\":\"" << escapeJson(pair.second) << "\"";
        }
        oss << "}";
    }
    
    oss << "}";
    return oss.str();
}

std::string JsonParser::createErrorResponse(const std::string& message) {
    return createResponse(false, message);
}

std::string JsonParser::createErrorResponse(const std::string& code, const std::string& message,
                                            const std::map<std::string, std::string>& context) {
    std::ostringstream oss;
    oss << "{\"success\":false"
        << ",\"error\":\"" << escapeJson(code.empty() ? message : code) << "\""
        << ",\"message\":\"" << escapeJson(message) << "\"";
    for (const auto& pair : context) {
        oss << ",\"" << escapeJson(pair.first) << "\":\"" << escapeJson(pair.second) << "\"";
    }
    oss << "}";
    return oss.str();
}

std::string JsonParser::createSuccessResponse(const std::string& message, const std::map<std::string, std::string>& data) {
    return createResponse(true, message, data);
}

std::string JsonParser::escapeJson(const std::string& str) {
    std::ostringstream result;
    for (char c : str) {
        switch (c) {
            case '"': result << "\\\""; break;
            case '\\': result << "\\\\"; break;
            case '\n': result << "\\n"; break;
            case '\r': result << "\\r"; break;
            case '\t': result << "\\t"; break;
            case '\b': result << "\\b"; break;
            case '\f': result << "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                           << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    result << c;
                }
                break;
        }
    }
    return result.str();
}

std::string JsonParser::quote(const std::string& str) {
    return "\"" + escapeJson(str) + "\"";
}

std::string JsonParser::stringArray(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) out += ",";
        out += quote(values[i]);
    }
    out += "]";
    return out;
}

} // namespace sealgate
