#ifndef JSON_PARSER_HPP
#define JSON_PARSER_HPP

#include <string>
#include <map>
#include <vector>
#include <cstdint>
#include <boost/property_tree/ptree.hpp>

namespace sealgate {

class JsonParser {
public:
    // Parses a JSON object body. Returns false on malformed input or a non-object root.
    static bool parseObject(const std::string& json, boost::property_tree::ptree& out);

    // Reads a string field; returns false when the field is absent or JSON null.
    static bool getString(const boost::property_tree::ptree& tree, const std::string& key, std::string& out);
    static bool getInt64(const boost::property_tree::ptree& tree, const std::string& key, int64_t& out);
    // Array of scalars. Returns false when the key is absent or is not an array.
    static bool getStringArray(const boost::property_tree::ptree& tree, const std::string& key,
                               std::vector<std::string>& out);

    static std::string createResponse(bool success, const std::string& message, const std::map<std::string, std::string>& data = {});
    static std::string createErrorResponse(const std::string& message);
    static std::string createErrorResponse(const std::string& code, const std::string& message,
                                           const std::map<std::string, std::string>& context);
    static std::string createSuccessResponse(const std::string& message, const std::map<std::string, std::string>& data = {});
    static std::string escapeJson(const std::string& str);
    static std::string quote(const std::string& str);
    static std::string stringArray(const std::vector<std::string>& values);
};

} // namespace sealgate

#endif // JSON_PARSER_HPP
