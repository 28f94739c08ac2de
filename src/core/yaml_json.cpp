#include "yaml_json.hpp"
#include <fmt/format.h>
#include <regex>

static std::string json_string(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<int>(c));
                } else {
                    out += c;
                }
        }
    }
    return out + "\"";
}

static std::string json_scalar(const YAML::Node& node) {
    const std::string& value = node.Scalar();

    // "!" marks a scalar that was quoted in the source
    if (node.Tag() == "!") return json_string(value);

    if (value == "true" || value == "True" || value == "TRUE") return "true";
    if (value == "false" || value == "False" || value == "FALSE") return "false";
    if (value == "null" || value == "Null" || value == "NULL" || value == "~") return "null";

    static const std::regex number(R"(-?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?)");
    if (std::regex_match(value, number)) return value;

    return json_string(value);
}

std::string yaml_to_json(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) return "null";

    if (node.IsScalar()) return json_scalar(node);

    std::string out;
    if (node.IsSequence()) {
        out = "[";
        bool first = true;
        for (const auto& item : node) {
            if (!first) out += ", ";
            first = false;
            out += yaml_to_json(item);
        }
        return out + "]";
    }

    out = "{";
    bool first = true;
    for (const auto& kv : node) {
        if (!first) out += ", ";
        first = false;
        out += json_string(kv.first.as<std::string>()) + ": " + yaml_to_json(kv.second);
    }
    return out + "}";
}
