// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include <charconv>
#include <cstdlib>
#include <string>

namespace blockflow {

namespace {

Value plain_scalar(const std::string& s) {
    if (s.empty() || s == "~" || s == "null") return nullptr;
    if (s == "true") return true;
    if (s == "false") return false;

    const char* first = s.data() + ((s[0] == '+') ? 1 : 0);
    const char* last = s.data() + s.size();

    long long whole = 0;
    auto [end, ec] = std::from_chars(first, last, whole);
    if (ec == std::errc() && end == last) return whole;
    if (ec == std::errc::result_out_of_range) return s; // keep oversized ids intact

    // floats and scientific notation; strtod also accepts "inf"/"nan", which stay strings
    char* parsed = nullptr;
    double real = std::strtod(s.c_str(), &parsed);
    bool digits = s.find_first_of("0123456789") != std::string::npos && s.find_first_of("xX") == std::string::npos;
    if (digits && parsed == s.c_str() + s.size()) return real;
    return s;
}

} // namespace

Value yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            // "!" tag marks a quoted scalar: "true" or "42" stay strings
            return node.Tag() == "!" ? Value(node.Scalar()) : plain_scalar(node.Scalar());
        case YAML::NodeType::Sequence: {
            Value items = Value::array();
            for (const auto& item : node) {
                items.push_back(yaml_to_json(item));
            }
            return items;
        }
        case YAML::NodeType::Map: {
            Value fields = Value::object();
            for (const auto& entry : node) {
                fields[entry.first.as<std::string>()] = yaml_to_json(entry.second);
            }
            return fields;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return nullptr;
}

} // namespace blockflow
