#include "extra_vars.hpp"
#include <core/utils.hpp>
#include <core/yaml_json.hpp>

Result<YAML::Node> parse_extra_vars(const std::string& vars) {
    std::string text = vars;
    trim(text);
    if (text.empty()) {
        return Result<YAML::Node>::Ok(YAML::Node(YAML::NodeType::Map));
    }

    YAML::Node node;
    try {
        node = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return Result<YAML::Node>::Err(ErrorCode::Validation,
                                       "extra variables are not valid JSON/YAML: " + std::string(e.what()));
    }

    if (node.IsNull()) {
        return Result<YAML::Node>::Ok(YAML::Node(YAML::NodeType::Map));
    }
    if (!node.IsMap()) {
        return Result<YAML::Node>::Err(ErrorCode::Validation,
                                       "extra variables must be a map, got: " + text);
    }
    return Result<YAML::Node>::Ok(node);
}

Result<std::string> merge_extra_vars(const std::string& defaults,
                                     const std::string& overrides) {
    auto base = parse_extra_vars(defaults);
    if (base.is_err()) return forward_error<std::string>(base);
    auto over = parse_extra_vars(overrides);
    if (over.is_err()) return forward_error<std::string>(over);

    YAML::Node merged(YAML::NodeType::Map);
    for (const auto& kv : base.value) {
        merged[kv.first.as<std::string>()] = kv.second;
    }
    for (const auto& kv : over.value) {
        merged[kv.first.as<std::string>()] = kv.second;
    }

    return Result<std::string>::Ok(yaml_to_json(merged));
}
