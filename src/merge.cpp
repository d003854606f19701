#include "merge.hpp"
#include "lib.hpp"
#include "jsonhlp.hpp"

namespace merge {

const char* to_string(MergeError err) {
    switch (err) {
        case MergeError::None:             return "none";
        case MergeError::NoMethodFound:    return "no-method-found";
        case MergeError::UnbalancedBraces: return "unbalanced-braces";
        case MergeError::AmbiguousMethod:  return "ambiguous-method";
    }
    return "unknown";
}

} // namespace merge

std::string MergeConfig::entity_anchor(const std::string& param) const {
    return param + "." + entity_call;
}

std::string MergeConfig::partial_call(const std::string& param) const {
    return partial_method + "(" + param + ");";
}

bool MergeConfig::from_json(jdoc& doc, MergeConfig& config) {
    jval& j = doc;
    if (!j.IsObject()) return false;

    // every key is optional: absent or mistyped keys keep the current value
    const auto read = [&](const char* key, std::string& target) {
        std::string value = jhlp::get<std::string>(j, key, target);
        if (j.HasMember(key) && !j.FindMember(key)->value.IsString()) {
            LOG_WARN("config key '%s' must be a string, keeping '%s'", key, target.c_str());
        }
        target = value;
    };

    read(CFG_METHOD_NAME,    config.method_name);
    read(CFG_BUILDER_TYPE,   config.builder_type);
    read(CFG_PARTIAL_METHOD, config.partial_method);
    read(CFG_ENTITY_CALL,    config.entity_call);
    read(CFG_MARKER_BEGIN,   config.marker_begin);
    read(CFG_MARKER_END,     config.marker_end);
    read(CFG_MARKER_PREFIX,  config.marker_prefix);
    read(CFG_BANNER_BEGIN,   config.banner_begin);
    read(CFG_BANNER_END,     config.banner_end);
    read(CFG_CONTEXT_FILE,   config.context_file);
    read(CFG_MODEL_EXT,      config.model_ext);

    if (config.method_name.empty() || config.builder_type.empty() ||
        config.partial_method.empty() || config.entity_call.empty()) {
        LOG_WARN("config: methodName, builderType, partialMethod and entityCall cannot be empty");
        return false;
    }
    // banner lines must be recognized as stray markers, or a second run would carry them over twice
    if (config.banner_begin.rfind(config.marker_prefix, 0) != 0 ||
        config.banner_end.rfind(config.marker_prefix, 0) != 0) {
        LOG_WARN("config: bannerBegin and bannerEnd must start with markerPrefix '%s'",
                 config.marker_prefix.c_str());
        return false;
    }
    return true;
}

MergeConfig MergeConfig::load(const std::string& path) {
    jdoc doc;
    if (!jhlp::parse_file(path, doc)) {
        THROW("Config: cannot read '%s'", path.c_str());
    }
    MergeConfig config;
    if (!from_json(doc, config)) {
        THROW("Config: '%s' is not a valid ctxmerge configuration", path.c_str());
    }
    return config;
}
