#pragma once

#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

namespace ngp {

// Overlays a loaded file onto the schema defaults.
// Only keys the defaults define are taken; a scalar or sequence cannot
// replace a mapping. Every skipped key is appended to `ignored` as a dotted
// path so the caller can report it.
inline YAML::Node mergeYaml(const YAML::Node& defaults, const YAML::Node& overlay,
                            std::vector<std::string>* ignored, const std::string& prefix = {})
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(defaults);

    if (!defaults.IsMap())
        return overlay.IsMap() ? YAML::Clone(defaults) : YAML::Clone(overlay);

    if (!overlay.IsMap()) {
        if (ignored) ignored->push_back(prefix.empty() ? std::string("<root>") : prefix);
        return YAML::Clone(defaults);
    }

    YAML::Node result = YAML::Clone(defaults);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto key = it->first.as<std::string>();
        const std::string path = prefix.empty() ? key : prefix + "." + key;
        if (!result[key]) {
            if (ignored) ignored->push_back(path);
            continue;
        }
        if (result[key].IsMap() != it->second.IsMap() && !it->second.IsNull()) {
            if (ignored) ignored->push_back(path);
            continue;
        }
        result[key] = mergeYaml(result[key], it->second, ignored, path);
    }
    return result;
}

} // namespace ngp
