#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <string>

namespace scim::settings {

/**
 * @brief Настройки политики из ENV (читаются один раз при старте)
 *
 * - SCIM_PRESET - начальный профиль (default: permissive)
 * - SCIM_GROUPS_PUT - override для groups_put (true/1/yes/on)
 * - SCIM_GROUPS_PATCH - override для groups_patch
 */
class PolicySettings {
public:
    PolicySettings() {
        if (const char* val = std::getenv("SCIM_PRESET")) {
            profile_ = toLower(val);
        }
        if (const char* val = std::getenv("SCIM_GROUPS_PUT")) {
            overrides_["groups_put"] = parseBool(val);
        }
        if (const char* val = std::getenv("SCIM_GROUPS_PATCH")) {
            overrides_["groups_patch"] = parseBool(val);
        }
    }

    PolicySettings(std::string profile, std::map<std::string, bool> overrides)
        : profile_(std::move(profile))
        , overrides_(std::move(overrides))
    {}

    const std::string& getProfile() const { return profile_; }
    const std::map<std::string, bool>& getOverrides() const { return overrides_; }

    static bool parseBool(const std::string& value) {
        auto lowered = toLower(value);
        return lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on";
    }

private:
    std::string profile_ = "permissive";
    std::map<std::string, bool> overrides_;

    static std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }
};

} // namespace scim::settings
