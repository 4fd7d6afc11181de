#pragma once

#include <optional>
#include <string>
#include <vector>

namespace scim::domain {

/**
 * @brief Флаги возможностей, управляемые политикой
 */
enum class Capability {
    GroupsPut,
    GroupsPatch
};

inline std::string toString(Capability capability) {
    switch (capability) {
        case Capability::GroupsPut: return "groups_put";
        case Capability::GroupsPatch: return "groups_patch";
        default: return "unknown";
    }
}

inline std::optional<Capability> parseCapability(const std::string& name) {
    if (name == "groups_put") return Capability::GroupsPut;
    if (name == "groups_patch") return Capability::GroupsPatch;
    return std::nullopt;
}

inline const std::vector<Capability>& allCapabilities() {
    static const std::vector<Capability> capabilities = {
        Capability::GroupsPut,
        Capability::GroupsPatch
    };
    return capabilities;
}

} // namespace scim::domain
