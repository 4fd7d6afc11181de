#pragma once

#include "domain/enums/Capability.hpp"
#include "domain/PolicyState.hpp"
#include "domain/DirectoryException.hpp"
#include "settings/PolicySettings.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace scim::application {

/**
 * @brief Резолвер флагов возможностей
 *
 * Приоритет (от высшего к низшему):
 * 1. Runtime override (setOverride / clearOverride)
 * 2. Override из окружения (SCIM_GROUPS_PUT, SCIM_GROUPS_PATCH)
 * 3. Значение профиля
 * 4. Встроенное значение по умолчанию (true)
 *
 * Смена профиля сбрасывает все runtime overrides, слой окружения остаётся.
 */
class PolicyResolver {
public:
    static constexpr bool BUILT_IN_DEFAULT = true;

    explicit PolicyResolver(std::shared_ptr<settings::PolicySettings> settings)
        : settings_(std::move(settings))
    {
        auto profile = resolveProfileName(settings_->getProfile());
        if (!profile) {
            throw invalidProfile(settings_->getProfile());
        }
        profile_ = *profile;

        for (const auto& [flag, value] : settings_->getOverrides()) {
            environment_[requireCapability(flag)] = value;
        }

        std::cout << "[PolicyResolver] Created with profile '" << profile_ << "'" << std::endl;
    }

    bool isAllowed(domain::Capability capability) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return effectiveLocked(capability);
    }

    std::string activeProfile() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return profile_;
    }

    /**
     * @brief Сменить профиль; сбрасывает все runtime overrides
     * @throws DirectoryException(InvalidConfig) для неизвестного профиля
     */
    void setProfile(const std::string& name) {
        auto profile = resolveProfileName(name);
        if (!profile) {
            throw invalidProfile(name);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        profile_ = *profile;
        overrides_.clear();
        std::cout << "[PolicyResolver] Profile changed to '" << profile_ << "', overrides cleared" << std::endl;
    }

    /**
     * @throws DirectoryException(InvalidConfig) для неизвестного флага
     */
    void setOverride(const std::string& flag, bool value) {
        auto capability = requireCapability(flag);

        std::lock_guard<std::mutex> lock(mutex_);
        overrides_[capability] = value;
        std::cout << "[PolicyResolver] Override set: " << flag << "=" << (value ? "true" : "false") << std::endl;
    }

    /**
     * @throws DirectoryException(InvalidConfig) для неизвестного флага
     */
    void clearOverride(const std::string& flag) {
        auto capability = requireCapability(flag);

        std::lock_guard<std::mutex> lock(mutex_);
        overrides_.erase(capability);
        std::cout << "[PolicyResolver] Override cleared: " << flag << std::endl;
    }

    domain::PolicyState snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);

        domain::PolicyState state;
        state.profile = profile_;
        for (auto capability : domain::allCapabilities()) {
            state.effective[domain::toString(capability)] = effectiveLocked(capability);
        }
        for (const auto& [capability, value] : overrides_) {
            state.overrides[domain::toString(capability)] = value;
        }
        for (const auto& [capability, value] : environment_) {
            state.environment[domain::toString(capability)] = value;
        }
        return state;
    }

    /**
     * @brief Каноническое имя профиля (с учётом алиасов), без учёта регистра
     */
    static std::optional<std::string> resolveProfileName(const std::string& name) {
        std::string lowered = name;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (profiles().count(lowered)) {
            return lowered;
        }
        if (lowered == "pingdirectory") return std::string("restricted-put");
        if (lowered == "put_only") return std::string("restricted-patch");
        return std::nullopt;
    }

    static std::vector<std::string> profileNames() {
        std::vector<std::string> names;
        for (const auto& [name, defaults] : profiles()) {
            names.push_back(name);
        }
        return names;
    }

private:
    using Defaults = std::map<domain::Capability, bool>;

    std::shared_ptr<settings::PolicySettings> settings_;
    mutable std::mutex mutex_;
    std::string profile_;
    std::map<domain::Capability, bool> environment_;
    std::map<domain::Capability, bool> overrides_;

    static const std::map<std::string, Defaults>& profiles() {
        static const std::map<std::string, Defaults> table = {
            {"permissive", {
                {domain::Capability::GroupsPut, true},
                {domain::Capability::GroupsPatch, true}}},
            {"restricted-put", {
                {domain::Capability::GroupsPut, false},
                {domain::Capability::GroupsPatch, true}}},
            {"restricted-patch", {
                {domain::Capability::GroupsPut, true},
                {domain::Capability::GroupsPatch, false}}},
        };
        return table;
    }

    bool effectiveLocked(domain::Capability capability) const {
        if (auto it = overrides_.find(capability); it != overrides_.end()) {
            return it->second;
        }
        if (auto it = environment_.find(capability); it != environment_.end()) {
            return it->second;
        }
        const auto& defaults = profiles().at(profile_);
        if (auto it = defaults.find(capability); it != defaults.end()) {
            return it->second;
        }
        return BUILT_IN_DEFAULT;
    }

    static domain::Capability requireCapability(const std::string& flag) {
        auto capability = domain::parseCapability(flag);
        if (!capability) {
            std::string valid;
            for (auto c : domain::allCapabilities()) {
                valid += (valid.empty() ? "" : ", ") + domain::toString(c);
            }
            throw domain::DirectoryException(domain::ErrorKind::InvalidConfig,
                "Invalid setting '" + flag + "'. Valid settings: " + valid);
        }
        return *capability;
    }

    static domain::DirectoryException invalidProfile(const std::string& name) {
        std::string valid;
        for (const auto& profile : profileNames()) {
            valid += (valid.empty() ? "" : ", ") + profile;
        }
        return domain::DirectoryException(domain::ErrorKind::InvalidConfig,
            "Invalid preset '" + name + "'. Valid presets: " + valid);
    }
};

} // namespace scim::application
