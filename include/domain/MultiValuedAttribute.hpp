#pragma once

#include <optional>
#include <string>

namespace scim::domain {

/**
 * @brief Элемент многозначного атрибута
 *
 * Общая форма для emails, phoneNumbers, ims, photos,
 * entitlements, roles и x509Certificates.
 */
struct MultiValuedAttribute {
    std::string value;
    std::optional<std::string> type;
    std::optional<bool> primary;
    std::optional<std::string> display;

    MultiValuedAttribute() = default;

    explicit MultiValuedAttribute(const std::string& value_,
                                  std::optional<std::string> type_ = std::nullopt,
                                  std::optional<bool> primary_ = std::nullopt)
        : value(value_)
        , type(std::move(type_))
        , primary(primary_)
    {}

    bool operator==(const MultiValuedAttribute& other) const {
        return value == other.value
            && type == other.type
            && primary == other.primary
            && display == other.display;
    }

    bool operator!=(const MultiValuedAttribute& other) const { return !(*this == other); }
};

} // namespace scim::domain
