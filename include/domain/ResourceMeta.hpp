#pragma once

#include "Timestamp.hpp"
#include <string>

namespace scim::domain {

/**
 * @brief Метаданные жизненного цикла ресурса
 */
struct ResourceMeta {
    Timestamp created;
    Timestamp lastModified;
    std::string resourceType;

    ResourceMeta() = default;

    explicit ResourceMeta(const std::string& type)
        : created(Timestamp::now())
        , lastModified(created)
        , resourceType(type)
    {}

    void touch() {
        lastModified = Timestamp::now();
    }
};

} // namespace scim::domain
