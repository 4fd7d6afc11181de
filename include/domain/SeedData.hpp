#pragma once

#include "User.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace scim::domain {

/**
 * @brief Группа для начального заполнения: участники заданы по userName
 */
struct SeedGroup {
    std::string displayName;
    std::optional<std::string> externalId;
    std::vector<std::string> memberUserNames;
};

struct SeedData {
    std::vector<User> users;
    std::vector<SeedGroup> groups;
};

struct SeedResult {
    std::size_t users = 0;
    std::size_t groups = 0;
};

} // namespace scim::domain
