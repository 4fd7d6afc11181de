#pragma once

#include <cstddef>
#include <vector>

namespace scim::domain {

/**
 * @brief Страница результатов
 *
 * total: количество после фильтрации, до применения окна startIndex/count.
 */
template <typename T>
struct ListResult {
    std::vector<T> items;
    std::size_t total = 0;
};

} // namespace scim::domain
