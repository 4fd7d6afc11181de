#pragma once

#include <IHttpHandler.hpp>
#include "domain/DirectoryException.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace scim::adapters::primary {

/**
 * @brief Параметры постраничной выборки из query string
 */
struct Pagination {
    std::size_t startIndex = 1;
    std::size_t count = 100;
};

namespace request_params {

inline long long parseInteger(const std::string& name, const std::string& raw) {
    try {
        std::size_t consumed = 0;
        long long value = std::stoll(raw, &consumed);
        if (consumed == raw.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        // invalid_argument / out_of_range -> ошибка ниже
    }
    throw domain::DirectoryException(domain::ErrorKind::InvalidValue,
        "Query parameter '" + name + "' must be an integer");
}

/**
 * @throws DirectoryException(InvalidValue) если startIndex < 1 или count < 0
 */
inline Pagination pagination(IRequest& req) {
    Pagination page;

    if (auto raw = req.getQueryParam("startIndex"); raw && !raw->empty()) {
        auto value = parseInteger("startIndex", *raw);
        if (value < 1) {
            throw domain::DirectoryException(domain::ErrorKind::InvalidValue, "startIndex must be >= 1");
        }
        page.startIndex = static_cast<std::size_t>(value);
    }

    if (auto raw = req.getQueryParam("count"); raw && !raw->empty()) {
        auto value = parseInteger("count", *raw);
        if (value < 0) {
            throw domain::DirectoryException(domain::ErrorKind::InvalidValue, "count must be >= 0");
        }
        page.count = static_cast<std::size_t>(value);
    }

    return page;
}

inline std::optional<std::string> filter(IRequest& req) {
    auto raw = req.getQueryParam("filter");
    if (!raw || raw->empty()) {
        return std::nullopt;
    }
    return raw;
}

/**
 * @brief ID ресурса из пути (.../Users/{id}); nullopt для коллекции
 */
inline std::optional<std::string> resourceId(IRequest& req) {
    auto id = req.getPathParam(0);
    if (!id || id->empty()) {
        return std::nullopt;
    }
    return id;
}

/**
 * @brief Булево значение query-параметра: true/false, 1/0, yes/no, on/off
 */
inline std::optional<bool> parseBool(const std::string& raw) {
    std::string lowered = raw;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") return true;
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") return false;
    return std::nullopt;
}

} // namespace request_params

} // namespace scim::adapters::primary
