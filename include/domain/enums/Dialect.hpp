#pragma once

#include <string>

namespace scim::domain {

/**
 * @brief Версия протокола SCIM
 *
 * Legacy - SCIM 1.1 (/scim/v1)
 * Current - SCIM 2.0 (/scim/v2)
 */
enum class Dialect {
    Legacy,
    Current
};

inline const std::string ENTERPRISE_URN_V1 = "urn:scim:schemas:extension:enterprise:1.0";
inline const std::string ENTERPRISE_URN_V2 = "urn:ietf:params:scim:schemas:extension:enterprise:2.0:User";

inline std::string toString(Dialect dialect) {
    switch (dialect) {
        case Dialect::Legacy: return "v1";
        case Dialect::Current: return "v2";
        default: return "unknown";
    }
}

/**
 * @brief URN enterprise-расширения для версии протокола
 */
inline const std::string& enterpriseUrn(Dialect dialect) {
    return dialect == Dialect::Legacy ? ENTERPRISE_URN_V1 : ENTERPRISE_URN_V2;
}

} // namespace scim::domain
