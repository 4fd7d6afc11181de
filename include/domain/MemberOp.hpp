#pragma once

#include "enums/MemberOpKind.hpp"
#include <string>

namespace scim::domain {

/**
 * @brief Нормализованная операция над списком участников группы
 */
struct MemberOp {
    std::string memberId;
    MemberOpKind kind = MemberOpKind::Add;

    MemberOp() = default;

    MemberOp(const std::string& memberId_, MemberOpKind kind_)
        : memberId(memberId_)
        , kind(kind_)
    {}

    bool operator==(const MemberOp& other) const {
        return memberId == other.memberId && kind == other.kind;
    }
};

} // namespace scim::domain
