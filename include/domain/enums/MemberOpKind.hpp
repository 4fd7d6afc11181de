#pragma once

#include <string>

namespace scim::domain {

enum class MemberOpKind {
    Add,
    Remove
};

inline std::string toString(MemberOpKind kind) {
    switch (kind) {
        case MemberOpKind::Add: return "add";
        case MemberOpKind::Remove: return "remove";
        default: return "unknown";
    }
}

} // namespace scim::domain
