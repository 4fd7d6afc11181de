#include "application/PatchMerger.hpp"
#include "domain/serialization/ScimJson.hpp"
#include "domain/DirectoryException.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <string>

namespace scim::application {

using domain::AttributeKind;
using domain::AttributeMutation;
using domain::DirectoryException;
using domain::ErrorKind;
using domain::MemberOp;
using domain::MemberOpKind;
using domain::UserAttribute;
using nlohmann::json;

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

DirectoryException invalidType(UserAttribute attribute) {
    return DirectoryException(ErrorKind::InvalidPatch,
        "Invalid value type for attribute '" + domain::toString(attribute) + "'");
}

template <typename T>
std::vector<T> toList(const json& value, UserAttribute attribute) {
    if (value.is_object()) {
        return std::vector<T>{value.get<T>()};
    }
    if (value.is_array()) {
        return value.get<std::vector<T>>();
    }
    throw invalidType(attribute);
}

domain::AttributeValue convertValue(UserAttribute attribute, const json& value, domain::Dialect dialect) {
    switch (domain::kindOf(attribute)) {
        case AttributeKind::String:
            if (!value.is_string()) throw invalidType(attribute);
            return value.get<std::string>();

        case AttributeKind::Bool:
            if (auto flag = domain::json_detail::toBool(value)) return *flag;
            throw invalidType(attribute);

        case AttributeKind::Name:
            if (!value.is_object()) throw invalidType(attribute);
            return value.get<domain::Name>();

        case AttributeKind::MultiValued:
            return toList<domain::MultiValuedAttribute>(value, attribute);

        case AttributeKind::Addresses:
            return toList<domain::Address>(value, attribute);

        case AttributeKind::Enterprise:
            return domain::enterpriseFromJson(value, dialect);
    }
    throw invalidType(attribute);
}

DirectoryException nothingActionable(const std::string& what) {
    return DirectoryException(ErrorKind::InvalidPatch, "No valid " + what + " in patch request");
}

// Ключи тела SCIM 1.1 PATCH, которые не являются изменяемыми атрибутами
const std::set<std::string> kIgnoredLegacyKeys = {"schemas", "id", "meta", "groups"};

} // namespace

AttributeMutation PatchMerger::toMutation(UserAttribute attribute, const json& value, domain::Dialect dialect) {
    if (value.is_null()) {
        return AttributeMutation::clear(attribute);
    }

    try {
        return AttributeMutation(attribute, convertValue(attribute, value, dialect));
    } catch (const json::exception&) {
        throw invalidType(attribute);
    } catch (const DirectoryException& e) {
        if (e.kind() == ErrorKind::InvalidValue) {
            throw DirectoryException(ErrorKind::InvalidPatch, e.what());
        }
        throw;
    }
}

std::vector<MemberOp> PatchMerger::normalizeGroupPatch(const domain::GroupPatch& patch) {
    if (const auto* legacy = std::get_if<domain::LegacyGroupPatch>(&patch)) {
        return normalize(*legacy);
    }
    return normalizeMembers(std::get<domain::CurrentPatch>(patch));
}

std::vector<AttributeMutation> PatchMerger::normalizeUserPatch(const domain::UserPatch& patch) {
    if (const auto* legacy = std::get_if<domain::LegacyUserPatch>(&patch)) {
        return normalize(*legacy);
    }
    return normalizeAttributes(std::get<domain::CurrentPatch>(patch));
}

std::vector<MemberOp> PatchMerger::normalize(const domain::LegacyGroupPatch& patch) {
    if (patch.members.empty()) {
        throw DirectoryException(ErrorKind::InvalidPatch, "No member operations in patch request");
    }

    std::vector<MemberOp> ops;
    for (const auto& entry : patch.members) {
        if (entry.value.empty()) {
            continue;
        }
        auto operation = toLower(entry.operation);
        if (operation == "add") {
            ops.emplace_back(entry.value, MemberOpKind::Add);
        } else if (operation == "delete") {
            ops.emplace_back(entry.value, MemberOpKind::Remove);
        }
    }

    if (ops.empty()) {
        throw nothingActionable("member operations");
    }
    return ops;
}

std::vector<MemberOp> PatchMerger::normalizeMembers(const domain::CurrentPatch& patch) {
    if (patch.operations.empty()) {
        throw DirectoryException(ErrorKind::InvalidPatch, "No Operations in patch request");
    }

    std::vector<MemberOp> ops;
    for (const auto& operation : patch.operations) {
        if (!operation.path || *operation.path != "members") {
            continue;
        }

        auto op = toLower(operation.op);
        MemberOpKind kind;
        if (op == "add") {
            kind = MemberOpKind::Add;
        } else if (op == "remove") {
            kind = MemberOpKind::Remove;
        } else {
            continue;
        }

        // value: один объект {value: id} или список таких объектов
        std::vector<json> refs;
        if (operation.value.is_object()) {
            refs.push_back(operation.value);
        } else if (operation.value.is_array()) {
            refs.assign(operation.value.begin(), operation.value.end());
        }

        for (const auto& ref : refs) {
            if (!ref.is_object()) continue;
            auto it = ref.find("value");
            if (it == ref.end() || !it->is_string() || it->get<std::string>().empty()) continue;
            ops.emplace_back(it->get<std::string>(), kind);
        }
    }

    if (ops.empty()) {
        throw nothingActionable("member operations");
    }
    return ops;
}

std::vector<AttributeMutation> PatchMerger::normalize(const domain::LegacyUserPatch& patch) {
    if (!patch.attributes.is_object()) {
        throw DirectoryException(ErrorKind::InvalidPatch, "Patch body must be an object");
    }

    std::vector<AttributeMutation> mutations;
    for (auto it = patch.attributes.begin(); it != patch.attributes.end(); ++it) {
        const auto& key = it.key();

        if (key == domain::ENTERPRISE_URN_V1) {
            mutations.push_back(toMutation(UserAttribute::Enterprise, it.value(), domain::Dialect::Legacy));
            continue;
        }
        if (kIgnoredLegacyKeys.count(key)) {
            continue;
        }
        if (auto attribute = domain::parseUserAttribute(key)) {
            mutations.push_back(toMutation(*attribute, it.value(), domain::Dialect::Legacy));
        }
    }

    if (mutations.empty()) {
        throw nothingActionable("attributes");
    }
    return mutations;
}

std::vector<AttributeMutation> PatchMerger::normalizeAttributes(const domain::CurrentPatch& patch) {
    if (patch.operations.empty()) {
        throw DirectoryException(ErrorKind::InvalidPatch, "No Operations in patch request");
    }

    const auto dialect = domain::Dialect::Current;
    std::vector<AttributeMutation> mutations;

    auto resolve = [](const std::string& name) -> std::optional<UserAttribute> {
        if (name == domain::ENTERPRISE_URN_V2) return UserAttribute::Enterprise;
        return domain::parseUserAttribute(name);
    };

    for (const auto& operation : patch.operations) {
        auto op = toLower(operation.op);
        const bool isRemove = op == "remove";
        if (!isRemove && op != "replace" && op != "add") {
            continue;
        }

        if (operation.path) {
            auto attribute = resolve(*operation.path);
            if (!attribute) {
                continue;
            }
            if (isRemove) {
                mutations.push_back(AttributeMutation::clear(*attribute));
            } else {
                mutations.push_back(toMutation(*attribute, operation.value, dialect));
            }
            continue;
        }

        // Без path: replace/add с объектом раскладывается по ключам
        if (isRemove || !operation.value.is_object()) {
            continue;
        }
        for (auto it = operation.value.begin(); it != operation.value.end(); ++it) {
            if (auto attribute = resolve(it.key())) {
                mutations.push_back(toMutation(*attribute, it.value(), dialect));
            }
        }
    }

    if (patch.enterprise) {
        mutations.push_back(toMutation(UserAttribute::Enterprise, *patch.enterprise, dialect));
    }

    if (mutations.empty()) {
        throw nothingActionable("operations");
    }
    return mutations;
}

} // namespace scim::application
