#pragma once

#include "domain/PatchRequest.hpp"
#include "domain/MemberOp.hpp"
#include "domain/AttributeMutation.hpp"
#include "domain/enums/Dialect.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace scim::application {

/**
 * @brief Нормализация PATCH обеих версий протокола
 *
 * SCIM 1.1 и SCIM 2.0 описывают изменения по-разному; обе грамматики
 * сводятся к спискам MemberOp и AttributeMutation до обращения к хранилищу,
 * поэтому хранилище ничего не знает о версиях.
 *
 * Все методы бросают DirectoryException(InvalidPatch), если после
 * отбрасывания неподдерживаемых записей ничего не осталось.
 */
class PatchMerger {
public:
    static std::vector<domain::MemberOp> normalizeGroupPatch(const domain::GroupPatch& patch);

    static std::vector<domain::AttributeMutation> normalizeUserPatch(const domain::UserPatch& patch);

    /**
     * @brief Привести JSON-значение к типу атрибута
     *
     * null означает очистку. Одиночный объект для многозначного
     * атрибута оборачивается в список.
     *
     * @throws DirectoryException(InvalidPatch) при несоответствии типа
     */
    static domain::AttributeMutation toMutation(
        domain::UserAttribute attribute,
        const nlohmann::json& value,
        domain::Dialect dialect);

private:
    static std::vector<domain::MemberOp> normalize(const domain::LegacyGroupPatch& patch);
    static std::vector<domain::MemberOp> normalizeMembers(const domain::CurrentPatch& patch);
    static std::vector<domain::AttributeMutation> normalize(const domain::LegacyUserPatch& patch);
    static std::vector<domain::AttributeMutation> normalizeAttributes(const domain::CurrentPatch& patch);
};

} // namespace scim::application
