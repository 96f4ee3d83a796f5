#include "lance/index/description_fields.hpp"

#include <string>

namespace lance::index {

auto parse_field_name(std::string_view name) -> std::expected<DescriptionField, core::error> {
    for (const auto field : ALL_DESCRIPTION_FIELDS) {
        if (field_name(field) == name) return field;
    }
    return std::unexpected(core::error{
        core::error_code::not_found,
        "unknown index description field: '" + std::string(name) + "'",
        "index.description"});
}

} // namespace lance::index
