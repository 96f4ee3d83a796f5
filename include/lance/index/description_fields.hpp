#pragma once

/** \file description_fields.hpp
 *  \brief Stable external identifiers of the index description fields.
 *
 * Serialization adapters (JSON, Arrow schema metadata, protobuf) address the
 * four descriptor fields by these names. The names are part of the on-disk and
 * wire contract and must never change.
 */

#include <array>
#include <cstdint>
#include <expected>
#include <string_view>

#include "lance/error.hpp"

namespace lance::index {

inline constexpr std::string_view DISTANCE_TYPE_FIELD = "distance_type";
inline constexpr std::string_view INDEX_TYPE_FIELD = "index_type";
inline constexpr std::string_view NUM_INDEXED_ROWS_FIELD = "num_indexed_rows";
inline constexpr std::string_view NUM_UNINDEXED_ROWS_FIELD = "num_unindexed_rows";

/** \brief Addressable fields of an IndexDescription, in declaration order. */
enum class DescriptionField : std::uint8_t {
    DistanceType = 0,    /**< metric identifier, vector indices only */
    IndexType = 1,       /**< index algorithm identifier */
    NumIndexedRows = 2,  /**< rows covered by the index */
    NumUnindexedRows = 3 /**< rows not yet covered */
};

inline constexpr std::array<DescriptionField, 4> ALL_DESCRIPTION_FIELDS{
    DescriptionField::DistanceType,
    DescriptionField::IndexType,
    DescriptionField::NumIndexedRows,
    DescriptionField::NumUnindexedRows,
};

/** \brief External name of a field. */
constexpr auto field_name(DescriptionField field) noexcept -> std::string_view {
    switch (field) {
        case DescriptionField::DistanceType: return DISTANCE_TYPE_FIELD;
        case DescriptionField::IndexType: return INDEX_TYPE_FIELD;
        case DescriptionField::NumIndexedRows: return NUM_INDEXED_ROWS_FIELD;
        case DescriptionField::NumUnindexedRows: return NUM_UNINDEXED_ROWS_FIELD;
    }
    return {};
}

/** \brief Resolve an external name to its field.
 *
 * \param name Exact, case-sensitive external name
 * \return Field, or error_code::not_found for any other string
 */
auto parse_field_name(std::string_view name) -> std::expected<DescriptionField, core::error>;

} // namespace lance::index
