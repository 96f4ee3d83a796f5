#pragma once

/** \file index_description.hpp
 *  \brief Immutable metadata descriptor of one index defined over a dataset.
 *
 * Reports the index algorithm, the distance metric (vector indices only) and
 * coverage statistics. Values are produced by the indexing subsystem and are
 * carried verbatim: no field is validated or cross-checked.
 *
 * Every field is independently optional. An absent field means the value is
 * unknown or not applicable; it is distinct from 0 and from "".
 *
 * Thread-safety: IndexDescription is immutable and may be shared freely.
 * Builder is single-owner and needs external synchronization if shared.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

#include "lance/index/description_fields.hpp"

namespace lance::index {

/** \brief Description of an index: type, metric and coverage statistics.
 *
 * Example usage:
 * ```cpp
 * auto desc = IndexDescription::builder()
 *                 .index_type("IVF_PQ")
 *                 .distance_type("cosine")
 *                 .num_indexed_rows(1000)
 *                 .num_unindexed_rows(0)
 *                 .build();
 *
 * if (desc.num_unindexed_rows().value_or(0) > 0) {
 *     // index needs an optimize pass
 * }
 * ```
 */
class IndexDescription {
public:
    class Builder;

    /** \brief Start a builder with every field absent. */
    static auto builder() -> Builder;

    /** \brief Distance metric (e.g. "l2", "cosine", "dot"); absent if not applicable. */
    auto distance_type() const noexcept -> const std::optional<std::string>& { return distance_type_; }

    /** \brief Index algorithm (e.g. "IVF_PQ", "BTREE", "BITMAP", "HNSW"). */
    auto index_type() const noexcept -> const std::optional<std::string>& { return index_type_; }

    /** \brief Rows covered by this index; absent if unavailable. */
    auto num_indexed_rows() const noexcept -> std::optional<std::int64_t> { return num_indexed_rows_; }

    /** \brief Rows in the dataset not covered by this index; absent if unavailable. */
    auto num_unindexed_rows() const noexcept -> std::optional<std::int64_t> { return num_unindexed_rows_; }

    /** \brief Whether the given field holds a value. */
    auto has(DescriptionField field) const noexcept -> bool;

    /** \brief Field-wise comparison; absent equals absent, never a value. */
    auto equals(const IndexDescription& other) const noexcept -> bool;

    /** \brief Hash over the four fields in declaration order.
     *
     * Equal descriptions always hash equally. An absent field contributes 0.
     */
    auto hash() const noexcept -> std::size_t;

    /** \brief Diagnostic rendering, absent fields shown as "null". Not parseable. */
    auto to_string() const -> std::string;

    friend bool operator==(const IndexDescription& a, const IndexDescription& b) noexcept {
        return a.equals(b);
    }
    friend bool operator!=(const IndexDescription& a, const IndexDescription& b) noexcept {
        return !a.equals(b);
    }

private:
    IndexDescription(std::optional<std::string> distance_type,
                     std::optional<std::string> index_type,
                     std::optional<std::int64_t> num_indexed_rows,
                     std::optional<std::int64_t> num_unindexed_rows);

    std::optional<std::string> distance_type_;
    std::optional<std::string> index_type_;
    std::optional<std::int64_t> num_indexed_rows_;
    std::optional<std::int64_t> num_unindexed_rows_;
};

/** \brief Accumulates fields and produces IndexDescription snapshots.
 *
 * Setters overwrite earlier values; passing std::nullopt resets a field to
 * absent. build() does not consume the builder.
 */
class IndexDescription::Builder {
public:
    Builder() = default;

    auto distance_type(std::optional<std::string> value) -> Builder&;
    auto index_type(std::optional<std::string> value) -> Builder&;
    auto num_indexed_rows(std::optional<std::int64_t> value) -> Builder&;
    auto num_unindexed_rows(std::optional<std::int64_t> value) -> Builder&;

    /** \brief Copy the current fields into a new, independent description. */
    auto build() const -> IndexDescription;

private:
    std::optional<std::string> distance_type_;
    std::optional<std::string> index_type_;
    std::optional<std::int64_t> num_indexed_rows_;
    std::optional<std::int64_t> num_unindexed_rows_;
};

auto operator<<(std::ostream& os, const IndexDescription& desc) -> std::ostream&;

} // namespace lance::index

namespace std {

template <>
struct hash<lance::index::IndexDescription> {
    auto operator()(const lance::index::IndexDescription& desc) const noexcept -> std::size_t {
        return desc.hash();
    }
};

} // namespace std
