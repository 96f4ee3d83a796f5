#include "lance/index/index_description.hpp"

#include <ostream>
#include <sstream>
#include <utility>

namespace lance::index {

namespace {

// Contribution of an absent field to the combined hash.
constexpr std::size_t ABSENT_HASH = 0;

template <typename T>
inline auto hash_field(const std::optional<T>& v) noexcept -> std::size_t {
    return v ? std::hash<T>{}(*v) : ABSENT_HASH;
}

template <typename T>
inline void write_field(std::ostream& os, std::string_view name, const std::optional<T>& v) {
    os << name << '=';
    if (v) os << *v; else os << "null";
}

} // namespace

IndexDescription::IndexDescription(std::optional<std::string> distance_type,
                                   std::optional<std::string> index_type,
                                   std::optional<std::int64_t> num_indexed_rows,
                                   std::optional<std::int64_t> num_unindexed_rows)
    : distance_type_(std::move(distance_type)),
      index_type_(std::move(index_type)),
      num_indexed_rows_(num_indexed_rows),
      num_unindexed_rows_(num_unindexed_rows) {}

auto IndexDescription::builder() -> Builder {
    return Builder{};
}

auto IndexDescription::has(DescriptionField field) const noexcept -> bool {
    switch (field) {
        case DescriptionField::DistanceType: return distance_type_.has_value();
        case DescriptionField::IndexType: return index_type_.has_value();
        case DescriptionField::NumIndexedRows: return num_indexed_rows_.has_value();
        case DescriptionField::NumUnindexedRows: return num_unindexed_rows_.has_value();
    }
    return false;
}

auto IndexDescription::equals(const IndexDescription& other) const noexcept -> bool {
    if (this == &other) return true;
    // std::optional comparison: nullopt == nullopt, nullopt != value.
    return distance_type_ == other.distance_type_
        && index_type_ == other.index_type_
        && num_indexed_rows_ == other.num_indexed_rows_
        && num_unindexed_rows_ == other.num_unindexed_rows_;
}

auto IndexDescription::hash() const noexcept -> std::size_t {
    std::size_t h = 1;
    h = 31 * h + hash_field(distance_type_);
    h = 31 * h + hash_field(index_type_);
    h = 31 * h + hash_field(num_indexed_rows_);
    h = 31 * h + hash_field(num_unindexed_rows_);
    return h;
}

auto IndexDescription::to_string() const -> std::string {
    std::ostringstream oss;
    oss << *this;
    return oss.str();
}

auto operator<<(std::ostream& os, const IndexDescription& desc) -> std::ostream& {
    os << "IndexDescription{";
    write_field(os, DISTANCE_TYPE_FIELD, desc.distance_type());
    os << ", ";
    write_field(os, INDEX_TYPE_FIELD, desc.index_type());
    os << ", ";
    write_field(os, NUM_INDEXED_ROWS_FIELD, desc.num_indexed_rows());
    os << ", ";
    write_field(os, NUM_UNINDEXED_ROWS_FIELD, desc.num_unindexed_rows());
    os << '}';
    return os;
}

// Builder

auto IndexDescription::Builder::distance_type(std::optional<std::string> value) -> Builder& {
    distance_type_ = std::move(value);
    return *this;
}

auto IndexDescription::Builder::index_type(std::optional<std::string> value) -> Builder& {
    index_type_ = std::move(value);
    return *this;
}

auto IndexDescription::Builder::num_indexed_rows(std::optional<std::int64_t> value) -> Builder& {
    num_indexed_rows_ = value;
    return *this;
}

auto IndexDescription::Builder::num_unindexed_rows(std::optional<std::int64_t> value) -> Builder& {
    num_unindexed_rows_ = value;
    return *this;
}

auto IndexDescription::Builder::build() const -> IndexDescription {
    return IndexDescription(distance_type_, index_type_, num_indexed_rows_, num_unindexed_rows_);
}

} // namespace lance::index
