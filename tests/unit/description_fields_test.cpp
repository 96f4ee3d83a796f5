#include <catch2/catch_test_macros.hpp>

#include "lance/index/description_fields.hpp"

using namespace lance::index;

TEST_CASE("external field names are stable", "[fields]") {
  REQUIRE(field_name(DescriptionField::DistanceType) == "distance_type");
  REQUIRE(field_name(DescriptionField::IndexType) == "index_type");
  REQUIRE(field_name(DescriptionField::NumIndexedRows) == "num_indexed_rows");
  REQUIRE(field_name(DescriptionField::NumUnindexedRows) == "num_unindexed_rows");
  static_assert(field_name(DescriptionField::IndexType) == INDEX_TYPE_FIELD);
}

TEST_CASE("parse_field_name resolves every known field", "[fields]") {
  for (const auto f : ALL_DESCRIPTION_FIELDS) {
    auto parsed = parse_field_name(field_name(f));
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == f);
  }
}

TEST_CASE("parse_field_name rejects unknown names", "[fields]") {
  for (const char* name : {"", "distanceType", "INDEX_TYPE", "num_indexed_rows ", "num_rows"}) {
    auto parsed = parse_field_name(name);
    REQUIRE_FALSE(parsed.has_value());
    REQUIRE(parsed.error().code == lance::core::error_code::not_found);
    REQUIRE(parsed.error().component == "index.description");
    REQUIRE_FALSE(parsed.error().message.empty());
  }
}
