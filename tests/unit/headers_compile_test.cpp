#include <lance/index/index_description.hpp>
#include <lance/index/description_fields.hpp>
#include <lance/error.hpp>
#include <lance/error_mapping.hpp>
#include <lance/core/platform_utils.hpp>
#include <lance/c/lance.h>
#include <catch2/catch_all.hpp>

TEST_CASE("headers compile and basic types exist", "[headers]") {
  auto d = lance::index::IndexDescription::builder().build();
  REQUIRE_FALSE(d.index_type().has_value());
  REQUIRE(LANCE_C_ABI_VERSION == 1);
  REQUIRE(lance::core::to_c_status(lance::core::error_code::ok) == LANCE_OK);
  REQUIRE_FALSE(lance::core::safe_getenv(nullptr).has_value());
}
