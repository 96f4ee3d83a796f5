#include <lance/error.hpp>
#include <lance/error_mapping.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using lance::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::not_found) == 6001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
}

TEST_CASE("error codes map to C status", "[errors]") {
  using lance::core::error_code;
  using lance::core::to_c_status;
  REQUIRE(to_c_status(error_code::ok) == LANCE_OK);
  REQUIRE(to_c_status(error_code::not_found) == LANCE_ERROR_NOT_FOUND);
  REQUIRE(to_c_status(error_code::internal) == LANCE_ERROR_INTERNAL);
}
