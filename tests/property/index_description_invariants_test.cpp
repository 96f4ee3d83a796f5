#include <catch2/catch_all.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "lance/index/index_description.hpp"

using lance::index::IndexDescription;

namespace {

struct Fields {
  std::optional<std::string> distance_type;
  std::optional<std::string> index_type;
  std::optional<std::int64_t> num_indexed_rows;
  std::optional<std::int64_t> num_unindexed_rows;
};

IndexDescription build(const Fields& f) {
  return IndexDescription::builder()
      .distance_type(f.distance_type)
      .index_type(f.index_type)
      .num_indexed_rows(f.num_indexed_rows)
      .num_unindexed_rows(f.num_unindexed_rows)
      .build();
}

// One descriptor per presence mask (bit i set => field i present).
std::vector<Fields> all_presence_combinations(std::mt19937& rng) {
  static const std::array<const char*, 3> metrics{"l2", "cosine", "dot"};
  static const std::array<const char*, 4> types{"IVF_PQ", "BTREE", "BITMAP", "HNSW"};
  std::uniform_int_distribution<std::int64_t> rows(0, 1'000'000);
  std::vector<Fields> out;
  for (unsigned mask = 0; mask < 16; ++mask) {
    Fields f;
    if (mask & 1u) f.distance_type = metrics[rng() % metrics.size()];
    if (mask & 2u) f.index_type = types[rng() % types.size()];
    if (mask & 4u) f.num_indexed_rows = rows(rng);
    if (mask & 8u) f.num_unindexed_rows = rows(rng);
    out.push_back(f);
  }
  return out;
}

} // namespace

TEST_CASE("getters return exactly what was set", "[property]") {
  std::seed_seq seed{17, 23, 43}; std::mt19937 rng(seed);
  for (int t = 0; t < 20; ++t) {
    for (const auto& f : all_presence_combinations(rng)) {
      const auto d = build(f);
      REQUIRE(d.distance_type() == f.distance_type);
      REQUIRE(d.index_type() == f.index_type);
      REQUIRE(d.num_indexed_rows() == f.num_indexed_rows);
      REQUIRE(d.num_unindexed_rows() == f.num_unindexed_rows);
    }
  }
}

TEST_CASE("equality is an equivalence consistent with hash", "[property]") {
  std::seed_seq seed{5, 7, 11}; std::mt19937 rng(seed);
  for (int t = 0; t < 20; ++t) {
    const auto combos = all_presence_combinations(rng);
    for (const auto& f : combos) {
      const auto a = build(f);
      const auto b = build(f);
      const auto c = build(f);
      REQUIRE(a == a);
      REQUIRE(a == b);
      REQUIRE(b == a);
      REQUIRE((a == b && b == c && a == c));
      REQUIRE(a.hash() == b.hash());
      REQUIRE(a.hash() == a.hash());
    }
    // Different presence masks never compare equal.
    for (std::size_t i = 0; i < combos.size(); ++i) {
      for (std::size_t j = 0; j < combos.size(); ++j) {
        if (i == j) continue;
        REQUIRE(build(combos[i]) != build(combos[j]));
      }
    }
  }
}

TEST_CASE("equal hashes do not imply equality", "[property]") {
  // Pairs that differ in exactly one field must compare unequal regardless of hash.
  std::seed_seq seed{3, 1, 4}; std::mt19937 rng(seed);
  std::uniform_int_distribution<std::int64_t> rows(0, 100);
  for (int t = 0; t < 200; ++t) {
    const auto n = rows(rng);
    auto base = IndexDescription::builder().index_type("IVF_PQ").num_indexed_rows(n);
    const auto a = base.num_unindexed_rows(n).build();
    const auto b = base.num_unindexed_rows(n + 1).build();
    REQUIRE_FALSE(a.equals(b));
  }
}
