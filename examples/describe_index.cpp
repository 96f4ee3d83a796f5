/**
 * Index description example
 *
 * This example demonstrates:
 * - Building descriptions for a vector index and a scalar index
 * - Reading optional fields
 * - Addressing fields by their external names
 * - Deduplicating descriptions
 */

#include <lance/index/index_description.hpp>
#include <iostream>
#include <unordered_set>
#include <vector>

int main() {
    using namespace lance::index;

    auto builder = IndexDescription::builder()
                       .index_type("IVF_PQ")
                       .distance_type("cosine")
                       .num_indexed_rows(1'000'000);

    // Statistics not yet computed: num_unindexed_rows stays absent.
    const auto pending = builder.build();
    const auto vector_index = builder.num_unindexed_rows(2048).build();

    const auto scalar_index = IndexDescription::builder()
                                  .index_type("BTREE")
                                  .num_indexed_rows(1'002'048)
                                  .num_unindexed_rows(0)
                                  .build();

    for (const auto& d : {pending, vector_index, scalar_index}) {
        std::cout << d << "\n";
        for (const auto field : ALL_DESCRIPTION_FIELDS) {
            std::cout << "  " << field_name(field) << (d.has(field) ? ": present" : ": absent") << "\n";
        }
        const auto indexed = d.num_indexed_rows();
        const auto unindexed = d.num_unindexed_rows();
        if (indexed && unindexed) {
            const auto total = *indexed + *unindexed;
            std::cout << "  coverage: " << (total > 0 ? 100.0 * static_cast<double>(*indexed) / static_cast<double>(total) : 0.0)
                      << "%\n";
        }
    }

    auto field = parse_field_name("num_rows");
    if (!field) {
        std::cout << "lookup failed: " << field.error().message << "\n";
    }

    std::unordered_set<IndexDescription> unique{pending, vector_index, scalar_index, builder.build()};
    std::cout << "unique descriptions: " << unique.size() << "\n";
    return 0;
}
