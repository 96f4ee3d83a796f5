#pragma once

#ifdef __cplusplus
extern "C" {
#endif

// Symbol visibility
#if defined(_WIN32)
  #if defined(LANCE_C_API_EXPORTS)
    #define LANCE_C_API __declspec(dllexport)
  #else
    #define LANCE_C_API __declspec(dllimport)
  #endif
#else
  #define LANCE_C_API __attribute__((visibility("default")))
#endif

#include <stddef.h>
#include <stdint.h>

// Versioning and stability
// - LANCE_C_ABI_VERSION increments on incompatible changes.
#define LANCE_C_ABI_VERSION 1

// Opaque handles
// - Ownership: handles returned through out-parameters belong to the caller;
//   release them with the matching destroy() function.
typedef struct lance_index_description_builder_t lance_index_description_builder_t;
typedef struct lance_index_description_t lance_index_description_t;

typedef enum lance_status_e {
  LANCE_OK = 0,
  LANCE_ERROR_UNKNOWN = 1,
  LANCE_ERROR_INVALID_PARAM = 2,
  LANCE_ERROR_NOT_FOUND = 3,
  LANCE_ERROR_INTERNAL = 4
} lance_status_t;

// Field identifiers, in declaration order.
typedef enum lance_description_field_e {
  LANCE_FIELD_DISTANCE_TYPE = 0,
  LANCE_FIELD_INDEX_TYPE = 1,
  LANCE_FIELD_NUM_INDEXED_ROWS = 2,
  LANCE_FIELD_NUM_UNINDEXED_ROWS = 3
} lance_description_field_t;

// Thread-local last error string
LANCE_C_API const char* lance_get_last_error(void);

// Version info (semantic version string, e.g. "0.1.0")
LANCE_C_API const char* lance_version(void);

// External field name ("distance_type", ...) or NULL for an unknown field.
// The returned string is static.
LANCE_C_API const char* lance_index_description_field_name(int field);

// -------------------------
// Builder
// -------------------------

LANCE_C_API lance_status_t lance_index_description_builder_create(
  lance_index_description_builder_t** out_builder);
LANCE_C_API lance_status_t lance_index_description_builder_destroy(
  lance_index_description_builder_t* builder);

// String setters copy the value; NULL resets the field to absent.
LANCE_C_API lance_status_t lance_index_description_builder_set_distance_type(
  lance_index_description_builder_t* builder, const char* value);
LANCE_C_API lance_status_t lance_index_description_builder_set_index_type(
  lance_index_description_builder_t* builder, const char* value);

// Count setters read *value; NULL resets the field to absent.
LANCE_C_API lance_status_t lance_index_description_builder_set_num_indexed_rows(
  lance_index_description_builder_t* builder, const int64_t* value);
LANCE_C_API lance_status_t lance_index_description_builder_set_num_unindexed_rows(
  lance_index_description_builder_t* builder, const int64_t* value);

// Snapshot the builder's current fields. The builder stays usable.
LANCE_C_API lance_status_t lance_index_description_build(
  const lance_index_description_builder_t* builder,
  lance_index_description_t** out_desc);

// -------------------------
// Description
// -------------------------

LANCE_C_API lance_status_t lance_index_description_destroy(lance_index_description_t* desc);

// String getters follow the caller-buffer protocol:
// - out_present (required) receives 1 if the field holds a value, else 0.
// - out_required_size (optional) receives strlen(value) + 1, or 0 when absent.
// - out_buffer == NULL or buffer_size == 0 is a size query.
// - buffer_size smaller than the required size returns LANCE_ERROR_INVALID_PARAM.
LANCE_C_API lance_status_t lance_index_description_get_distance_type(
  const lance_index_description_t* desc,
  char* out_buffer,
  size_t buffer_size,
  size_t* out_required_size,
  int* out_present);
LANCE_C_API lance_status_t lance_index_description_get_index_type(
  const lance_index_description_t* desc,
  char* out_buffer,
  size_t buffer_size,
  size_t* out_required_size,
  int* out_present);

// Count getters: *out_value is written only when *out_present == 1.
LANCE_C_API lance_status_t lance_index_description_get_num_indexed_rows(
  const lance_index_description_t* desc, int64_t* out_value, int* out_present);
LANCE_C_API lance_status_t lance_index_description_get_num_unindexed_rows(
  const lance_index_description_t* desc, int64_t* out_value, int* out_present);

// Presence of a field addressed by its external name.
// Unknown names return LANCE_ERROR_NOT_FOUND.
LANCE_C_API lance_status_t lance_index_description_has_field(
  const lance_index_description_t* desc, const char* field_name, int* out_present);

LANCE_C_API lance_status_t lance_index_description_equals(
  const lance_index_description_t* a,
  const lance_index_description_t* b,
  int* out_equal);
LANCE_C_API lance_status_t lance_index_description_hash(
  const lance_index_description_t* desc, uint64_t* out_hash);

// Diagnostic rendering, same buffer protocol as the string getters.
LANCE_C_API lance_status_t lance_index_description_to_string(
  const lance_index_description_t* desc,
  char* out_buffer,
  size_t buffer_size,
  size_t* out_required_size);

#ifdef __cplusplus
}
#endif
