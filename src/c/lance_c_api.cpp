#include "lance/c/lance.h"

#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <new>
#include <optional>
#include <string>
#include <string_view>

#include "lance/core/platform_utils.hpp"
#include "lance/error_mapping.hpp"
#include "lance/index/description_fields.hpp"
#include "lance/index/index_description.hpp"

using lance::index::IndexDescription;

struct lance_index_description_builder_t {
  IndexDescription::Builder builder;
};

struct lance_index_description_t {
  IndexDescription desc;
};

#include "lance_c_error.hpp"

thread_local std::string lance_c::g_last_error;
using lance_c::set_error;
using lance_c::clear_error;

namespace {

lance_status_t fail(const char* fn, lance_status_t status, std::string_view message) {
  set_error(message);
  // Diagnostics to stderr are opt-in via LANCE_C_API_DEBUG.
  if (lance::core::env_flag_enabled("LANCE_C_API_DEBUG")) {
    std::cerr << "[LANCE][c_api] " << fn << ": " << message << std::endl;
  }
  return status;
}

// Caller-buffer protocol shared by all string-returning functions.
lance_status_t copy_out(const char* fn, std::string_view s,
                        char* out_buffer, size_t buffer_size, size_t* out_required_size) {
  const size_t required = s.size() + 1; // include NUL
  if (out_required_size) *out_required_size = required;
  if (!out_buffer || buffer_size == 0) {
    // Size query only
    return LANCE_OK;
  }
  if (buffer_size < required) {
    return fail(fn, LANCE_ERROR_INVALID_PARAM, "buffer too small");
  }
  std::memcpy(out_buffer, s.data(), s.size());
  out_buffer[s.size()] = '\0';
  return LANCE_OK;
}

lance_status_t get_string_field(const char* fn,
                                const std::optional<std::string>& value,
                                char* out_buffer, size_t buffer_size,
                                size_t* out_required_size, int* out_present) {
  *out_present = value ? 1 : 0;
  if (!value) {
    if (out_required_size) *out_required_size = 0;
    return LANCE_OK;
  }
  return copy_out(fn, *value, out_buffer, buffer_size, out_required_size);
}

lance_status_t get_count_field(std::optional<std::int64_t> value, int64_t* out_value, int* out_present) {
  *out_present = value ? 1 : 0;
  if (value) *out_value = *value;
  return LANCE_OK;
}

} // namespace

extern "C" {

LANCE_C_API const char* lance_get_last_error(void) {
  return lance_c::g_last_error.empty() ? "" : lance_c::g_last_error.c_str();
}

LANCE_C_API const char* lance_version(void) {
  return "0.1.0";
}

LANCE_C_API const char* lance_index_description_field_name(int field) {
  for (const auto f : lance::index::ALL_DESCRIPTION_FIELDS) {
    // Names are string literals, so data() is NUL-terminated.
    if (static_cast<int>(f) == field) return lance::index::field_name(f).data();
  }
  return nullptr;
}

// Builder

lance_status_t lance_index_description_builder_create(lance_index_description_builder_t** out_builder) {
  if (!out_builder) return fail(__func__, LANCE_ERROR_INVALID_PARAM, "out_builder is null");
  clear_error();
  try {
    auto h = std::make_unique<lance_index_description_builder_t>();
    *out_builder = h.release();
    return LANCE_OK;
  } catch (const std::bad_alloc&) {
    return fail(__func__, LANCE_ERROR_INTERNAL, "allocation failure");
  }
}

lance_status_t lance_index_description_builder_destroy(lance_index_description_builder_t* builder) {
  if (!builder) return fail(__func__, LANCE_ERROR_INVALID_PARAM, "builder is null");
  clear_error();
  delete builder;
  return LANCE_OK;
}

lance_status_t lance_index_description_builder_set_distance_type(
  lance_index_description_builder_t* builder, const char* value) {
  if (!builder) return fail(__func__, LANCE_ERROR_INVALID_PARAM, "builder is null");
  clear_error();
  try {
    builder->builder.distance_type(value ? std::optional<std::string>(value) : std::nullopt);
    return LANCE_OK;
  } catch (const std::exception& e) {
    return fail(__func__, LANCE_ERROR_INTERNAL, e.what());
  }
}

lance_status_t lance_index_description_builder_set_index_type(
  lance_index_description_builder_t* builder, const char* value) {
  if (!builder) return fail(__func__, LANCE_ERROR_INVALID_PARAM, "builder is null");
  clear_error();
  try {
    builder->builder.index_type(value ? std::optional<std::string>(value) : std::nullopt);
    return LANCE_OK;
  } catch (const std::exception& e) {
    return fail(__func__, LANCE_ERROR_INTERNAL, e.what());
  }
}

lance_status_t lance_index_description_builder_set_num_indexed_rows(
  lance_index_description_builder_t* builder, const int64_t* value) {
  if (!builder) return fail(__func__, LANCE_ERROR_INVALID_PARAM, "builder is null");
  clear_error();
  builder->builder.num_indexed_rows(value ? std::optional<std::int64_t>(*value) : std::nullopt);
  return LANCE_OK;
}

lance_status_t lance_index_description_builder_set_num_unindexed_rows(
  lance_index_description_builder_t* builder, const int64_t* value) {
  if (!builder) return fail(__func__, LANCE_ERROR_INVALID_PARAM, "builder is null");
  clear_error();
  builder->builder.num_unindexed_rows(value ? std::optional<std::int64_t>(*value) : std::nullopt);
  return LANCE_OK;
}

lance_status_t lance_index_description_build(
  const lance_index_description_builder_t* builder,
  lance_index_description_t** out_desc) {
  if (!builder || !out_desc) return fail(__func__, LANCE_ERROR_INVALID_PARAM, "builder or out_desc is null");
  clear_error();
  try {
    auto h = std::make_unique<lance_index_description_t>(lance_index_description_t{builder->builder.build()});
    *out_desc = h.release();
    return LANCE_OK;
  } catch (const std::bad_alloc&) {
    return fail(__func__, LANCE_ERROR_INTERNAL, "allocation failure");
  } catch (const std::exception& e) {
    return fail(__func__, LANCE_ERROR_INTERNAL, e.what());
  }
}

// Description

lance_status_t lance_index_description_destroy(lance_index_description_t* desc) {
  if (!desc) return fail(__func__, LANCE_ERROR_INVALID_PARAM, "desc is null");
  clear_error();
  delete desc;
  return LANCE_OK;
}

lance_status_t lance_index_description_get_distance_type(
  const lance_index_description_t* desc,
  char* out_buffer,
  size_t buffer_size,
  size_t* out_required_size,
  int* out_present) {
  if (!desc || !out_present) return fail(__func__, LANCE_ERROR_INVALID_PARAM, "desc or out_present is null");
  clear_error();
  return get_string_field(__func__, desc->desc.distance_type(),
                          out_buffer, buffer_size, out_required_size, out_present);
}

lance_status_t lance_index_description_get_index_type(
  const lance_index_description_t* desc,
  char* out_buffer,
  size_t buffer_size,
  size_t* out_required_size,
  int* out_present) {
  if (!desc || !out_present) return fail(__func__, LANCE_ERROR_INVALID_PARAM, "desc or out_present is null");
  clear_error();
  return get_string_field(__func__, desc->desc.index_type(),
                          out_buffer, buffer_size, out_required_size, out_present);
}

lance_status_t lance_index_description_get_num_indexed_rows(
  const lance_index_description_t* desc, int64_t* out_value, int* out_present) {
  if (!desc || !out_value || !out_present) {
    return fail(__func__, LANCE_ERROR_INVALID_PARAM, "desc, out_value or out_present is null");
  }
  clear_error();
  return get_count_field(desc->desc.num_indexed_rows(), out_value, out_present);
}

lance_status_t lance_index_description_get_num_unindexed_rows(
  const lance_index_description_t* desc, int64_t* out_value, int* out_present) {
  if (!desc || !out_value || !out_present) {
    return fail(__func__, LANCE_ERROR_INVALID_PARAM, "desc, out_value or out_present is null");
  }
  clear_error();
  return get_count_field(desc->desc.num_unindexed_rows(), out_value, out_present);
}

lance_status_t lance_index_description_has_field(
  const lance_index_description_t* desc, const char* field_name, int* out_present) {
  if (!desc || !field_name || !out_present) {
    return fail(__func__, LANCE_ERROR_INVALID_PARAM, "desc, field_name or out_present is null");
  }
  clear_error();
  try {
    auto field = lance::index::parse_field_name(field_name);
    if (!field) {
      return fail(__func__, lance::core::to_c_status(field.error().code), field.error().message);
    }
    *out_present = desc->desc.has(*field) ? 1 : 0;
    return LANCE_OK;
  } catch (const std::exception& e) {
    return fail(__func__, LANCE_ERROR_INTERNAL, e.what());
  }
}

lance_status_t lance_index_description_equals(
  const lance_index_description_t* a,
  const lance_index_description_t* b,
  int* out_equal) {
  if (!a || !b || !out_equal) return fail(__func__, LANCE_ERROR_INVALID_PARAM, "a, b or out_equal is null");
  clear_error();
  *out_equal = a->desc.equals(b->desc) ? 1 : 0;
  return LANCE_OK;
}

lance_status_t lance_index_description_hash(const lance_index_description_t* desc, uint64_t* out_hash) {
  if (!desc || !out_hash) return fail(__func__, LANCE_ERROR_INVALID_PARAM, "desc or out_hash is null");
  clear_error();
  *out_hash = static_cast<uint64_t>(desc->desc.hash());
  return LANCE_OK;
}

lance_status_t lance_index_description_to_string(
  const lance_index_description_t* desc,
  char* out_buffer,
  size_t buffer_size,
  size_t* out_required_size) {
  if (!desc) return fail(__func__, LANCE_ERROR_INVALID_PARAM, "desc is null");
  clear_error();
  try {
    const std::string s = desc->desc.to_string();
    return copy_out(__func__, s, out_buffer, buffer_size, out_required_size);
  } catch (const std::exception& e) {
    return fail(__func__, LANCE_ERROR_INTERNAL, e.what());
  }
}

} // extern "C"
