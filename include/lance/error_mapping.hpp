#pragma once

#include "lance/error.hpp"
#include "lance/c/lance.h"

namespace lance::core {

constexpr lance_status_t to_c_status(error_code ec) {
  switch (ec) {
    case error_code::ok: return LANCE_OK;
    case error_code::not_found: return LANCE_ERROR_NOT_FOUND;
    case error_code::internal: return LANCE_ERROR_INTERNAL;
  }
  return LANCE_ERROR_UNKNOWN;
}

} // namespace lance::core
