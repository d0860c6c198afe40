#include "internal/control/command_error.hpp"

#include "internal/util/errors.hpp"

namespace framecache::control {

const char* ToErrorCode(const std::exception& e) {
  using namespace framecache::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return "not_found";
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return "invalid_argument";
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return "invalid_state";
  }
  if (dynamic_cast<const StoreError*>(&e)) {
    return "store_error";
  }

  return "internal";
}

} // namespace framecache::control
