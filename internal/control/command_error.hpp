#pragma once

#include <exception>

namespace framecache::control {

/*
  Converts internal exceptions into command reply error codes.
*/
const char* ToErrorCode(const std::exception& e);

} // namespace framecache::control
