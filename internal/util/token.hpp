#pragma once

#include <string>

namespace checkout::util {

// Random RFC4122 v4 string, e.g. "3f1c...-4...". Used as the owner token
// of a lock lease; only the holder can release it.
std::string GenerateToken();

} // namespace checkout::util
