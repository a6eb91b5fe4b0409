#pragma once

#include <string>

namespace livetv::util {

// Random v4 UUID in canonical 8-4-4-4-12 lowercase form. Used for session
// tokens and queue ticket ids.
std::string NewToken();

} // namespace livetv::util
