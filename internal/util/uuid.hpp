#pragma once

#include <string>

namespace batch::util {

// Random RFC 4122 version-4 UUID in canonical 8-4-4-4-12 lowercase form.
// Used for job ids, group ids and the process instance id.
std::string NewId();

} // namespace batch::util
