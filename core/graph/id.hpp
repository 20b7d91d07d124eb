#pragma once

#include <string>

namespace weave {

/// Random RFC 4122 version-4 UUID, e.g. "3f2b8c1e-7a4d-4e2b-9c1a-0b5e6d7f8a9c".
std::string generateId();

} // namespace weave
