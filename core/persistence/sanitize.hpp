#pragma once

#include <string>

namespace weave {

/// Replace every character outside [A-Za-z0-9_-] with '_'.
/// For deriving file or table names from chat ids; lossy, so the logical
/// id must be kept alongside.
std::string sanitizeIdentifier(const std::string& id);

/// Reversible key → filename stem. [A-Za-z0-9_-] pass through, any other
/// byte becomes "~hh~" (lowercase hex). The result never contains a path
/// separator or a dot.
std::string encodeKey(const std::string& key);

/// Inverse of encodeKey(). Returns false on a malformed stem.
bool decodeKey(const std::string& encoded, std::string& out);

} // namespace weave
