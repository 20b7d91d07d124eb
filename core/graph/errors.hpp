#pragma once

#include <stdexcept>
#include <string>

namespace weave {

// ─── Error taxonomy ────────────────────────────────────────────
// Plain lookups on unknown ids return nullptr / nullopt / false.
// These are thrown only where an id is required, a policy is broken,
// or storage cannot be trusted.

class WeaveError : public std::runtime_error {
public:
    explicit WeaveError(const std::string& message)
        : std::runtime_error(message) {}
};

class NodeNotFoundError : public WeaveError {
public:
    explicit NodeNotFoundError(const std::string& node_id)
        : WeaveError("Node not found: " + node_id) {}
};

/// Raised when an operation is well-formed but not allowed,
/// e.g. suppressing a node that is not of type ERROR.
class PolicyViolationError : public WeaveError {
public:
    explicit PolicyViolationError(const std::string& message)
        : WeaveError(message) {}
};

/// A persisted snapshot could not be decoded. No partial graph is built.
class SnapshotFormatError : public WeaveError {
public:
    explicit SnapshotFormatError(const std::string& message)
        : WeaveError("Malformed snapshot: " + message) {}
};

class StorageError : public WeaveError {
public:
    explicit StorageError(const std::string& message)
        : WeaveError(message) {}
};

/// Any provider call made after close().
class ProviderClosedError : public StorageError {
public:
    explicit ProviderClosedError(const std::string& provider_name)
        : StorageError("[" + provider_name +
                       "] provider has been closed and is no longer usable") {}
};

class UnknownProviderError : public WeaveError {
public:
    explicit UnknownProviderError(const std::string& name)
        : WeaveError("Unknown provider type \"" + name +
                     "\". Set WEAVE_PROVIDER=json|memory|sqlite") {}
};

} // namespace weave
