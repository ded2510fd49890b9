#pragma once
#include <stdexcept>

namespace sloguard::engine {

// Bad SLO definition, missing override reason, malformed input.
struct ValidationError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Unknown service, target or alert.
struct NotFoundError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Duplicate identity on create.
struct ConflictError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Backing store unavailable or a write failed.
struct StorageError : public std::runtime_error { using std::runtime_error::runtime_error; };

} // namespace sloguard::engine
