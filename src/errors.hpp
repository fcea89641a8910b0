#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// ConfigurationError — missing column, parameter out of range, inconsistent
// budget. Raised before any selection is computed.
// ---------------------------------------------------------------------------
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

// ---------------------------------------------------------------------------
// DataIntegrityError — the input table itself is unusable (duplicate ids,
// empty set, NaN outcomes, ragged columns).
// ---------------------------------------------------------------------------
class DataIntegrityError : public std::runtime_error {
public:
    explicit DataIntegrityError(const std::string& what)
        : std::runtime_error(what) {}
};
