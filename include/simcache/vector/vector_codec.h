#pragma once

#include <simcache/core/types.h>

#include <nlohmann/json.hpp>

#include <string>
#include <variant>
#include <vector>

namespace simcache::vector {

/**
 * Encodings a stored vector may arrive in from the persistence layer:
 * a typed float or double array, a JSON-encoded string, or an already-parsed JSON value
 * holding a heterogeneous numeric list.
 */
using StoredVectorPayload =
    std::variant<std::vector<float>, std::vector<double>, std::string, nlohmann::json>;

// Decodes one payload. Failures are per-record InvalidData errors, never exceptions.
Result<Vector> decodeVector(const StoredVectorPayload& payload);

// Canonical stored form: JSON array of doubles
nlohmann::json encodeVector(const Vector& vector);

// Short description of the payload shape, for diagnostics
std::string describePayload(const StoredVectorPayload& payload);

} // namespace simcache::vector
