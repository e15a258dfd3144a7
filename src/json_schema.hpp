#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace deskbridge {

// Serializes and strictly re-parses `value`. The result is what a strict
// JSON consumer on the other end of a channel would see.
std::optional<nlohmann::json> CanonicalRoundTrip(const nlohmann::json& value, std::string* err);

// A parameter schema is accepted when it survives CanonicalRoundTrip
// unchanged, is an object with "type": "object", and its "properties" /
// "required" members are well formed.
std::optional<nlohmann::json> SanitizeParameterSchema(const nlohmann::json& schema, std::string* err);

// Validates `value` against the JSON-schema subset used by tool manifests:
// type, properties, required, additionalProperties (bool), enum, items,
// minimum / maximum, minLength / maxLength. Each violation is reported as
// "<json pointer>: <message>".
bool ValidateAgainstSchema(const nlohmann::json& schema, const nlohmann::json& value, std::vector<std::string>* errors);

}  // namespace deskbridge
