#include "json_schema.hpp"

#include <cmath>
#include <string>

namespace deskbridge {
namespace {

static bool TypeMatches(const std::string& type, const nlohmann::json& v) {
  if (type == "object") return v.is_object();
  if (type == "array") return v.is_array();
  if (type == "string") return v.is_string();
  if (type == "boolean") return v.is_boolean();
  if (type == "null") return v.is_null();
  if (type == "number") return v.is_number();
  if (type == "integer") {
    if (v.is_number_integer()) return true;
    if (v.is_number_float()) {
      // Whole values in the int64 range only. 2^63 itself is out of range.
      const double d = v.get<double>();
      if (!std::isfinite(d) || std::trunc(d) != d) return false;
      return d >= -9223372036854775808.0 && d < 9223372036854775808.0;
    }
    return false;
  }
  // Unknown type keywords do not constrain.
  return true;
}

static std::string TypeNameOf(const nlohmann::json& v) {
  if (v.is_number_integer()) return "integer";
  if (v.is_number()) return "number";
  return v.type_name();
}

static std::string EscapePointer(const std::string& key) {
  std::string out;
  for (char c : key) {
    if (c == '~') {
      out += "~0";
    } else if (c == '/') {
      out += "~1";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

static void Validate(const nlohmann::json& schema,
                     const nlohmann::json& v,
                     const std::string& ptr,
                     std::vector<std::string>* errors) {
  if (!schema.is_object()) return;
  const std::string where = ptr.empty() ? "/" : ptr;

  if (schema.contains("type")) {
    const auto& t = schema["type"];
    bool ok = true;
    std::string expected;
    if (t.is_string()) {
      expected = t.get<std::string>();
      ok = TypeMatches(expected, v);
    } else if (t.is_array()) {
      ok = false;
      for (const auto& alt : t) {
        if (!alt.is_string()) continue;
        if (!expected.empty()) expected += "|";
        expected += alt.get<std::string>();
        if (TypeMatches(alt.get<std::string>(), v)) ok = true;
      }
    }
    if (!ok) {
      errors->push_back(where + ": expected " + expected + ", got " + TypeNameOf(v));
      return;
    }
  }

  if (schema.contains("enum") && schema["enum"].is_array()) {
    bool found = false;
    for (const auto& e : schema["enum"]) {
      if (e == v) {
        found = true;
        break;
      }
    }
    if (!found) errors->push_back(where + ": value " + v.dump() + " is not one of " + schema["enum"].dump());
  }

  if (v.is_string()) {
    const auto len = v.get_ref<const std::string&>().size();
    if (schema.contains("minLength") && schema["minLength"].is_number_integer() &&
        static_cast<long long>(len) < schema["minLength"].get<long long>()) {
      errors->push_back(where + ": string shorter than " + schema["minLength"].dump());
    }
    if (schema.contains("maxLength") && schema["maxLength"].is_number_integer() &&
        static_cast<long long>(len) > schema["maxLength"].get<long long>()) {
      errors->push_back(where + ": string longer than " + schema["maxLength"].dump());
    }
  }

  if (v.is_number()) {
    const double d = v.get<double>();
    if (schema.contains("minimum") && schema["minimum"].is_number() && d < schema["minimum"].get<double>()) {
      errors->push_back(where + ": below minimum " + schema["minimum"].dump());
    }
    if (schema.contains("maximum") && schema["maximum"].is_number() && d > schema["maximum"].get<double>()) {
      errors->push_back(where + ": above maximum " + schema["maximum"].dump());
    }
  }

  if (v.is_object()) {
    const nlohmann::json empty = nlohmann::json::object();
    const auto& props = (schema.contains("properties") && schema["properties"].is_object()) ? schema["properties"] : empty;
    if (schema.contains("required") && schema["required"].is_array()) {
      for (const auto& r : schema["required"]) {
        if (r.is_string() && !v.contains(r.get<std::string>())) {
          errors->push_back(where + ": missing required property \"" + r.get<std::string>() + "\"");
        }
      }
    }
    const bool closed = schema.contains("additionalProperties") && schema["additionalProperties"].is_boolean() &&
                        !schema["additionalProperties"].get<bool>();
    for (auto it = v.begin(); it != v.end(); ++it) {
      const std::string child = ptr + "/" + EscapePointer(it.key());
      if (props.contains(it.key())) {
        Validate(props[it.key()], it.value(), child, errors);
      } else if (closed) {
        errors->push_back(child + ": unexpected property");
      } else if (schema.contains("additionalProperties") && schema["additionalProperties"].is_object()) {
        Validate(schema["additionalProperties"], it.value(), child, errors);
      }
    }
  }

  if (v.is_array() && schema.contains("items") && schema["items"].is_object()) {
    for (size_t i = 0; i < v.size(); i++) {
      Validate(schema["items"], v[i], ptr + "/" + std::to_string(i), errors);
    }
  }
}

}  // namespace

std::optional<nlohmann::json> CanonicalRoundTrip(const nlohmann::json& value, std::string* err) {
  std::string text;
  try {
    text = value.dump();
  } catch (const nlohmann::json::exception& e) {
    // Invalid UTF-8 in a string value.
    if (err) *err = std::string("serialize: ") + e.what();
    return std::nullopt;
  }
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    if (err) *err = "serialized form does not re-parse";
    return std::nullopt;
  }
  return parsed;
}

std::optional<nlohmann::json> SanitizeParameterSchema(const nlohmann::json& schema, std::string* err) {
  nlohmann::json candidate = schema;
  if (candidate.is_null()) {
    candidate = {{"type", "object"}, {"properties", nlohmann::json::object()}, {"required", nlohmann::json::array()}};
  }
  auto canonical = CanonicalRoundTrip(candidate, err);
  if (!canonical) return std::nullopt;
  if (*canonical != candidate) {
    // NaN / infinities serialize as null and do not survive.
    if (err) *err = "schema changes under canonical round trip";
    return std::nullopt;
  }
  if (!canonical->is_object()) {
    if (err) *err = "schema must be a JSON object";
    return std::nullopt;
  }
  if (!canonical->contains("type") || (*canonical)["type"] != "object") {
    if (err) *err = "schema must declare \"type\": \"object\"";
    return std::nullopt;
  }
  if (canonical->contains("properties") && !(*canonical)["properties"].is_object()) {
    if (err) *err = "\"properties\" must be an object";
    return std::nullopt;
  }
  if (canonical->contains("required")) {
    const auto& req = (*canonical)["required"];
    if (!req.is_array()) {
      if (err) *err = "\"required\" must be an array";
      return std::nullopt;
    }
    for (const auto& r : req) {
      if (!r.is_string()) {
        if (err) *err = "\"required\" entries must be strings";
        return std::nullopt;
      }
    }
  }
  return canonical;
}

bool ValidateAgainstSchema(const nlohmann::json& schema, const nlohmann::json& value, std::vector<std::string>* errors) {
  std::vector<std::string> local;
  auto* out = errors ? errors : &local;
  const size_t before = out->size();
  Validate(schema, value, "", out);
  return out->size() == before;
}

}  // namespace deskbridge
