#pragma once

#include <sre_gateway/core/result.hpp>

#include <nlohmann/json.hpp>

namespace sre_gateway {

// Checks `arguments` against a tool's JSON Schema subset:
//   - arguments must be an object
//   - every name in "required" must be present and non-null
//   - present properties must match the declared "type" (string, integer,
//     number, boolean, array with "items" type, object)
//   - absent properties with a "default" receive it
//   - properties the schema does not declare are passed through untouched
// Returns the normalized arguments, or a Validation error naming the field.
Result<nlohmann::json, Error> ValidateArguments(const nlohmann::json& schema,
                                                const nlohmann::json& arguments);

} // namespace sre_gateway
