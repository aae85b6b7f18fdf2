#include <sre_gateway/mcp/schema_validator.hpp>

#include <cmath>

namespace sre_gateway {

namespace {

constexpr const char* kOperation = "ValidateArguments";

bool MatchesType(const nlohmann::json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "number") return value.is_number();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "integer") {
        if (value.is_number_integer()) {
            return true;
        }
        if (value.is_number_float()) {
            double d = value.get<double>();
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    return true;  // unknown type keyword: no constraint
}

Result<void, Error> CheckProperty(const std::string& field,
                                  const nlohmann::json& property,
                                  const nlohmann::json& value) {
    if (!property.is_object() || !property.contains("type") ||
        !property["type"].is_string()) {
        return Result<void, Error>::Ok();
    }
    const auto type = property["type"].get<std::string>();
    if (!MatchesType(value, type)) {
        return Result<void, Error>::Err(Error::Validation(
            kOperation, field, "field '" + field + "' must be of type " + type));
    }
    if (type == "array" && property.contains("items") && property["items"].is_object() &&
        property["items"].contains("type") && property["items"]["type"].is_string()) {
        const auto item_type = property["items"]["type"].get<std::string>();
        for (size_t i = 0; i < value.size(); ++i) {
            if (!MatchesType(value[i], item_type)) {
                return Result<void, Error>::Err(Error::Validation(
                    kOperation, field,
                    "field '" + field + "' item " + std::to_string(i) +
                        " must be of type " + item_type));
            }
        }
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

Result<nlohmann::json, Error> ValidateArguments(const nlohmann::json& schema,
                                                const nlohmann::json& arguments) {
    using R = Result<nlohmann::json, Error>;

    nlohmann::json normalized = arguments.is_null() ? nlohmann::json::object() : arguments;
    if (!normalized.is_object()) {
        return R::Err(Error::Validation(kOperation, "arguments",
                                        "arguments must be a JSON object"));
    }

    const auto properties = schema.value("properties", nlohmann::json::object());

    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto& req : schema["required"]) {
            const auto field = req.get<std::string>();
            if (!normalized.contains(field) || normalized[field].is_null()) {
                return R::Err(Error::Validation(kOperation, field,
                                                "missing required field '" + field + "'"));
            }
        }
    }

    for (const auto& [field, property] : properties.items()) {
        auto it = normalized.find(field);
        if (it == normalized.end() || it->is_null()) {
            if (property.is_object() && property.contains("default")) {
                normalized[field] = property["default"];
            } else if (it != normalized.end()) {
                normalized.erase(field);  // explicit null on an optional field
            }
            continue;
        }
        auto check = CheckProperty(field, property, *it);
        if (check.IsErr()) {
            return R::Err(check.Error());
        }
    }

    return R::Ok(std::move(normalized));
}

} // namespace sre_gateway
