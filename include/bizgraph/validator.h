#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/validator.h - Declarative checks for JSON payloads
// ═══════════════════════════════════════════════════════════════════
//
//  validator::Schema s;
//  s.field("source").required().isString().minLength(1);
//  s.field("transaction_volume").required().isNumber().min(0);
//  s.field("relationship_type").required().oneOf({"vendor", "client", "partner"});
//  auto errors = s.validate(payload);
//
//  A field that is absent (or null) is only an error when required.
//  A field of the wrong JSON kind reports that one error and skips its
//  other checks; otherwise every failing check is reported.
//
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <functional>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace bizgraph::validator {

struct ValidationError {
    std::string field;
    std::string message;
    std::string rule;
};

enum class Kind { Any, String, Number, Integer, Boolean, Array, Object };

inline const char* kindName(Kind kind) {
    switch (kind) {
        case Kind::String:  return "string";
        case Kind::Number:  return "number";
        case Kind::Integer: return "integer";
        case Kind::Boolean: return "boolean";
        case Kind::Array:   return "array";
        case Kind::Object:  return "object";
        case Kind::Any:     break;
    }
    return "any";
}

inline bool hasKind(const nlohmann::json& value, Kind kind) {
    switch (kind) {
        case Kind::String:  return value.is_string();
        case Kind::Number:  return value.is_number();
        case Kind::Integer: return value.is_number_integer();
        case Kind::Boolean: return value.is_boolean();
        case Kind::Array:   return value.is_array();
        case Kind::Object:  return value.is_object();
        case Kind::Any:     break;
    }
    return true;
}

class FieldRule {
public:
    // Returns a message when the value is rejected.
    using CustomCheck = std::function<std::optional<std::string>(const nlohmann::json&)>;

    explicit FieldRule(std::string name) : name_(std::move(name)) {}

    FieldRule& required() { required_ = true; return *this; }
    FieldRule& optional() { required_ = false; return *this; }

    FieldRule& isString()  { kind_ = Kind::String;  return *this; }
    FieldRule& isNumber()  { kind_ = Kind::Number;  return *this; }
    FieldRule& isInt()     { kind_ = Kind::Integer; return *this; }
    FieldRule& isBool()    { kind_ = Kind::Boolean; return *this; }
    FieldRule& isArray()   { kind_ = Kind::Array;   return *this; }
    FieldRule& isObject()  { kind_ = Kind::Object;  return *this; }

    FieldRule& minLength(std::size_t n) {
        return onString("minLength", [n](const std::string& s) { return s.size() >= n; },
                        "must be at least " + std::to_string(n) + " characters");
    }

    FieldRule& maxLength(std::size_t n) {
        return onString("maxLength", [n](const std::string& s) { return s.size() <= n; },
                        "must be at most " + std::to_string(n) + " characters");
    }

    FieldRule& oneOf(std::vector<std::string> allowed) {
        std::string listed;
        for (const auto& a : allowed) listed += (listed.empty() ? "" : ", ") + a;
        return onString("oneOf",
                        [allowed = std::move(allowed)](const std::string& s) {
                            return std::find(allowed.begin(), allowed.end(), s) != allowed.end();
                        },
                        "must be one of " + listed);
    }

    FieldRule& min(double bound) {
        return onNumber("min", [bound](double v) { return v >= bound; }, "must be >= " + number(bound));
    }

    FieldRule& max(double bound) {
        return onNumber("max", [bound](double v) { return v <= bound; }, "must be <= " + number(bound));
    }

    FieldRule& custom(CustomCheck check) {
        checks_.push_back([check = std::move(check)](const nlohmann::json& v) -> std::optional<Failure> {
            if (auto message = check(v)) return Failure{"custom", *message};
            return std::nullopt;
        });
        return *this;
    }

    std::vector<ValidationError> validate(const nlohmann::json& doc) const {
        std::vector<ValidationError> errors;
        auto it = doc.is_object() ? doc.find(name_) : doc.end();
        if (!doc.is_object() || it == doc.end() || it->is_null()) {
            if (required_) errors.push_back({name_, name_ + " is required", "required"});
            return errors;
        }
        if (!hasKind(*it, kind_)) {
            errors.push_back({name_, name_ + " must be " + kindName(kind_), "type"});
            return errors;
        }
        if (it->is_number_float() && !std::isfinite(it->get<double>())) {
            errors.push_back({name_, name_ + " must be finite", "finite"});
        }
        for (const auto& check : checks_) {
            if (auto failure = check(*it)) {
                // custom messages are taken as written
                std::string message = failure->rule == "custom"
                                          ? failure->message
                                          : name_ + " " + failure->message;
                errors.push_back({name_, std::move(message), failure->rule});
            }
        }
        return errors;
    }

    const std::string& fieldName() const { return name_; }

private:
    struct Failure {
        std::string rule;
        std::string message;
    };
    using Check = std::function<std::optional<Failure>(const nlohmann::json&)>;

    template <typename Pred>
    FieldRule& onString(const char* rule, Pred pred, std::string message) {
        checks_.push_back([rule, pred = std::move(pred), message = std::move(message)](
                              const nlohmann::json& v) -> std::optional<Failure> {
            if (v.is_string() && !pred(v.get_ref<const std::string&>())) return Failure{rule, message};
            return std::nullopt;
        });
        return *this;
    }

    template <typename Pred>
    FieldRule& onNumber(const char* rule, Pred pred, std::string message) {
        checks_.push_back([rule, pred = std::move(pred), message = std::move(message)](
                              const nlohmann::json& v) -> std::optional<Failure> {
            if (v.is_number() && !pred(v.get<double>())) return Failure{rule, message};
            return std::nullopt;
        });
        return *this;
    }

    static std::string number(double n) {
        std::ostringstream out;
        out << n;
        return out.str();
    }

    std::string name_;
    bool required_ = false;
    Kind kind_ = Kind::Any;
    std::vector<Check> checks_;
};

class Schema {
public:
    FieldRule& field(const std::string& name) {
        rules_.emplace_back(name);
        return rules_.back();
    }

    std::vector<ValidationError> validate(const nlohmann::json& doc) const {
        if (!doc.is_object()) return {{"", "document must be a JSON object", "type"}};
        std::vector<ValidationError> errors;
        for (const auto& rule : rules_) {
            auto found = rule.validate(doc);
            std::move(found.begin(), found.end(), std::back_inserter(errors));
        }
        return errors;
    }

    bool isValid(const nlohmann::json& doc) const { return validate(doc).empty(); }

    // Throws Error(InvalidArgument) listing every violation.
    void enforce(const nlohmann::json& doc, const std::string& what) const {
        auto errors = validate(doc);
        if (errors.empty()) return;
        std::string message = "Invalid " + what + ":";
        for (const auto& e : errors) message += " " + e.message + ";";
        throw invalidArgument(message);
    }

private:
    std::vector<FieldRule> rules_;
};

inline nlohmann::json toJson(const std::vector<ValidationError>& errors) {
    auto out = nlohmann::json::array();
    for (const auto& e : errors) {
        out.push_back({{"field", e.field}, {"message", e.message}, {"rule", e.rule}});
    }
    return out;
}

} // namespace bizgraph::validator
