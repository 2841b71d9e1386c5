//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: Closed JSON value type used for claims, state payloads and provider documents
//==========================================================================================================

#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace credo {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: map<string, shared_ptr<JSONValue>> representing a JSON object (keys serialize sorted).
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isNumber() const { return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value); }
};

// Deep structural equality; int64 and double compare by numeric value.
bool operator==(const JSONValue& lhs, const JSONValue& rhs);
inline bool operator!=(const JSONValue& lhs, const JSONValue& rhs) { return !(lhs == rhs); }

//==========================================================================================================
// serializeJSONValue
// Purpose: Compact JSON text for a value. Object keys are emitted in sorted order.
//==========================================================================================================
std::string serializeJSONValue(const JSONValue& value);

//==========================================================================================================
// parseJSON
// Purpose: Parse a complete JSON document.
// Throws:
//   std::runtime_error when the text is not a single well-formed JSON value.
//==========================================================================================================
JSONValue parseJSON(const std::string& json);

// Returns the JSON kind name: "null", "boolean", "number", "string", "array" or "object".
const char* kindName(const JSONValue& value);

//------------------------------ Lookup helpers (return nullptr / nullopt when absent) ---------------------
const JSONValue* findMember(const JSONValue& object, const std::string& key);
std::optional<std::string> getStringMember(const JSONValue& object, const std::string& key);
std::optional<int64_t> getIntegerMember(const JSONValue& object, const std::string& key);

//------------------------------ Builders ------------------------------------------------------------------
JSONValue makeObject(std::initializer_list<std::pair<std::string, JSONValue>> members);
JSONValue makeArray(std::initializer_list<JSONValue> items);
JSONValue makeStringArray(const std::vector<std::string>& items);

} // namespace credo
