//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 message types spoken to language servers
//==========================================================================================================

#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lsp {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

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
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
};

//==========================================================================================================
// ParseJSON / SerializeJSON
// Purpose: Convert between JSON text and JSONValue.
// Notes:
//   ParseJSON consumes the whole input and throws std::runtime_error on malformed text or trailing data.
//   SerializeJSON emits compact JSON; non-finite doubles are written as null.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);
std::string SerializeJSON(const JSONValue& value);

// Structural equality (object key order is irrelevant, int64 and double compare numerically).
bool JSONEquals(const JSONValue& a, const JSONValue& b);

//==========================================================================================================
// Object and array helpers
// Purpose: Terse construction and lookup over the shared_ptr based object model.
//==========================================================================================================
JSONValue MakeObject(std::initializer_list<std::pair<const std::string, JSONValue>> members);
JSONValue MakeArray(std::vector<JSONValue> items);

// Returns the member value or nullptr when `object` is not an object or the key is absent.
const JSONValue* FindMember(const JSONValue& object, const std::string& key);
std::optional<std::string> GetStringMember(const JSONValue& object, const std::string& key);
std::optional<int64_t> GetIntMember(const JSONValue& object, const std::string& key);

// Inserts or replaces a member; converts `object` into an empty object first when needed.
void SetMember(JSONValue& object, const std::string& key, JSONValue member);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

JSONValue IdToJSON(const JSONRPCId& id);

// Accepts an integer id or a string holding a decimal integer (servers echo either form).
std::optional<int64_t> ParseNumericId(const JSONValue& raw);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   Serialize(): Returns canonical JSON string for the message.
//   Deserialize(json): Parses JSON string into this object; returns true on success.
//   ToJSON(): Returns the message as a JSONValue object.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual JSONValue ToJSON() const = 0;
    virtual bool FromJSON(const JSONValue& json) = 0;

    std::string Serialize() const;
    bool Deserialize(const std::string& json);
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request message with id, method, and optional params.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    JSONValue ToJSON() const override;
    bool FromJSON(const JSONValue& json) override;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    JSONValue ToJSON() const override;
    bool FromJSON(const JSONValue& json) override;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCNotification
// Purpose: JSON-RPC 2.0 notification (no id, no response).
//==========================================================================================================
class JSONRPCNotification : public JSONRPCMessage {
public:
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCNotification() = default;
    JSONRPCNotification(std::string method, std::optional<JSONValue> params = std::nullopt)
        : method(std::move(method)), params(std::move(params)) {}

    JSONValue ToJSON() const override;
    bool FromJSON(const JSONValue& json) override;
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus the reserved LSP codes.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    // LSP reserved codes
    constexpr int ServerNotInitialized = -32002;
    constexpr int UnknownErrorCode = -32001;
    constexpr int RequestFailed = -32803;
    constexpr int ServerCancelled = -32802;
    constexpr int ContentModified = -32801;
    constexpr int RequestCancelled = -32800;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Convenience to wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace lsp
