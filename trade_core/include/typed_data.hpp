#pragma once
#include "crypto_utils.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

// EIP-712 structured data hashing

struct TypedField {
    std::string name;
    std::string type;
};

// struct name -> ordered member list
using TypedSchema = std::map<std::string, std::vector<TypedField>>;

struct Eip712Domain {
    std::optional<std::string> name;
    std::optional<std::string> version;
    std::optional<long long> chain_id;
    std::optional<std::string> verifying_contract;

    // EIP712Domain member list restricted to the fields that are set
    std::vector<TypedField> fields() const;
    nlohmann::json to_json() const;
};

// "Mail(Person from,Person to,string contents)Person(string name,address wallet)"
std::string encode_type(const TypedSchema& schema, const std::string& primary);

Bytes32 type_hash(const TypedSchema& schema, const std::string& primary);

// Throws SignatureError on a missing member, unsupported type or malformed value
Bytes32 hash_struct(const TypedSchema& schema, const std::string& primary, const nlohmann::json& value);

Bytes32 domain_separator(const Eip712Domain& domain);

// keccak256(0x19 0x01 ‖ domainSeparator ‖ hashStruct(message))
Bytes32 typed_data_digest(const Bytes32& domain_sep, const Bytes32& struct_hash);

Bytes32 typed_data_digest(const Eip712Domain& domain, const TypedSchema& schema,
                          const std::string& primary, const nlohmann::json& message);
