#include "typed_data.hpp"
#include "trade_errors.hpp"

#include <cstring>
#include <set>

std::vector<TypedField> Eip712Domain::fields() const {
    std::vector<TypedField> f;
    if (name)               f.push_back({"name", "string"});
    if (version)            f.push_back({"version", "string"});
    if (chain_id)           f.push_back({"chainId", "uint256"});
    if (verifying_contract) f.push_back({"verifyingContract", "address"});
    return f;
}

nlohmann::json Eip712Domain::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    if (name)               j["name"] = *name;
    if (version)            j["version"] = *version;
    if (chain_id)           j["chainId"] = *chain_id;
    if (verifying_contract) j["verifyingContract"] = *verifying_contract;
    return j;
}

static std::string base_type(const std::string& type) {
    auto pos = type.find('[');
    return pos == std::string::npos ? type : type.substr(0, pos);
}

static void collect_dependencies(const TypedSchema& schema, const std::string& type,
                                 std::set<std::string>& found) {
    const std::string t = base_type(type);
    if (found.count(t) || !schema.count(t)) return;
    found.insert(t);
    for (const auto& f : schema.at(t)) collect_dependencies(schema, f.type, found);
}

static std::string encode_single_type(const std::string& name, const std::vector<TypedField>& fields) {
    std::string out = name + "(";
    for (size_t i = 0; i < fields.size(); i++) {
        if (i) out += ",";
        out += fields[i].type + " " + fields[i].name;
    }
    return out + ")";
}

std::string encode_type(const TypedSchema& schema, const std::string& primary) {
    auto it = schema.find(primary);
    if (it == schema.end()) throw SignatureError("unknown struct type: " + primary);

    std::set<std::string> deps;
    collect_dependencies(schema, primary, deps);
    deps.erase(primary);

    // primary first, then referenced structs in name order (std::set is sorted)
    std::string out = encode_single_type(primary, it->second);
    for (const auto& d : deps) out += encode_single_type(d, schema.at(d));
    return out;
}

Bytes32 type_hash(const TypedSchema& schema, const std::string& primary) {
    return keccak256(encode_type(schema, primary));
}

static std::string integer_text(const nlohmann::json& v, const std::string& field) {
    if (v.is_number_unsigned()) return std::to_string(v.get<std::uint64_t>());
    if (v.is_number_integer()) {
        long long x = v.get<long long>();
        if (x < 0) throw SignatureError("negative integer for field " + field);
        return std::to_string(x);
    }
    if (v.is_string()) return v.get<std::string>();
    throw SignatureError("expected integer for field " + field);
}

static Bytes32 encode_value(const TypedSchema& schema, const std::string& type,
                            const nlohmann::json& v, const std::string& field) {
    if (schema.count(type)) return hash_struct(schema, type, v);

    // no order or Safe message uses array members
    if (!type.empty() && type.back() == ']')
        throw SignatureError("array type '" + type + "' not supported for field " + field);

    if (type == "address") {
        if (!v.is_string()) throw SignatureError("expected address string for field " + field);
        return address_word(v.get<std::string>());
    }
    if (type == "bool") {
        if (!v.is_boolean()) throw SignatureError("expected bool for field " + field);
        return uint256_word(v.get<bool>() ? 1u : 0u);
    }
    if (type == "string") {
        if (!v.is_string()) throw SignatureError("expected string for field " + field);
        return keccak256(v.get<std::string>());
    }
    if (type == "bytes") {
        if (!v.is_string()) throw SignatureError("expected hex bytes for field " + field);
        return keccak256(from_hex(v.get<std::string>()));
    }
    if (type.rfind("uint", 0) == 0 || type.rfind("int", 0) == 0) {
        return uint256_word(integer_text(v, field));
    }
    if (type.rfind("bytes", 0) == 0) {
        if (!v.is_string()) throw SignatureError("expected hex bytes for field " + field);
        Bytes raw = from_hex(v.get<std::string>());
        if (raw.size() > 32) throw SignatureError("fixed bytes longer than 32 for field " + field);
        Bytes32 out{};
        if (!raw.empty()) std::memcpy(out.data(), raw.data(), raw.size());
        return out;
    }
    throw SignatureError("unsupported EIP-712 type '" + type + "' for field " + field);
}

Bytes32 hash_struct(const TypedSchema& schema, const std::string& primary, const nlohmann::json& value) {
    auto it = schema.find(primary);
    if (it == schema.end()) throw SignatureError("unknown struct type: " + primary);
    if (!value.is_object()) throw SignatureError("expected object for struct " + primary);

    Bytes enc;
    enc.reserve(32 * (it->second.size() + 1));

    const Bytes32 th = type_hash(schema, primary);
    enc.insert(enc.end(), th.begin(), th.end());

    for (const auto& f : it->second) {
        auto v = value.find(f.name);
        if (v == value.end()) throw SignatureError("missing field " + primary + "." + f.name);
        const Bytes32 w = encode_value(schema, f.type, *v, primary + "." + f.name);
        enc.insert(enc.end(), w.begin(), w.end());
    }
    return keccak256(enc);
}

Bytes32 domain_separator(const Eip712Domain& domain) {
    TypedSchema schema{{"EIP712Domain", domain.fields()}};
    return hash_struct(schema, "EIP712Domain", domain.to_json());
}

Bytes32 typed_data_digest(const Bytes32& domain_sep, const Bytes32& struct_hash) {
    Bytes buf;
    buf.reserve(66);
    buf.push_back(0x19);
    buf.push_back(0x01);
    buf.insert(buf.end(), domain_sep.begin(), domain_sep.end());
    buf.insert(buf.end(), struct_hash.begin(), struct_hash.end());
    return keccak256(buf);
}

Bytes32 typed_data_digest(const Eip712Domain& domain, const TypedSchema& schema,
                          const std::string& primary, const nlohmann::json& message) {
    return typed_data_digest(domain_separator(domain), hash_struct(schema, primary, message));
}
