#include "json_fields.hpp"

static const nlohmann::json* walk(const nlohmann::json& j, const std::string& path) {
    const nlohmann::json* cur = &j;
    size_t pos = 1;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        const std::string key = path.substr(pos, next - pos);

        if (!cur->is_object()) return nullptr;
        auto it = cur->find(key);
        if (it == cur->end()) return nullptr;
        cur = &*it;
        pos = next + 1;
    }
    return cur;
}

std::string first_text(const nlohmann::json& j, FieldAliases paths) {
    for (const char* p : paths) {
        const nlohmann::json* v = walk(j, p);
        if (!v) continue;
        if (v->is_string() && !v->get<std::string>().empty()) return v->get<std::string>();
        if (v->is_number_unsigned()) return std::to_string(v->get<unsigned long long>());
        if (v->is_number_integer()) return std::to_string(v->get<long long>());
    }
    return "";
}
