/*

json_read.hpp
-------------

Lenient member readers for decoded answers: an absent or null member gives the type's
empty value, a wrongly typed one throws nlohmann::json::type_error.

*/

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace photoxx::detail
{

inline std::string read_string(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return {};
    return it->get<std::string>();
}

/// As read_string, but numbers are accepted and kept in their JSON spelling.
inline std::string read_text(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it != j.end() && it->is_number())
        return it->dump();
    return read_string(j, key);
}

inline double read_number(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return 0.0;
    return it->get<double>();
}

inline std::int64_t read_integer(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return 0;
    return it->get<std::int64_t>();
}

template<typename T>
inline void read_object(const nlohmann::json& j, const char* key, std::optional<T>& out)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return;
    out = it->get<T>();
}

} // namespace photoxx::detail
