#pragma once

#include <reflect>

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace Biomorph {

/**
 * Reflection-driven JSON mapping for plain aggregate config structs.
 *
 * Member names become JSON keys. Enums are written by name. On read, keys
 * missing from the document leave the member at its default value, so config
 * files only need to list what they change.
 *
 *   struct Arena { double width = 1600.0; double height = 1000.0; };
 *   auto j = ReflectSerializer::to_json(Arena{});
 *   auto a = ReflectSerializer::from_json<Arena>(j);
 */
namespace ReflectSerializer {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};
template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename E>
E enumFromName(const std::string& name)
{
    for (const auto& [value, enumName] : reflect::enumerators<E>) {
        if (enumName == name) {
            return static_cast<E>(value);
        }
    }
    throw std::runtime_error("Invalid enum value: " + name);
}

template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();

    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            const auto& value = reflect::get<I>(obj);
            using MemberType = std::remove_cvref_t<decltype(value)>;

            if constexpr (is_optional_v<MemberType>) {
                if (value.has_value()) {
                    j[name] = *value;
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                j[name] = std::string(reflect::enum_name(value));
            }
            else {
                j[name] = value;
            }
        },
        obj);

    return j;
}

template <typename T>
T from_json(const nlohmann::json& j)
{
    T obj{};
    if (!j.is_object()) {
        throw std::runtime_error("Expected a JSON object");
    }

    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            if (!j.contains(name) || j[name].is_null()) {
                return;
            }

            auto& member = reflect::get<I>(obj);
            using MemberType = std::remove_cvref_t<decltype(member)>;

            if constexpr (is_optional_v<MemberType>) {
                member = j[name].get<typename MemberType::value_type>();
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                member = enumFromName<MemberType>(j[name].get<std::string>());
            }
            else {
                member = j[name].get<MemberType>();
            }
        },
        obj);

    return obj;
}

} // namespace ReflectSerializer

} // namespace Biomorph
