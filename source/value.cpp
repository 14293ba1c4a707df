// value.cpp - Value type utilities

#include <faunadb/value.h>
#include <faunadb/codec.h>

#include <string>
#include <type_traits>

namespace faunadb {

std::string_view type_name(ValueType type) noexcept
{
    switch (type) {
        case ValueType::String:  return "String";
        case ValueType::Long:    return "Long";
        case ValueType::Double:  return "Double";
        case ValueType::Boolean: return "Boolean";
        case ValueType::Date:    return "Date";
        case ValueType::Time:    return "Time";
        case ValueType::Ref:     return "Ref";
        case ValueType::SetRef:  return "SetRef";
        case ValueType::Object:  return "Object";
        case ValueType::Array:   return "Array";
        case ValueType::Null:    return "Null";
    }
    return "Unknown";
}

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(arg) + "L";
        } else if constexpr (std::is_same_v<T, double>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, Date>) {
            auto text = format_date(arg);
            return "@date(" + (text ? *text : std::string{"invalid"}) + ")";
        } else if constexpr (std::is_same_v<T, Time>) {
            return "@ts(" + format_time(arg) + ")";
        } else if constexpr (std::is_same_v<T, Ref>) {
            return "@ref(" + arg.id + ")";
        } else if constexpr (std::is_same_v<T, SetRef>) {
            return "@set{" + std::to_string(arg.parameters.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{object:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[array:" + std::to_string(arg.size()) + "]";
        } else {
            return "null";
        }
    }, val.data);
}

} // namespace faunadb
