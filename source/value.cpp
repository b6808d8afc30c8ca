// value.cpp - Dynamic value printing

#include <deep_delta/value.h>

#include <iostream>
#include <string>
#include <type_traits>

namespace deep_delta {

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            std::string result = "{";
            bool first = true;
            for (const auto& [key, box] : arg) {
                if (!first) {
                    result += ", ";
                }
                first = false;
                result += key + ": " + value_to_string(*box);
            }
            return result + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            std::string result = "[";
            for (std::size_t i = 0; i < arg.size(); ++i) {
                if (i > 0) {
                    result += ", ";
                }
                result += value_to_string(*arg[i]);
            }
            return result + "]";
        } else if constexpr (std::is_same_v<T, ObjectRef>) {
            return "<" + std::string(arg.type.name()) + ">";
        } else {
            return "null";
        }
    }, val.data);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');
    if (auto* m = val.get_if<ValueMap>()) {
        for (const auto& [key, box] : *m) {
            std::cout << indent << prefix << key << ":\n";
            print_value(*box, "", depth + 1);
        }
    } else if (auto* v = val.get_if<ValueVector>()) {
        for (std::size_t i = 0; i < v->size(); ++i) {
            std::cout << indent << prefix << "[" << i << "]:\n";
            print_value(*(*v)[i], "", depth + 1);
        }
    } else {
        std::cout << indent << prefix << value_to_string(val) << "\n";
    }
}

} // namespace deep_delta
