/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <type_traits>

#include <fmt/format.h>

#include "propsgen/cpp_helpers.h"
#include "propsgen/errors.h"

namespace propsgen
{
    namespace
    {
        bool is_identifier_char(char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        std::string upper_case_first(std::string input)
        {
            if (!input.empty())
                input[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(input[0])));
            return input;
        }

        std::string format_floating(double value)
        {
            if (!std::isfinite(value))
                throw invalid_schema(fmt::format("default value {} is not a finite number", value));
            if (std::floor(value) == value)
                return fmt::format("{:.1f}", value);
            return fmt::format("{}", value);
        }

        void check_int32_range(const prop& property, double value)
        {
            if (value < static_cast<double>(std::numeric_limits<std::int32_t>::min())
                || value > static_cast<double>(std::numeric_limits<std::int32_t>::max()))
                throw invalid_schema(
                    fmt::format("default value {} of prop {} does not fit in an int", value, property.name));
        }

        std::string convert_number_default(const prop& property, bool integral)
        {
            return std::visit(
                [&](auto&& val) -> std::string
                {
                    using T = std::decay_t<decltype(val)>;
                    if constexpr (std::is_same_v<T, std::monostate>)
                        return "";
                    else if constexpr (std::is_same_v<T, std::int64_t>)
                    {
                        if (!integral)
                            return format_floating(static_cast<double>(val));
                        check_int32_range(property, static_cast<double>(val));
                        return std::to_string(val);
                    }
                    else if constexpr (std::is_same_v<T, double>)
                    {
                        if (!integral)
                            return format_floating(val);
                        if (!std::isfinite(val) || std::floor(val) != val)
                            throw invalid_schema(
                                fmt::format("default value {} of prop {} is not an integer", val, property.name));
                        check_int32_range(property, val);
                        return std::to_string(static_cast<std::int64_t>(val));
                    }
                    else
                        throw invalid_schema(fmt::format("default value of prop {} is not a number", property.name));
                },
                property.default_value);
        }

        const std::string* get_string_default(const prop& property)
        {
            return std::get_if<std::string>(&property.default_value);
        }

        void check_enum_default(const prop& property, const string_enum_type& enum_type, const std::string& value)
        {
            auto it = std::find_if(enum_type.options.begin(),
                enum_type.options.end(),
                [&](const enum_option& option) { return option.name == value; });
            if (it == enum_type.options.end())
                throw invalid_schema(
                    fmt::format("default value \"{}\" of prop {} is not one of its options", value, property.name));
        }
    }

    std::string to_safe_cpp_string(const std::string& input)
    {
        std::string result;
        std::string word;
        for (char c : input)
        {
            if (is_identifier_char(c))
            {
                word += c;
            }
            else
            {
                result += upper_case_first(word);
                word.clear();
            }
        }
        result += upper_case_first(word);

        if (!result.empty() && std::isdigit(static_cast<unsigned char>(result[0])))
            result = "_" + result;
        return result;
    }

    std::string escape_string_literal(const std::string& input)
    {
        std::string escaped;
        escaped.reserve(input.length());
        for (char c : input)
        {
            switch (c)
            {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                escaped += c;
            }
        }
        return escaped;
    }

    std::string get_enum_name(const std::string& component_name, const std::string& prop_name)
    {
        return component_name + to_safe_cpp_string(prop_name);
    }

    std::string get_enum_mask_name(const std::string& enum_name)
    {
        return enum_name + "Mask";
    }

    std::string generate_struct_name(const std::string& component_name, const std::vector<std::string>& parts)
    {
        std::string name = component_name;
        for (auto& part : parts)
            name += to_safe_cpp_string(part);
        return name + "Struct";
    }

    std::string get_cpp_type_for_scalar(const type_annotation& type)
    {
        return std::visit(
            [&](auto&& val) -> std::string
            {
                using T = std::decay_t<decltype(val)>;
                if constexpr (std::is_same_v<T, boolean_type>)
                    return "bool";
                else if constexpr (std::is_same_v<T, string_type>)
                    return "std::string";
                else if constexpr (std::is_same_v<T, int32_type>)
                    return "int";
                else if constexpr (std::is_same_v<T, double_type>)
                    return "double";
                else if constexpr (std::is_same_v<T, float_type>)
                    return "Float";
                else
                    throw invalid_schema("type annotation is not a scalar primitive");
            },
            type.value);
    }

    std::string get_native_primitive_type(native_primitive_kind kind)
    {
        switch (kind)
        {
        case native_primitive_kind::color:
            return "SharedColor";
        case native_primitive_kind::image_source:
            return "ImageSource";
        case native_primitive_kind::point:
            return "Point";
        }
        throw invalid_schema(fmt::format("unknown native primitive kind {}", static_cast<int>(kind)));
    }

    std::string convert_default_to_string(const std::string& component_name, const prop& property)
    {
        return std::visit(
            [&](auto&& type) -> std::string
            {
                using T = std::decay_t<decltype(type)>;
                if constexpr (std::is_same_v<T, boolean_type>)
                {
                    if (std::holds_alternative<std::monostate>(property.default_value))
                        return "";
                    auto* val = std::get_if<bool>(&property.default_value);
                    if (!val)
                        throw invalid_schema(fmt::format("default value of prop {} is not a boolean", property.name));
                    return *val ? "true" : "false";
                }
                else if constexpr (std::is_same_v<T, string_type>)
                {
                    if (std::holds_alternative<std::monostate>(property.default_value))
                        return "";
                    auto* val = get_string_default(property);
                    if (!val)
                        throw invalid_schema(fmt::format("default value of prop {} is not a string", property.name));
                    return fmt::format("\"{}\"", escape_string_literal(*val));
                }
                else if constexpr (std::is_same_v<T, int32_type>)
                    return convert_number_default(property, true);
                else if constexpr (std::is_same_v<T, double_type> || std::is_same_v<T, float_type>)
                    return convert_number_default(property, false);
                else if constexpr (std::is_same_v<T, native_primitive_type>)
                    return "";
                else if constexpr (std::is_same_v<T, array_type>)
                {
                    if (!type.element_type->template is<string_enum_type>())
                        return "";
                    auto* val = get_string_default(property);
                    if (!val)
                        throw invalid_schema(fmt::format(
                            "a default is required for the string enum array prop {} of {}", property.name, component_name));
                    check_enum_default(property, type.element_type->template as<string_enum_type>(), *val);
                    auto enum_name = get_enum_name(component_name, property.name);
                    return fmt::format(
                        "static_cast<{}>({}::{})", get_enum_mask_name(enum_name), enum_name, to_safe_cpp_string(*val));
                }
                else if constexpr (std::is_same_v<T, object_type>)
                    return "";
                else if constexpr (std::is_same_v<T, string_enum_type>)
                {
                    auto* val = get_string_default(property);
                    if (!val)
                        throw invalid_schema(fmt::format(
                            "a default is required for the string enum prop {} of {}", property.name, component_name));
                    check_enum_default(property, type, *val);
                    return fmt::format("{}::{}", get_enum_name(component_name, property.name), to_safe_cpp_string(*val));
                }
                else
                    static_assert(always_false<T>::value, "unhandled type annotation");
            },
            property.type.value);
    }

    base_capability get_base_capability(const extends_clause& clause)
    {
        return std::visit(
            [](auto&& val) -> base_capability
            {
                using T = std::decay_t<decltype(val)>;
                if constexpr (std::is_same_v<T, built_in_props_type>)
                {
                    switch (val.kind)
                    {
                    case built_in_props_kind::core_view_props:
                        return {"public ViewProps", "react/components/view/ViewProps.h"};
                    }
                    throw invalid_schema(fmt::format("unknown built in props kind {}", static_cast<int>(val.kind)));
                }
                else
                    static_assert(always_false<T>::value, "unhandled extends clause");
            },
            clause.value);
    }
}
