/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <type_traits>

#include <fmt/format.h>

#include "propsgen/cpp_helpers.h"
#include "propsgen/errors.h"
#include "propsgen/type_mapper.h"

namespace propsgen
{
    namespace
    {
        std::vector<std::string> append(std::vector<std::string> parts, const std::string& name)
        {
            parts.push_back(name);
            return parts;
        }
    }

    std::string get_native_type(
        const std::string& component_name, const prop& property, const std::vector<std::string>& path_segments)
    {
        return std::visit(
            [&](auto&& type) -> std::string
            {
                using T = std::decay_t<decltype(type)>;
                if constexpr (std::is_same_v<T, boolean_type> || std::is_same_v<T, string_type>
                              || std::is_same_v<T, int32_type> || std::is_same_v<T, double_type>
                              || std::is_same_v<T, float_type>)
                    return get_cpp_type_for_scalar(property.type);
                else if constexpr (std::is_same_v<T, native_primitive_type>)
                    return get_native_primitive_type(type.kind);
                else if constexpr (std::is_same_v<T, array_type>)
                {
                    auto& element_type = *type.element_type;
                    if (element_type.template is<array_type>())
                        throw unsupported_nesting(fmt::format(
                            "prop {} of {} is an array of arrays which is not supported", property.name, component_name));
                    if (element_type.template is<object_type>())
                        return fmt::format("std::vector<{}>",
                            generate_struct_name(component_name, append(path_segments, property.name)));
                    if (element_type.template is<string_enum_type>())
                        return get_enum_mask_name(get_enum_name(component_name, property.name));

                    prop element{component_name, element_type, {}};
                    return fmt::format("std::vector<{}>",
                        get_native_type(component_name, element, append(path_segments, property.name)));
                }
                else if constexpr (std::is_same_v<T, object_type>)
                    return generate_struct_name(component_name, append(path_segments, property.name));
                else if constexpr (std::is_same_v<T, string_enum_type>)
                    return get_enum_name(component_name, property.name);
                else
                    static_assert(always_false<T>::value, "unhandled type annotation");
            },
            property.type.value);
    }
}
