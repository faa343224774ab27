/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <utility>

#include "propsgen/schema.h"

namespace propsgen
{
    type_annotation make_boolean()
    {
        return type_annotation{boolean_type{}};
    }

    type_annotation make_string()
    {
        return type_annotation{string_type{}};
    }

    type_annotation make_int32()
    {
        return type_annotation{int32_type{}};
    }

    type_annotation make_double()
    {
        return type_annotation{double_type{}};
    }

    type_annotation make_float()
    {
        return type_annotation{float_type{}};
    }

    type_annotation make_native_primitive(native_primitive_kind kind)
    {
        return type_annotation{native_primitive_type{kind}};
    }

    type_annotation make_array(type_annotation element_type)
    {
        return type_annotation{array_type{std::make_shared<const type_annotation>(std::move(element_type))}};
    }

    type_annotation make_object(std::vector<prop> properties)
    {
        return type_annotation{object_type{std::make_shared<const std::vector<prop>>(std::move(properties))}};
    }

    type_annotation make_object_without_properties()
    {
        return type_annotation{object_type{nullptr}};
    }

    type_annotation make_string_enum(const std::vector<std::string>& options)
    {
        string_enum_type enum_type;
        for (auto& option : options)
            enum_type.options.push_back(enum_option{option});
        return type_annotation{std::move(enum_type)};
    }

    prop make_prop(std::string name, type_annotation type, propsgen::default_value value)
    {
        return prop{std::move(name), std::move(type), std::move(value)};
    }

    extends_clause make_view_props_extension()
    {
        return extends_clause{built_in_props_type{built_in_props_kind::core_view_props}};
    }
}
