/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace propsgen
{
    struct prop;
    struct type_annotation;

    struct boolean_type
    {
    };

    struct string_type
    {
    };

    struct int32_type
    {
    };

    struct double_type
    {
    };

    struct float_type
    {
    };

    enum class native_primitive_kind
    {
        color,
        image_source,
        point
    };

    struct native_primitive_type
    {
        native_primitive_kind kind;
    };

    struct array_type
    {
        std::shared_ptr<const type_annotation> element_type;
    };

    // a null property list is a schema error reported when the object is synthesized
    struct object_type
    {
        std::shared_ptr<const std::vector<prop>> properties;
    };

    struct enum_option
    {
        std::string name;
    };

    struct string_enum_type
    {
        std::vector<enum_option> options;
    };

    struct type_annotation
    {
        std::variant<boolean_type,
            string_type,
            int32_type,
            double_type,
            float_type,
            native_primitive_type,
            array_type,
            object_type,
            string_enum_type>
            value;

        template<typename T> bool is() const { return std::holds_alternative<T>(value); }
        template<typename T> const T& as() const { return std::get<T>(value); }
    };

    using default_value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

    struct prop
    {
        std::string name;
        type_annotation type;
        propsgen::default_value default_value;
    };

    enum class built_in_props_kind
    {
        core_view_props
    };

    struct built_in_props_type
    {
        built_in_props_kind kind;
    };

    struct extends_clause
    {
        std::variant<built_in_props_type> value;
    };

    struct component
    {
        std::string name;
        std::vector<prop> props;
        std::vector<extends_clause> extends_props;
    };

    struct schema_module
    {
        std::string name;
        bool has_components = false;
        std::vector<component> components;
    };

    struct schema
    {
        std::vector<schema_module> modules;
    };

    // builders used by the loader and the tests
    type_annotation make_boolean();
    type_annotation make_string();
    type_annotation make_int32();
    type_annotation make_double();
    type_annotation make_float();
    type_annotation make_native_primitive(native_primitive_kind kind);
    type_annotation make_array(type_annotation element_type);
    type_annotation make_object(std::vector<prop> properties);
    type_annotation make_object_without_properties();
    type_annotation make_string_enum(const std::vector<std::string>& options);

    prop make_prop(std::string name, type_annotation type, propsgen::default_value value = {});

    extends_clause make_view_props_extension();

    // helper for exhaustive std::visit chains
    template<typename> struct always_false : std::false_type
    {
    };
}
