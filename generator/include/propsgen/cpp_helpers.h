/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>
#include <vector>

#include "propsgen/schema.h"

namespace propsgen
{
    // "over-the-top" -> "OverTheTop", any character not allowed in an identifier splits a word
    std::string to_safe_cpp_string(const std::string& input);

    // contents of a C++ string literal, without the surrounding quotes
    std::string escape_string_literal(const std::string& input);

    std::string get_enum_name(const std::string& component_name, const std::string& prop_name);
    std::string get_enum_mask_name(const std::string& enum_name);
    std::string generate_struct_name(const std::string& component_name, const std::vector<std::string>& parts);

    // only valid for boolean_type, string_type, int32_type, double_type and float_type
    std::string get_cpp_type_for_scalar(const type_annotation& type);

    std::string get_native_primitive_type(native_primitive_kind kind);

    // initializer placed between the braces of a field declaration, may be empty
    std::string convert_default_to_string(const std::string& component_name, const prop& property);

    struct base_capability
    {
        std::string inheritance;
        std::string include;
    };

    base_capability get_base_capability(const extends_clause& clause);
}
