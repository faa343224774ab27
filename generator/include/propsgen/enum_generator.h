/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "propsgen/schema.h"
#include "propsgen/writer.h"

namespace propsgen
{
    enum class enum_representation
    {
        scalar,
        bitmask
    };

    // the generated mask is a uint32_t
    constexpr std::size_t max_flag_options = 32;

    struct enum_member
    {
        std::string literal;
        std::string identifier;
        // bit value for a bitmask, declaration index for a scalar enum
        std::uint32_t value = 0;
    };

    struct enum_decl
    {
        std::string name;
        std::string mask_name;
        enum_representation representation = enum_representation::scalar;
        std::vector<enum_member> members;
    };

    enum_decl make_scalar_enum(const std::string& component_name, const std::string& prop_name, const string_enum_type& type);
    enum_decl make_flag_enum(const std::string& component_name, const std::string& prop_name, const string_enum_type& type);

    // enums of the top level props and of the string enum props directly inside a top level object,
    // throws enum_name_collision if two of them share a name
    std::vector<enum_decl> collect_enums(const std::string& component_name, const std::vector<prop>& props);

    void write_enum(const enum_decl& decl, writer& header);
}
