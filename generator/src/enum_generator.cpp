/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <set>

#include <fmt/format.h>

#include "propsgen/cpp_helpers.h"
#include "propsgen/enum_generator.h"
#include "propsgen/errors.h"
#include "propsgen/logger.h"

namespace propsgen
{
    namespace
    {
        std::vector<enum_member> make_members(
            const std::string& enum_name, const string_enum_type& type, enum_representation representation)
        {
            std::vector<enum_member> members;
            std::set<std::string> identifiers;
            std::uint32_t index = 0;
            for (auto& option : type.options)
            {
                enum_member member;
                member.literal = option.name;
                member.identifier = to_safe_cpp_string(option.name);
                if (member.identifier.empty())
                    throw invalid_schema(
                        fmt::format("option \"{}\" of enum {} has no valid identifier", option.name, enum_name));
                if (!identifiers.insert(member.identifier).second)
                    throw invalid_schema(fmt::format(
                        "option \"{}\" of enum {} maps to the identifier {} of an earlier option",
                        option.name,
                        enum_name,
                        member.identifier));
                member.value = representation == enum_representation::bitmask ? (std::uint32_t(1) << index) : index;
                members.push_back(member);
                index++;
            }
            return members;
        }

        void write_scalar_enum(const enum_decl& decl, writer& header)
        {
            std::string values;
            for (auto& member : decl.members)
            {
                if (!values.empty())
                    values += ", ";
                values += member.identifier;
            }

            header("enum class {enum_name} {{ {values} }};", fmt::arg("enum_name", decl.name), fmt::arg("values", values));
            header("");
            header("static inline void fromRawValue(const RawValue &value, {enum_name} &result)",
                fmt::arg("enum_name", decl.name));
            header("{{");
            header("auto string = (std::string)value;");
            for (auto& member : decl.members)
            {
                header("if (string == \"{literal}\") {{ result = {enum_name}::{option}; return; }}",
                    fmt::arg("literal", escape_string_literal(member.literal)),
                    fmt::arg("enum_name", decl.name),
                    fmt::arg("option", member.identifier));
            }
            header("abort();");
            header("}}");
            header("");
            header("static inline std::string toString(const {enum_name} &value)", fmt::arg("enum_name", decl.name));
            header("{{");
            header("switch (value)");
            header("{{");
            for (auto& member : decl.members)
            {
                header("case {enum_name}::{option}: return \"{literal}\";",
                    fmt::arg("enum_name", decl.name),
                    fmt::arg("option", member.identifier),
                    fmt::arg("literal", escape_string_literal(member.literal)));
            }
            header("}}");
            header("}}");
        }

        void write_flag_enum(const enum_decl& decl, writer& header)
        {
            auto enum_name = fmt::arg("enum_name", decl.name);
            auto enum_mask = fmt::arg("enum_mask", decl.mask_name);

            header("using {enum_mask} = uint32_t;", enum_mask);
            header("");
            header("enum class {enum_name} : {enum_mask}", enum_name, enum_mask);
            header("{{");
            std::uint32_t index = 0;
            for (auto& member : decl.members)
            {
                header("{option} = 1 << {index},", fmt::arg("option", member.identifier), fmt::arg("index", index));
                index++;
            }
            header("}};");
            header("");
            header("constexpr bool operator&({enum_mask} const lhs, enum {enum_name} const rhs)", enum_mask, enum_name);
            header("{{");
            header("return lhs & static_cast<{enum_mask}>(rhs);", enum_mask);
            header("}}");
            header("");
            header("constexpr {enum_mask} operator|({enum_mask} const lhs, enum {enum_name} const rhs)", enum_mask, enum_name);
            header("{{");
            header("return lhs | static_cast<{enum_mask}>(rhs);", enum_mask);
            header("}}");
            header("");
            header("constexpr void operator|=({enum_mask} &lhs, enum {enum_name} const rhs)", enum_mask, enum_name);
            header("{{");
            header("lhs = lhs | static_cast<{enum_mask}>(rhs);", enum_mask);
            header("}}");
            header("");
            header("static inline void fromRawValue(const RawValue &value, {enum_mask} &result)", enum_mask);
            header("{{");
            header("auto items = std::vector<std::string>{{value}};");
            header("for (const auto &item : items)");
            header("{{");
            for (auto& member : decl.members)
            {
                header("if (item == \"{literal}\")", fmt::arg("literal", escape_string_literal(member.literal)));
                header("{{");
                header("result |= {enum_name}::{option};", enum_name, fmt::arg("option", member.identifier));
                header("continue;");
                header("}}");
            }
            header("abort();");
            header("}}");
            header("}}");
            header("");
            header("static inline std::string toString(const {enum_mask} &value)", enum_mask);
            header("{{");
            header("auto result = std::string{{}};");
            header("auto separator = std::string{{\", \"}};");
            header("");
            for (auto& member : decl.members)
            {
                header("if (value & {enum_name}::{option})", enum_name, fmt::arg("option", member.identifier));
                header("{{");
                header("result += \"{literal}\" + separator;", fmt::arg("literal", escape_string_literal(member.literal)));
                header("}}");
            }
            header("if (!result.empty())");
            header("{{");
            header("result.erase(result.length() - separator.length());");
            header("}}");
            header("return result;");
            header("}}");
        }
    }

    enum_decl make_scalar_enum(const std::string& component_name, const std::string& prop_name, const string_enum_type& type)
    {
        enum_decl decl;
        decl.name = get_enum_name(component_name, prop_name);
        decl.representation = enum_representation::scalar;
        decl.members = make_members(decl.name, type, decl.representation);
        return decl;
    }

    enum_decl make_flag_enum(const std::string& component_name, const std::string& prop_name, const string_enum_type& type)
    {
        if (type.options.size() > max_flag_options)
            throw invalid_schema(fmt::format("prop {} of {} has {} options, a flag enum supports at most {}",
                prop_name,
                component_name,
                type.options.size(),
                max_flag_options));

        enum_decl decl;
        decl.name = get_enum_name(component_name, prop_name);
        decl.mask_name = get_enum_mask_name(decl.name);
        decl.representation = enum_representation::bitmask;
        decl.members = make_members(decl.name, type, decl.representation);
        return decl;
    }

    std::vector<enum_decl> collect_enums(const std::string& component_name, const std::vector<prop>& props)
    {
        std::vector<enum_decl> enums;
        std::set<std::string> names;

        auto add = [&](enum_decl decl)
        {
            if (!names.insert(decl.name).second)
                throw enum_name_collision(
                    fmt::format("enum {} is declared more than once in component {}", decl.name, component_name));
            PROPSGEN_DEBUG("{}: enum {} with {} options", component_name, decl.name, decl.members.size());
            enums.push_back(std::move(decl));
        };

        for (auto& property : props)
        {
            auto& type = property.type;
            if (type.is<array_type>() && type.as<array_type>().element_type->is<string_enum_type>())
            {
                add(make_flag_enum(
                    component_name, property.name, type.as<array_type>().element_type->as<string_enum_type>()));
            }
            else if (type.is<string_enum_type>())
            {
                add(make_scalar_enum(component_name, property.name, type.as<string_enum_type>()));
            }
            else if (type.is<object_type>())
            {
                auto& properties = type.as<object_type>().properties;
                if (!properties)
                    throw missing_object_properties(fmt::format(
                        "properties are expected for object prop {} in {}", property.name, component_name));
                // only one level deep, enums further down are not declared
                for (auto& inner : *properties)
                {
                    if (inner.type.is<string_enum_type>())
                        add(make_scalar_enum(component_name, inner.name, inner.type.as<string_enum_type>()));
                }
            }
        }
        return enums;
    }

    void write_enum(const enum_decl& decl, writer& header)
    {
        switch (decl.representation)
        {
        case enum_representation::scalar:
            write_scalar_enum(decl, header);
            return;
        case enum_representation::bitmask:
            write_flag_enum(decl, header);
            return;
        }
    }
}
