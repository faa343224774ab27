/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <type_traits>

#include <fmt/format.h>

#include "propsgen/cpp_helpers.h"
#include "propsgen/errors.h"
#include "propsgen/logger.h"
#include "propsgen/struct_generator.h"
#include "propsgen/type_mapper.h"

namespace propsgen
{
    namespace
    {
        const std::vector<prop>& get_object_properties(
            const object_type& object, const std::string& component_name, const std::string& prop_name)
        {
            if (!object.properties)
                throw missing_object_properties(
                    fmt::format("properties are expected for object prop {} in {}", prop_name, component_name));
            return *object.properties;
        }

        // an absent default value-initializes the field, enums included
        std::string get_field_initializer(const std::string& component_name, const prop& property)
        {
            if (std::holds_alternative<std::monostate>(property.default_value))
                return "";
            return convert_default_to_string(component_name, property);
        }

        void make_struct(const std::string& component_name,
            const std::vector<std::string>& name_parts,
            const std::vector<prop>& properties,
            declaration_map& structs)
        {
            struct_decl decl;
            decl.name = generate_struct_name(component_name, name_parts);
            for (auto& property : properties)
            {
                decl.fields.push_back(struct_field{get_native_type(component_name, property, name_parts),
                    property.name,
                    get_field_initializer(component_name, property)});
            }
            PROPSGEN_DEBUG("{}: struct {} with {} fields", component_name, decl.name, decl.fields.size());
            auto key = decl.name;
            structs.set(key, std::move(decl));
        }
    }

    void declaration_map::set(const std::string& key, declaration decl)
    {
        auto it = index_.find(key);
        if (it != index_.end())
        {
            entries_[it->second].second = std::move(decl);
            return;
        }
        index_[key] = entries_.size();
        entries_.emplace_back(key, std::move(decl));
    }

    const declaration* declaration_map::find(const std::string& key) const
    {
        auto it = index_.find(key);
        if (it == index_.end())
            return nullptr;
        return &entries_[it->second].second;
    }

    std::string get_array_conversion_key(const std::string& component_name, const std::vector<std::string>& parts)
    {
        return "array:" + generate_struct_name(component_name, parts);
    }

    void collect_structs(const std::string& component_name,
        const std::vector<prop>& properties,
        const std::vector<std::string>& name_parts,
        declaration_map& structs)
    {
        for (auto& property : properties)
        {
            auto& type = property.type;
            auto parts = name_parts;
            parts.push_back(property.name);

            if (type.is<object_type>())
            {
                auto& inner = get_object_properties(type.as<object_type>(), component_name, property.name);
                collect_structs(component_name, inner, parts, structs);
                make_struct(component_name, parts, inner, structs);
            }
            else if (type.is<array_type>() && type.as<array_type>().element_type->is<object_type>())
            {
                auto& inner = get_object_properties(
                    type.as<array_type>().element_type->as<object_type>(), component_name, property.name);
                collect_structs(component_name, inner, parts, structs);
                make_struct(component_name, parts, inner, structs);

                structs.set(get_array_conversion_key(component_name, parts),
                    array_conversion_decl{generate_struct_name(component_name, parts)});
            }
        }
    }

    declaration_map collect_structs(const std::string& component_name, const std::vector<prop>& properties)
    {
        declaration_map structs;
        collect_structs(component_name, properties, {}, structs);
        return structs;
    }

    void write_struct(const struct_decl& decl, writer& header)
    {
        auto struct_name = fmt::arg("struct_name", decl.name);

        header("struct {struct_name}", struct_name);
        header("{{");
        for (auto& field : decl.fields)
        {
            header("{type} {name}{{{default_value}}};",
                fmt::arg("type", field.type),
                fmt::arg("name", field.name),
                fmt::arg("default_value", field.default_value));
        }
        header("}};");
        header("");
        header("static inline void fromRawValue(const RawValue &value, {struct_name} &result)", struct_name);
        header("{{");
        header("auto map = (better::map<std::string, RawValue>)value;");
        for (auto& field : decl.fields)
        {
            auto name = fmt::arg("name", field.name);
            header("");
            header("auto tmp_{name} = map.find(\"{name}\");", name);
            header("if (tmp_{name} != map.end())", name);
            header("{{");
            header("fromRawValue(tmp_{name}->second, result.{name});", name);
            header("}}");
        }
        header("}}");
        header("");
        header("static inline std::string toString(const {struct_name} &value)", struct_name);
        header("{{");
        header("return \"[Object {struct_name}]\";", struct_name);
        header("}}");
    }

    void write_array_conversion(const array_conversion_decl& decl, writer& header)
    {
        auto struct_name = fmt::arg("struct_name", decl.struct_name);

        header("static inline void fromRawValue(const RawValue &value, std::vector<{struct_name}> &result)", struct_name);
        header("{{");
        header("auto items = (std::vector<RawValue>)value;");
        header("for (const auto &item : items)");
        header("{{");
        header("{struct_name} newItem;", struct_name);
        header("fromRawValue(item, newItem);");
        header("result.emplace_back(newItem);");
        header("}}");
        header("}}");
    }

    void write_declarations(const declaration_map& structs, writer& header)
    {
        bool first_pass = true;
        for (auto& entry : structs.entries())
        {
            if (!first_pass)
                header("");
            first_pass = false;

            std::visit(
                [&](auto&& decl)
                {
                    using T = std::decay_t<decltype(decl)>;
                    if constexpr (std::is_same_v<T, struct_decl>)
                        write_struct(decl, header);
                    else if constexpr (std::is_same_v<T, array_conversion_decl>)
                        write_array_conversion(decl, header);
                    else
                        static_assert(always_false<T>::value, "unhandled declaration");
                },
                entry.second);
        }
    }
}
