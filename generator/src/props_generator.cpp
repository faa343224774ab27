/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <sstream>

#include <fmt/format.h>

#include "propsgen/cpp_helpers.h"
#include "propsgen/enum_generator.h"
#include "propsgen/logger.h"
#include "propsgen/props_generator.h"
#include "propsgen/struct_generator.h"
#include "propsgen/type_mapper.h"

namespace propsgen
{
    namespace
    {
        struct prop_field
        {
            std::string type;
            std::string name;
            std::string default_value;
        };

        std::string get_class_extend_string(const component& comp)
        {
            std::string extends;
            for (auto& clause : comp.extends_props)
            {
                extends += extends.empty() ? " : " : ", ";
                extends += get_base_capability(clause).inheritance;
            }
            return extends;
        }
    }

    std::string get_props_class_name(const component& comp)
    {
        return comp.name + "Props";
    }

    void write_component(const component& comp, writer& header, import_set& imports)
    {
        // everything is synthesized before anything is written so a failing component leaves no partial class
        auto enums = collect_enums(comp.name, comp.props);
        auto structs = collect_structs(comp.name, comp.props);

        std::vector<prop_field> fields;
        for (auto& property : comp.props)
        {
            fields.push_back(prop_field{get_native_type(comp.name, property, {}),
                property.name,
                convert_default_to_string(comp.name, property)});
        }

        auto extends = get_class_extend_string(comp);
        auto extends_imports = get_extends_imports(comp.extends_props);
        auto local_imports = get_local_imports(comp.props);
        imports.insert(extends_imports.begin(), extends_imports.end());
        imports.insert(local_imports.begin(), local_imports.end());

        PROPSGEN_DEBUG("{}: {} enums, {} struct declarations, {} props",
            comp.name,
            enums.size(),
            structs.size(),
            fields.size());

        for (auto& decl : enums)
        {
            write_enum(decl, header);
            header("");
        }

        if (!structs.empty())
        {
            write_declarations(structs, header);
            header("");
        }

        auto class_name = fmt::arg("class_name", get_props_class_name(comp));
        header("class {class_name} final{extends}", class_name, fmt::arg("extends", extends));
        header("{{");
        header("public:");
        header("{class_name}() = default;", class_name);
        header("{class_name}(const {class_name} &sourceProps, const RawProps &rawProps);", class_name);
        header("");
        header("#pragma mark - Props");
        header("");
        for (auto& field : fields)
        {
            header("const {type} {name}{{{default_value}}};",
                fmt::arg("type", field.type),
                fmt::arg("name", field.name),
                fmt::arg("default_value", field.default_value));
        }
        header("}};");
    }

    void write_files(const schema& sch, std::ostream& os, const generator_options& options)
    {
        import_set imports;
        std::stringstream body_stream;
        writer body(body_stream, static_cast<int>(options.namespaces.size()));

        bool first_pass = true;
        for (auto& mod : sch.modules)
        {
            // no components in this module
            if (!mod.has_components)
                continue;

            for (auto& comp : mod.components)
            {
                if (!first_pass)
                    body("");
                first_pass = false;
                write_component(comp, body, imports);
            }
        }

        writer header(os);
        header("/**");
        if (options.library_name.empty())
            header(" * Generated by propsgen, do not edit.");
        else
            header(" * Generated by propsgen for {}, do not edit.", options.library_name);
        header(" *");
        header(" * @generated");
        header(" */");
        header("#pragma once");
        header("");
        for (auto& import : imports)
        {
            header("#include <{}>", import);
        }
        if (!imports.empty())
            header("");

        for (auto& ns : options.namespaces)
        {
            header("namespace {}", ns);
            header("{{");
        }

        header.write_buffer(body_stream.str());

        for (auto it = options.namespaces.rbegin(); it != options.namespaces.rend(); ++it)
        {
            header("}} // namespace {}", *it);
        }
    }

    std::map<std::string, std::string> generate(const schema& sch, const generator_options& options)
    {
        std::stringstream stream;
        write_files(sch, stream, options);
        return {{options.file_name, stream.str()}};
    }
}
