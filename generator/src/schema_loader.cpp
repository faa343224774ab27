/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "propsgen/errors.h"
#include "propsgen/logger.h"
#include "propsgen/schema_loader.h"

namespace propsgen
{
    namespace
    {
        // ordered so that modules, components and props keep their declaration order
        using json = nlohmann::ordered_json;

        const json& get_member(const json& node, const char* key, const std::string& context)
        {
            if (!node.is_object())
                throw invalid_schema(fmt::format("{}: expected an object", context));
            auto it = node.find(key);
            if (it == node.end())
                throw invalid_schema(fmt::format("{}: missing \"{}\"", context, key));
            return *it;
        }

        std::string get_string(const json& node, const char* key, const std::string& context)
        {
            auto& value = get_member(node, key, context);
            if (!value.is_string())
                throw invalid_schema(fmt::format("{}: \"{}\" should be a string", context, key));
            return value.get<std::string>();
        }

        const json& get_array(const json& node, const char* key, const std::string& context)
        {
            auto& value = get_member(node, key, context);
            if (!value.is_array())
                throw invalid_schema(fmt::format("{}: \"{}\" should be an array", context, key));
            return value;
        }

        std::vector<prop> parse_props(const json& node, const std::string& context);

        native_primitive_kind parse_native_primitive(const std::string& name, const std::string& context)
        {
            if (name == "ColorPrimitive")
                return native_primitive_kind::color;
            if (name == "ImageSourcePrimitive")
                return native_primitive_kind::image_source;
            if (name == "PointPrimitive")
                return native_primitive_kind::point;
            throw invalid_schema(fmt::format("{}: unknown native primitive {}", context, name));
        }

        type_annotation parse_type_annotation(const json& node, const std::string& context)
        {
            auto type = get_string(node, "type", context);
            if (type == "BooleanTypeAnnotation")
                return make_boolean();
            if (type == "StringTypeAnnotation")
                return make_string();
            if (type == "Int32TypeAnnotation")
                return make_int32();
            if (type == "DoubleTypeAnnotation")
                return make_double();
            if (type == "FloatTypeAnnotation")
                return make_float();
            if (type == "NativePrimitiveTypeAnnotation")
                return make_native_primitive(parse_native_primitive(get_string(node, "name", context), context));
            if (type == "ArrayTypeAnnotation")
                return make_array(parse_type_annotation(get_member(node, "elementType", context), context + "[]"));
            if (type == "ObjectTypeAnnotation")
            {
                auto it = node.find("properties");
                if (it == node.end() || it->is_null())
                    return make_object_without_properties();
                return make_object(parse_props(*it, context));
            }
            if (type == "StringEnumTypeAnnotation")
            {
                std::vector<std::string> options;
                for (auto& option : get_array(node, "options", context))
                    options.push_back(get_string(option, "name", context));
                return make_string_enum(options);
            }
            throw invalid_schema(fmt::format("{}: received invalid type annotation {}", context, type));
        }

        propsgen::default_value parse_default(const json& type_node, const std::string& context)
        {
            const json* node = &type_node;
            auto element = type_node.find("elementType");
            if (element != type_node.end() && element->is_object())
                node = &*element;

            auto it = node->find("default");
            if (it == node->end() || it->is_null())
                return std::monostate{};
            if (it->is_boolean())
                return it->get<bool>();
            if (it->is_number_integer())
                return it->get<std::int64_t>();
            if (it->is_number_float())
                return it->get<double>();
            if (it->is_string())
                return it->get<std::string>();
            throw invalid_schema(fmt::format("{}: unsupported default value {}", context, it->dump()));
        }

        prop parse_prop(const json& node, const std::string& context)
        {
            auto name = get_string(node, "name", context);
            auto prop_context = context + "." + name;
            auto& type_node = get_member(node, "typeAnnotation", prop_context);
            return make_prop(
                name, parse_type_annotation(type_node, prop_context), parse_default(type_node, prop_context));
        }

        std::vector<prop> parse_props(const json& node, const std::string& context)
        {
            if (!node.is_array())
                throw invalid_schema(fmt::format("{}: properties should be an array", context));
            std::vector<prop> props;
            for (auto& item : node)
                props.push_back(parse_prop(item, context));
            return props;
        }

        extends_clause parse_extends_clause(const json& node, const std::string& context)
        {
            auto type = get_string(node, "type", context);
            if (type != "ReactNativeBuiltInType")
                throw invalid_schema(fmt::format("{}: invalid extended type {}", context, type));
            auto known_type_name = get_string(node, "knownTypeName", context);
            if (known_type_name != "ReactNativeCoreViewProps")
                throw invalid_schema(fmt::format("{}: invalid knownTypeName {}", context, known_type_name));
            return make_view_props_extension();
        }

        component parse_component(const std::string& name, const json& node)
        {
            component comp;
            comp.name = name;

            auto extends = node.find("extendsProps");
            if (extends != node.end() && !extends->is_null())
            {
                for (auto& item : get_array(node, "extendsProps", name))
                    comp.extends_props.push_back(parse_extends_clause(item, name));
            }

            auto props = node.find("props");
            if (props != node.end() && !props->is_null())
                comp.props = parse_props(*props, name);
            return comp;
        }

        schema parse_schema_json(const json& root)
        {
            schema sch;
            auto& modules = get_member(root, "modules", "schema");
            if (!modules.is_object())
                throw invalid_schema("schema: \"modules\" should be an object");

            for (auto& [module_name, module_node] : modules.items())
            {
                schema_module mod;
                mod.name = module_name;
                if (!module_node.is_object())
                    throw invalid_schema(fmt::format("module {} should be an object", module_name));

                auto components = module_node.find("components");
                if (components != module_node.end() && !components->is_null())
                {
                    if (!components->is_object())
                        throw invalid_schema(fmt::format("module {}: \"components\" should be an object", module_name));
                    mod.has_components = true;
                    for (auto& [component_name, component_node] : components->items())
                    {
                        if (!component_node.is_object())
                            throw invalid_schema(fmt::format("component {} should be an object", component_name));
                        mod.components.push_back(parse_component(component_name, component_node));
                    }
                }
                PROPSGEN_DEBUG("module {}: {} components", mod.name, mod.components.size());
                sch.modules.push_back(std::move(mod));
            }
            return sch;
        }
    }

    schema parse_schema(const std::string& json_text)
    {
        json root;
        try
        {
            root = json::parse(json_text);
        }
        catch (const json::parse_error& e)
        {
            throw invalid_schema(fmt::format("schema is not valid json: {}", e.what()));
        }
        return parse_schema_json(root);
    }

    schema parse_schema(std::istream& input)
    {
        std::stringstream buffer;
        buffer << input.rdbuf();
        return parse_schema(buffer.str());
    }

    schema load_schema(const std::filesystem::path& path)
    {
        std::ifstream file(path);
        if (!file)
            throw invalid_schema(fmt::format("unable to open schema file {}", path.string()));
        PROPSGEN_DEBUG("loading schema {}", path.string());
        return parse_schema(file);
    }
}
