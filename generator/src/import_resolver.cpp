/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <fmt/format.h>

#include "propsgen/cpp_helpers.h"
#include "propsgen/errors.h"
#include "propsgen/import_resolver.h"

namespace propsgen
{
    namespace
    {
        const std::vector<prop>& get_properties(const object_type& object)
        {
            if (!object.properties)
                throw missing_object_properties("properties are expected for an object type annotation");
            return *object.properties;
        }

        void add_object_imports(const std::vector<prop>& properties, import_set& imports)
        {
            imports.insert("react/core/propsConversions.h");
            auto conversion_imports = get_conversion_imports(properties);
            imports.insert(conversion_imports.begin(), conversion_imports.end());
            auto local_imports = get_local_imports(properties);
            imports.insert(local_imports.begin(), local_imports.end());
        }

        void add_conversion_import(native_primitive_kind kind, import_set& imports)
        {
            switch (kind)
            {
            case native_primitive_kind::color:
            case native_primitive_kind::point:
                return;
            case native_primitive_kind::image_source:
                imports.insert("react/components/image/conversions.h");
                return;
            }
            throw invalid_schema(fmt::format("unknown native primitive kind {}", static_cast<int>(kind)));
        }
    }

    std::string get_native_primitive_import(native_primitive_kind kind)
    {
        switch (kind)
        {
        case native_primitive_kind::color:
            return "react/graphics/Color.h";
        case native_primitive_kind::image_source:
            return "react/imagemanager/primitives.h";
        case native_primitive_kind::point:
            return "react/graphics/Geometry.h";
        }
        throw invalid_schema(fmt::format("unknown native primitive kind {}", static_cast<int>(kind)));
    }

    import_set get_conversion_imports(const std::vector<prop>& properties)
    {
        import_set imports;
        for (auto& property : properties)
        {
            auto& type = property.type;
            if (type.is<native_primitive_type>())
            {
                add_conversion_import(type.as<native_primitive_type>().kind, imports);
            }
            else if (type.is<array_type>())
            {
                auto& element_type = *type.as<array_type>().element_type;
                if (element_type.is<native_primitive_type>())
                    add_conversion_import(element_type.as<native_primitive_type>().kind, imports);
            }
            else if (type.is<object_type>())
            {
                auto nested = get_conversion_imports(get_properties(type.as<object_type>()));
                imports.insert(nested.begin(), nested.end());
            }
        }
        return imports;
    }

    import_set get_local_imports(const std::vector<prop>& properties)
    {
        import_set imports;
        for (auto& property : properties)
        {
            auto& type = property.type;
            if (type.is<native_primitive_type>())
            {
                imports.insert(get_native_primitive_import(type.as<native_primitive_type>().kind));
            }
            else if (type.is<array_type>())
            {
                imports.insert("vector");
                auto& element_type = *type.as<array_type>().element_type;
                if (element_type.is<string_enum_type>())
                    imports.insert("cinttypes");
                else if (element_type.is<native_primitive_type>())
                    imports.insert(get_native_primitive_import(element_type.as<native_primitive_type>().kind));
                else if (element_type.is<object_type>())
                    add_object_imports(get_properties(element_type.as<object_type>()), imports);
            }
            else if (type.is<object_type>())
            {
                add_object_imports(get_properties(type.as<object_type>()), imports);
            }
        }
        return imports;
    }

    import_set get_extends_imports(const std::vector<extends_clause>& extends_props)
    {
        import_set imports;
        for (auto& clause : extends_props)
            imports.insert(get_base_capability(clause).include);
        return imports;
    }
}
