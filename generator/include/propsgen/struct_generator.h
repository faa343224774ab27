/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "propsgen/schema.h"
#include "propsgen/writer.h"

namespace propsgen
{
    struct struct_field
    {
        std::string type;
        std::string name;
        // initializer placed between the braces of the declaration, empty value-initializes
        std::string default_value;
    };

    struct struct_decl
    {
        std::string name;
        std::vector<struct_field> fields;
    };

    // fromRawValue for std::vector<struct_name>, must follow the struct it converts
    // keyed apart from the struct names so a struct can never be replaced by a conversion
    struct array_conversion_decl
    {
        std::string struct_name;
    };

    using declaration = std::variant<struct_decl, array_conversion_decl>;

    // keyed by declaration name, iterates in first insertion order
    // setting an existing key replaces the value but keeps its position
    class declaration_map
    {
        std::vector<std::pair<std::string, declaration>> entries_;
        std::map<std::string, size_t> index_;

    public:
        void set(const std::string& key, declaration decl);
        const declaration* find(const std::string& key) const;

        size_t size() const { return entries_.size(); }
        bool empty() const { return entries_.empty(); }
        const std::vector<std::pair<std::string, declaration>>& entries() const { return entries_; }
    };

    std::string get_array_conversion_key(const std::string& component_name, const std::vector<std::string>& parts);

    // depth first so that nested structs are declared before the structs that use them
    void collect_structs(const std::string& component_name,
        const std::vector<prop>& properties,
        const std::vector<std::string>& name_parts,
        declaration_map& structs);

    declaration_map collect_structs(const std::string& component_name, const std::vector<prop>& properties);

    void write_struct(const struct_decl& decl, writer& header);
    void write_array_conversion(const array_conversion_decl& decl, writer& header);
    void write_declarations(const declaration_map& structs, writer& header);
}
