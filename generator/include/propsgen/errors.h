/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <stdexcept>
#include <string>

namespace propsgen
{
    // every generator time failure derives from this, a pass that throws produces no output
    class generator_error : public std::runtime_error
    {
    public:
        explicit generator_error(const std::string& message)
            : std::runtime_error(message)
        {
        }
    };

    class invalid_schema : public generator_error
    {
    public:
        using generator_error::generator_error;
    };

    class unsupported_nesting : public generator_error
    {
    public:
        using generator_error::generator_error;
    };

    class missing_object_properties : public generator_error
    {
    public:
        using generator_error::generator_error;
    };

    class enum_name_collision : public generator_error
    {
    public:
        using generator_error::generator_error;
    };
}
