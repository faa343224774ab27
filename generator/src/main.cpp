/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <args.hxx>

#include "propsgen/logger.h"
#include "propsgen/props_generator.h"
#include "propsgen/schema_loader.h"

using namespace std;

bool is_different(const std::string& generated, const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path))
        return true;

    string existing;
    {
        ifstream fs(path);
        std::getline(fs, existing, '\0');
    }
    return existing != generated;
}

int main(const int argc, char* argv[])
{
    try
    {
        args::ArgumentParser args_parser("Generate C++ props headers from a component schema");
        args::HelpFlag h(args_parser, "help", "help", {"help"});

        args::ValueFlag<std::string> schema_path_arg(
            args_parser, "path", "the json component schema to be parsed", {'i', "schema"}, args::Options::Required);
        args::ValueFlag<std::string> output_path_arg(
            args_parser, "path", "the base output path", {'p', "output_path"}, args::Options::Required);
        args::ValueFlag<std::string> library_name_arg(
            args_parser, "name", "the library the schema belongs to", {'l', "library_name"});
        args::ValueFlag<std::string> file_name_arg(
            args_parser, "name", "the generated header file name", {'f', "file_name"}, "Props.h");
        args::ValueFlagList<std::string> namespaces_arg(
            args_parser, "namespace", "namespace of the generated props classes", {'n', "namespace"});
        args::Flag dump_arg(args_parser, "dump", "print the generated header instead of writing it", {'d', "dump"});
        args::Flag verbose_arg(args_parser, "verbose", "debug logging", {'v', "verbose"});

        try
        {
            args_parser.ParseCLI(argc, argv);
        }
        catch (const args::Help&)
        {
            std::cout << args_parser;
            return 0;
        }
        catch (const args::ParseError& e)
        {
            std::cerr << e.what() << std::endl;
            std::cerr << args_parser;
            return 1;
        }
        catch (const args::ValidationError& e)
        {
            std::cerr << e.what() << std::endl;
            std::cerr << args_parser;
            return 1;
        }

#ifdef USE_PROPSGEN_LOGGING
        propsgen_set_verbose(args::get(verbose_arg));
#endif

        string schema_path = args::get(schema_path_arg);
        string output_path = args::get(output_path_arg);
        std::replace(schema_path.begin(), schema_path.end(), '\\', '/');
        std::replace(output_path.begin(), output_path.end(), '\\', '/');

        propsgen::generator_options options;
        options.library_name = args::get(library_name_arg);
        options.file_name = args::get(file_name_arg);
        if (namespaces_arg)
            options.namespaces = args::get(namespaces_arg);

        std::error_code ec;
        auto schema_fs_path = std::filesystem::absolute(schema_path, ec);
        if (ec || !std::filesystem::exists(schema_fs_path))
        {
            std::cerr << "Error file " << schema_path << " does not exist\n";
            return 1;
        }

        auto sch = propsgen::load_schema(schema_fs_path);
        auto files = propsgen::generate(sch, options);

        if (args::get(dump_arg))
        {
            for (auto& file : files)
                std::cout << file.second;
            return 0;
        }

        for (auto& file : files)
        {
            auto file_fs_path = std::filesystem::path(output_path) / file.first;
            std::filesystem::create_directories(file_fs_path.parent_path());

            // compare and write if different
            if (is_different(file.second, file_fs_path))
            {
                ofstream out(file_fs_path);
                out << file.second;
                if (!out)
                {
                    std::cerr << "unable to write " << file_fs_path.string() << '\n';
                    return 1;
                }
                PROPSGEN_INFO("wrote {}", file_fs_path.string());
            }
            else
            {
                PROPSGEN_DEBUG("{} is up to date", file_fs_path.string());
            }
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
