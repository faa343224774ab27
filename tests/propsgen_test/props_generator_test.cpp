/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "propsgen/errors.h"
#include "propsgen/props_generator.h"

using namespace propsgen;

namespace
{
    schema make_schema(std::vector<component> components)
    {
        schema sch;
        schema_module mod;
        mod.name = "SliderModule";
        mod.has_components = true;
        mod.components = std::move(components);
        sch.modules.push_back(std::move(mod));
        return sch;
    }

    component make_component(std::string name, std::vector<prop> props, bool extends_view = true)
    {
        component comp;
        comp.name = std::move(name);
        comp.props = std::move(props);
        if (extends_view)
            comp.extends_props.push_back(make_view_props_extension());
        return comp;
    }

    std::string render(const schema& sch, const generator_options& options = {})
    {
        std::stringstream stream;
        write_files(sch, stream, options);
        return stream.str();
    }

    std::string render_component(const component& comp, import_set& imports)
    {
        std::stringstream stream;
        writer header(stream);
        write_component(comp, header, imports);
        return stream.str();
    }
}

TEST(PropsGeneratorTest, ClassName)
{
    EXPECT_EQ(get_props_class_name(make_component("Slider", {})), "SliderProps");
}

TEST(PropsGeneratorTest, ColorPropDocument)
{
    auto sch = make_schema(
        {make_component("Slider", {make_prop("color", make_native_primitive(native_primitive_kind::color))})});

    const std::string expected = "/**\n"
                                 " * Generated by propsgen, do not edit.\n"
                                 " *\n"
                                 " * @generated\n"
                                 " */\n"
                                 "#pragma once\n"
                                 "\n"
                                 "#include <react/components/view/ViewProps.h>\n"
                                 "#include <react/graphics/Color.h>\n"
                                 "\n"
                                 "namespace facebook\n"
                                 "{\n"
                                 "\tnamespace react\n"
                                 "\t{\n"
                                 "\t\tclass SliderProps final : public ViewProps\n"
                                 "\t\t{\n"
                                 "\t\tpublic:\n"
                                 "\t\t\tSliderProps() = default;\n"
                                 "\t\t\tSliderProps(const SliderProps &sourceProps, const RawProps &rawProps);\n"
                                 "\n"
                                 "#pragma mark - Props\n"
                                 "\n"
                                 "\t\t\tconst SharedColor color{};\n"
                                 "\t\t};\n"
                                 "\t} // namespace react\n"
                                 "} // namespace facebook\n";

    EXPECT_EQ(render(sch), expected);
}

TEST(PropsGeneratorTest, ComponentWithoutExtendsHasNoBaseClause)
{
    import_set imports;
    auto text = render_component(make_component("Plain", {make_prop("value", make_float(), 1.0)}, false), imports);
    EXPECT_NE(text.find("class PlainProps final\n"), std::string::npos);
    EXPECT_NE(text.find("\tconst Float value{1.0};\n"), std::string::npos);
    EXPECT_TRUE(imports.empty());
}

TEST(PropsGeneratorTest, ComponentOrdersEnumsThenStructsThenClass)
{
    auto comp = make_component("Slider",
        {
            make_prop("alignment", make_string_enum({"left", "right"}), std::string("right")),
            make_prop("edges", make_array(make_string_enum({"top", "bottom"})), std::string("bottom")),
            make_prop("insets", make_object({make_prop("top", make_float())})),
            make_prop("points", make_array(make_object({make_prop("x", make_float())}))),
            make_prop("steps", make_int32(), std::int64_t{5}),
            make_prop("title", make_string(), std::string("hello")),
        });

    import_set imports;
    auto text = render_component(comp, imports);

    auto alignment_pos = text.find("enum class SliderAlignment { Left, Right };");
    auto edges_pos = text.find("enum class SliderEdges : SliderEdgesMask");
    auto insets_pos = text.find("struct SliderInsetsStruct");
    auto points_pos = text.find("struct SliderPointsStruct");
    auto class_pos = text.find("class SliderProps final : public ViewProps");
    ASSERT_NE(alignment_pos, std::string::npos);
    ASSERT_NE(edges_pos, std::string::npos);
    ASSERT_NE(insets_pos, std::string::npos);
    ASSERT_NE(points_pos, std::string::npos);
    ASSERT_NE(class_pos, std::string::npos);
    EXPECT_LT(alignment_pos, edges_pos);
    EXPECT_LT(edges_pos, insets_pos);
    EXPECT_LT(insets_pos, points_pos);
    EXPECT_LT(points_pos, class_pos);

    EXPECT_NE(text.find("\tconst SliderAlignment alignment{SliderAlignment::Right};\n"), std::string::npos);
    EXPECT_NE(text.find("\tconst SliderEdgesMask edges{static_cast<SliderEdgesMask>(SliderEdges::Bottom)};\n"),
        std::string::npos);
    EXPECT_NE(text.find("\tconst SliderInsetsStruct insets{};\n"), std::string::npos);
    EXPECT_NE(text.find("\tconst std::vector<SliderPointsStruct> points{};\n"), std::string::npos);
    EXPECT_NE(text.find("\tconst int steps{5};\n"), std::string::npos);
    EXPECT_NE(text.find("\tconst std::string title{\"hello\"};\n"), std::string::npos);

    EXPECT_EQ(imports,
        (import_set{"cinttypes",
            "react/components/view/ViewProps.h",
            "react/core/propsConversions.h",
            "vector"}));
}

TEST(PropsGeneratorTest, FailingComponentWritesNothing)
{
    auto comp = make_component("Broken",
        {
            make_prop("value", make_float()),
            make_prop("matrix", make_array(make_array(make_float()))),
        });

    import_set imports;
    std::stringstream stream;
    writer header(stream);
    EXPECT_THROW(write_component(comp, header, imports), unsupported_nesting);
    EXPECT_TRUE(stream.str().empty());
    EXPECT_TRUE(imports.empty());
}

TEST(PropsGeneratorTest, FailureAbortsTheWholeDocument)
{
    auto sch = make_schema({
        make_component("Good", {make_prop("value", make_float())}),
        make_component("Bad", {make_prop("style", make_object_without_properties())}),
    });

    std::stringstream stream;
    EXPECT_THROW(write_files(sch, stream, {}), missing_object_properties);
    EXPECT_TRUE(stream.str().empty());
}

TEST(PropsGeneratorTest, ComponentsAreSeparatedAndIncludesMerged)
{
    schema sch;
    schema_module first;
    first.name = "First";
    first.has_components = true;
    first.components.push_back(
        make_component("Alpha", {make_prop("tint", make_native_primitive(native_primitive_kind::color))}));
    schema_module empty;
    empty.name = "NoComponents";
    schema_module second;
    second.name = "Second";
    second.has_components = true;
    second.components.push_back(
        make_component("Beta", {make_prop("origin", make_native_primitive(native_primitive_kind::point))}));
    sch.modules = {first, empty, second};

    auto text = render(sch);
    EXPECT_NE(text.find("#include <react/components/view/ViewProps.h>\n"
                        "#include <react/graphics/Color.h>\n"
                        "#include <react/graphics/Geometry.h>\n"),
        std::string::npos);
    EXPECT_NE(text.find("\t\t};\n\n\t\tclass BetaProps final : public ViewProps\n"), std::string::npos);

    auto alpha_pos = text.find("class AlphaProps");
    auto beta_pos = text.find("class BetaProps");
    ASSERT_NE(alpha_pos, std::string::npos);
    ASSERT_NE(beta_pos, std::string::npos);
    EXPECT_LT(alpha_pos, beta_pos);
}

TEST(PropsGeneratorTest, EmptySchemaStillProducesScaffold)
{
    auto text = render(schema{});
    EXPECT_EQ(text,
        "/**\n"
        " * Generated by propsgen, do not edit.\n"
        " *\n"
        " * @generated\n"
        " */\n"
        "#pragma once\n"
        "\n"
        "namespace facebook\n"
        "{\n"
        "\tnamespace react\n"
        "\t{\n"
        "\t} // namespace react\n"
        "} // namespace facebook\n");
}

TEST(PropsGeneratorTest, OptionsControlBannerAndNamespaces)
{
    generator_options options;
    options.library_name = "SliderLibrary";
    options.namespaces = {"acme"};

    auto sch = make_schema({make_component("Slider", {make_prop("value", make_float())})});
    auto text = render(sch, options);
    EXPECT_NE(text.find(" * Generated by propsgen for SliderLibrary, do not edit.\n"), std::string::npos);
    EXPECT_NE(text.find("namespace acme\n{\n\tclass SliderProps final : public ViewProps\n"), std::string::npos);
    EXPECT_NE(text.find("} // namespace acme\n"), std::string::npos);
    EXPECT_EQ(text.find("namespace facebook"), std::string::npos);
}

TEST(PropsGeneratorTest, OutputIsDeterministic)
{
    auto sch = make_schema({
        make_component("Slider",
            {
                make_prop("edges", make_array(make_string_enum({"top", "bottom"})), std::string("top")),
                make_prop("style",
                    make_object({make_prop("thumb", make_native_primitive(native_primitive_kind::image_source))})),
            }),
    });
    EXPECT_EQ(render(sch), render(sch));
}

TEST(PropsGeneratorTest, GenerateReturnsOneFile)
{
    generator_options options;
    options.file_name = "SliderProps.h";

    auto sch = make_schema({make_component("Slider", {make_prop("value", make_float())})});
    auto files = generate(sch, options);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files.begin()->first, "SliderProps.h");
    EXPECT_EQ(files.begin()->second, render(sch, options));
}
