/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <string>

#include <gtest/gtest.h>

#include <busgen/internal/error_codes.h>
#include <busgen/internal/signature.h>

namespace
{
    int parse_error(const std::string& text, std::size_t* position = nullptr)
    {
        busgen::type_signature sig;
        return busgen::parse_signature(text, sig, position);
    }
}

TEST(signature, round_trips_well_formed_text)
{
    for (const char* text : {"", "y", "bnqiuxtd", "hsogv", "ai", "aai", "a{sv}", "a{oa{sa{sv}}}", "(us)", "((y)(n))",
             "a(ia{ss})", "sa{sv}as", "(yv)ay"})
    {
        busgen::type_signature sig;
        ASSERT_EQ(busgen::parse_signature(text, sig), busgen::error::OK()) << text;
        EXPECT_EQ(busgen::to_text(sig), text);
    }
}

TEST(signature, splits_into_complete_types)
{
    busgen::type_signature sig;
    ASSERT_EQ(busgen::parse_signature("sa{sv}(ii)", sig), busgen::error::OK());
    ASSERT_EQ(sig.size(), 3u);
    EXPECT_EQ(sig.types()[0].code, busgen::type_code::string);
    EXPECT_TRUE(sig.types()[1].is_dict());
    EXPECT_EQ(sig.types()[2].code, busgen::type_code::struct_);
    EXPECT_EQ(sig.types()[2].children.size(), 2u);
}

TEST(signature, wraps_outputs_into_one_struct)
{
    busgen::type_signature sig;
    ASSERT_EQ(busgen::parse_signature("us", sig), busgen::error::OK());
    EXPECT_EQ(sig.as_struct().to_string(), "(us)");
    EXPECT_TRUE(sig.as_struct().is_single_complete_type());
}

TEST(signature, reports_unknown_type_code_and_position)
{
    std::size_t position = 0;
    EXPECT_EQ(parse_error("iiz", &position), busgen::error::SIGNATURE_UNKNOWN_TYPE_CODE());
    EXPECT_EQ(position, 2u);
    EXPECT_EQ(parse_error("(iw)"), busgen::error::SIGNATURE_UNKNOWN_TYPE_CODE());
}

TEST(signature, reports_unexpected_end)
{
    EXPECT_EQ(parse_error("a"), busgen::error::SIGNATURE_UNEXPECTED_END());
    EXPECT_EQ(parse_error("iaa"), busgen::error::SIGNATURE_UNEXPECTED_END());
}

TEST(signature, reports_unmatched_containers)
{
    EXPECT_EQ(parse_error("(ii"), busgen::error::SIGNATURE_UNMATCHED_CONTAINER());
    EXPECT_EQ(parse_error("ii)"), busgen::error::SIGNATURE_UNMATCHED_CONTAINER());
    EXPECT_EQ(parse_error("a{sv"), busgen::error::SIGNATURE_UNMATCHED_CONTAINER());
    EXPECT_EQ(parse_error("}"), busgen::error::SIGNATURE_UNMATCHED_CONTAINER());
}

TEST(signature, reports_nesting_too_deep)
{
    EXPECT_EQ(parse_error(std::string(32, 'a') + "i"), busgen::error::OK());
    EXPECT_EQ(parse_error(std::string(33, 'a') + "i"), busgen::error::SIGNATURE_NESTING_TOO_DEEP());
    EXPECT_EQ(parse_error(std::string(32, '(') + "i" + std::string(32, ')')), busgen::error::OK());
    EXPECT_EQ(parse_error(std::string(33, '(') + "i" + std::string(33, ')')), busgen::error::SIGNATURE_NESTING_TOO_DEEP());
}

TEST(signature, rejects_malformed_structs_and_dict_entries)
{
    EXPECT_EQ(parse_error("()"), busgen::error::SIGNATURE_EMPTY_STRUCT());
    EXPECT_EQ(parse_error("{sv}"), busgen::error::SIGNATURE_INVALID_DICT_ENTRY());
    EXPECT_EQ(parse_error("a{vs}"), busgen::error::SIGNATURE_INVALID_DICT_ENTRY());
    EXPECT_EQ(parse_error("a{s}"), busgen::error::SIGNATURE_INVALID_DICT_ENTRY());
    EXPECT_EQ(parse_error("a{sss}"), busgen::error::SIGNATURE_INVALID_DICT_ENTRY());
}

TEST(signature, rejects_overlong_text)
{
    EXPECT_EQ(parse_error(std::string(255, 'i')), busgen::error::OK());
    EXPECT_EQ(parse_error(std::string(256, 'i')), busgen::error::SIGNATURE_TOO_LONG());
}

TEST(signature, leaves_output_untouched_on_failure)
{
    busgen::type_signature sig;
    ASSERT_EQ(busgen::parse_signature("as", sig), busgen::error::OK());
    EXPECT_NE(busgen::parse_signature("a(", sig), busgen::error::OK());
    EXPECT_EQ(sig.to_string(), "as");
}

TEST(signature, single_type_requires_exactly_one)
{
    busgen::type_node node;
    EXPECT_EQ(busgen::parse_single_type("a{sv}", node), busgen::error::OK());
    EXPECT_TRUE(node.is_dict());
    EXPECT_NE(busgen::parse_single_type("ss", node), busgen::error::OK());
    EXPECT_NE(busgen::parse_single_type("", node), busgen::error::OK());
}

TEST(signature, classifies_errors_by_family)
{
    EXPECT_TRUE(busgen::error::is_signature_error(busgen::error::SIGNATURE_NESTING_TOO_DEEP()));
    EXPECT_FALSE(busgen::error::is_signature_error(busgen::error::XML_PARSE_ERROR()));
    EXPECT_TRUE(busgen::error::is_model_error(busgen::error::MODEL_DUPLICATE_MEMBER()));
    EXPECT_TRUE(busgen::error::is_xml_error(busgen::error::XML_MISSING_ATTRIBUTE()));
}
