#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "parley/util/result.hpp"

#include "parley/parse.hpp"
#include "parley/xml.hpp"

namespace parley {
namespace {

using enum XML_Instruction_Type;

[[nodiscard]]
std::vector<XML_Instruction> instructions_of(std::u8string_view source)
{
    std::vector<XML_Instruction> result;
    const Result<void, Parse_Error> r = parse_xml_instructions(result, source);
    EXPECT_TRUE(r);
    return result;
}

[[nodiscard]]
Parse_Error_Code error_of(std::u8string_view source)
{
    std::vector<XML_Instruction> out;
    Result<void, Parse_Error> r = parse_xml_instructions(out, source);
    EXPECT_FALSE(r);
    return r ? Parse_Error_Code::corrupted : r.error().code;
}

TEST(Parse_Instructions, element_with_attribute)
{
    constexpr std::u8string_view source = u8R"(<p a="x">hi</p>)";
    const std::vector<XML_Instruction> expected {
        { skip, 1 }, { push_element, 1 }, { skip, 1 }, { attribute_name, 1 },
        { skip, 2 }, { attribute_value, 1 }, { skip, 2 }, { text, 2 },
        { pop_element, 4 },
    };
    EXPECT_EQ(instructions_of(source), expected);
}

TEST(Parse_Instructions, empty_element)
{
    const std::vector<XML_Instruction> expected {
        { skip, 1 },
        { push_element, 2 },
        { pop_element, 2 },
    };
    EXPECT_EQ(instructions_of(u8"<lb/>"), expected);
}

TEST(Parse_Instructions, prolog_is_skipped)
{
    constexpr std::u8string_view source
        = u8"<?xml version=\"1.0\"?>\n<!DOCTYPE TEI [ <!ENTITY x \"y\"> ]>\n<!-- c --><TEI/>\n";
    const std::vector<XML_Instruction> actual = instructions_of(source);
    ASSERT_EQ(actual.size(), 4);
    EXPECT_EQ(actual[0].type, skip);
    EXPECT_EQ(actual[0].n, source.find(u8"<TEI") + 1);
    EXPECT_EQ(actual[1], (XML_Instruction { push_element, 3 }));
    EXPECT_EQ(actual[2], (XML_Instruction { pop_element, 2 }));
    EXPECT_EQ(actual[3], (XML_Instruction { skip, 1 }));
}

TEST(Parse_Instructions, cover_source)
{
    constexpr std::u8string_view source
        = u8"<TEI>\n  <p n='1'>A <hi rend=\"it\">b</hi><![CDATA[<c>]]>&amp;</p>\n</TEI>";
    std::size_t total = 0;
    for (const XML_Instruction& i : instructions_of(source)) {
        total += i.n;
    }
    EXPECT_EQ(total, source.size());
}

TEST(Parse_Instructions, errors)
{
    EXPECT_EQ(error_of(u8""), Parse_Error_Code::no_root_element);
    EXPECT_EQ(error_of(u8"  <!-- only a comment -->"), Parse_Error_Code::no_root_element);
    EXPECT_EQ(error_of(u8"<a/><b/>"), Parse_Error_Code::multiple_root_elements);
    EXPECT_EQ(error_of(u8"text<a/>"), Parse_Error_Code::text_outside_root);
    EXPECT_EQ(error_of(u8"<1a/>"), Parse_Error_Code::invalid_name);
    EXPECT_EQ(error_of(u8"<a"), Parse_Error_Code::unterminated_tag);
    EXPECT_EQ(error_of(u8"<a b/>"), Parse_Error_Code::invalid_attribute);
    EXPECT_EQ(error_of(u8"<a b=c/>"), Parse_Error_Code::invalid_attribute);
    EXPECT_EQ(error_of(u8"<a b='1' b='2'/>"), Parse_Error_Code::duplicate_attribute);
    EXPECT_EQ(error_of(u8"<a><!-- </a>"), Parse_Error_Code::unterminated_markup);
    EXPECT_EQ(error_of(u8"<a></b>"), Parse_Error_Code::mismatched_closing_tag);
    EXPECT_EQ(error_of(u8"</a>"), Parse_Error_Code::mismatched_closing_tag);
    EXPECT_EQ(error_of(u8"<a><b></b>"), Parse_Error_Code::unclosed_element);
    EXPECT_EQ(error_of(u8"<a>Tom & Jerry</a>"), Parse_Error_Code::invalid_reference);
    EXPECT_EQ(error_of(u8"<a>&unknown;</a>"), Parse_Error_Code::invalid_reference);
    EXPECT_EQ(error_of(u8"<a b='<'/>"), Parse_Error_Code::unexpected_character);
    EXPECT_EQ(error_of(u8"<a>\xFF</a>"), Parse_Error_Code::corrupted);
}

TEST(Parse_Instructions, error_location)
{
    constexpr std::u8string_view source = u8"<TEI>\n  <p></said>\n</TEI>";
    std::vector<XML_Instruction> out;
    const Result<void, Parse_Error> r = parse_xml_instructions(out, source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, Parse_Error_Code::mismatched_closing_tag);
    EXPECT_EQ(r.error().location.line, 1);
    EXPECT_EQ(r.error().location.column, 5);
    EXPECT_EQ(r.error().location.begin, source.find(u8"</said>"));
    EXPECT_EQ(r.error().location.length, 6);
}

TEST(Parse_Tree, structure)
{
    Result<xml::Element, Parse_Error> root
        = parse_xml(u8R"(<p n="1"><said who="#jane">Hello</said>, she said.</p>)");
    ASSERT_TRUE(root);

    EXPECT_EQ(root->name, u8"p");
    ASSERT_EQ(root->attributes.size(), 1);
    EXPECT_EQ(root->attributes[0], (xml::Attribute { u8"n", u8"1" }));
    ASSERT_EQ(root->children.size(), 2);

    const xml::Element* const said = root->children[0].as_element();
    ASSERT_TRUE(said);
    EXPECT_EQ(said->name, u8"said");
    ASSERT_TRUE(said->find_attribute(u8"who"));
    EXPECT_EQ(*said->find_attribute(u8"who"), u8"#jane");
    EXPECT_FALSE(said->find_attribute(u8"toWhom"));

    const xml::Text* const tail = root->children[1].as_text();
    ASSERT_TRUE(tail);
    EXPECT_EQ(tail->text, u8", she said.");

    EXPECT_EQ(root->text_content(), u8"Hello, she said.");
    EXPECT_EQ(root->find_child(u8"said"), said);
}

TEST(Parse_Tree, references_are_decoded)
{
    Result<xml::Element, Parse_Error> root
        = parse_xml(u8R"(<p rend="a&amp;b">&lt;&#65;&#x42;&quot;&apos;&gt;</p>)");
    ASSERT_TRUE(root);
    EXPECT_EQ(*root->find_attribute(u8"rend"), u8"a&b");
    EXPECT_EQ(root->text_content(), u8"<AB\"'>");
}

TEST(Parse_Tree, cdata_is_literal)
{
    Result<xml::Element, Parse_Error> root = parse_xml(u8"<p>a<![CDATA[<b>&amp;]]>c</p>");
    ASSERT_TRUE(root);
    ASSERT_EQ(root->children.size(), 1);
    EXPECT_EQ(root->text_content(), u8"a<b>&amp;c");
}

TEST(Parse_Tree, line_breaks_are_normalized)
{
    Result<xml::Element, Parse_Error> root = parse_xml(u8"<p a=\"x\ty\">one\r\ntwo\rthree</p>");
    ASSERT_TRUE(root);
    EXPECT_EQ(*root->find_attribute(u8"a"), u8"x y");
    EXPECT_EQ(root->text_content(), u8"one\ntwo\nthree");
}

TEST(Parse_Tree, comments_are_dropped)
{
    Result<xml::Element, Parse_Error> root = parse_xml(u8"<p>one<!-- gone -->two<?pi x?></p>");
    ASSERT_TRUE(root);
    ASSERT_EQ(root->children.size(), 1);
    EXPECT_EQ(root->text_content(), u8"onetwo");
}

TEST(XML_Tree, attribute_editing)
{
    xml::Element element { .name = u8"said", .attributes = {}, .children = {} };
    element.set_attribute(u8"who", u8"#jane");
    element.set_attribute(u8"direct", u8"true");
    element.set_attribute(u8"who", u8"#lizzy");
    ASSERT_EQ(element.attributes.size(), 2);
    EXPECT_EQ(element.attributes[0], (xml::Attribute { u8"who", u8"#lizzy" }));

    EXPECT_TRUE(element.remove_attribute(u8"who"));
    EXPECT_FALSE(element.remove_attribute(u8"who"));
    ASSERT_EQ(element.attributes.size(), 1);
    EXPECT_EQ(element.attributes[0].name, u8"direct");
}

TEST(XML_Tree, normalize_text)
{
    std::vector<xml::Node> children;
    xml::append_text(children, u8"a");
    xml::append_text(children, u8"b");
    xml::append_text(children, u8"");
    ASSERT_EQ(children.size(), 1);

    children.push_back(xml::Node { xml::Text { u8"" } });
    children.push_back(xml::Node { xml::Element { .name = u8"lb", .attributes = {}, .children = {} } });
    children.push_back(xml::Node { xml::Text { u8"c" } });
    children.push_back(xml::Node { xml::Text { u8"d" } });
    xml::normalize_text(children);

    ASSERT_EQ(children.size(), 3);
    ASSERT_TRUE(children[0].as_text());
    EXPECT_EQ(children[0].as_text()->text, u8"ab");
    EXPECT_TRUE(children[1].is_element());
    ASSERT_TRUE(children[2].as_text());
    EXPECT_EQ(children[2].as_text()->text, u8"cd");
}

TEST(XML_Tree, element_at)
{
    Result<xml::Element, Parse_Error> root = parse_xml(u8"<TEI><text><body><p>x</p><p>y</p></body></text></TEI>");
    ASSERT_TRUE(root);
    const xml::Node_Path path { 0, 0, 1 };
    const xml::Element& p = xml::element_at(*root, path);
    EXPECT_EQ(p.name, u8"p");
    EXPECT_EQ(p.text_content(), u8"y");
    EXPECT_EQ(&xml::element_at(*root, {}), &*root);
}

TEST(Parse, error_code_names)
{
    EXPECT_EQ(parse_error_code_name(Parse_Error_Code::unclosed_element), u8"unclosed_element");
    EXPECT_EQ(parse_error_code_name(Parse_Error_Code::no_root_element), u8"no_root_element");
}

} // namespace
} // namespace parley
