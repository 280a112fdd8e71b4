#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "parley/util/result.hpp"

#include "parley/collecting_logger.hpp"
#include "parley/constraints.hpp"
#include "parley/diagnostic.hpp"

#include "test_data.hpp"

namespace parley {
namespace {

[[nodiscard]]
std::optional<Constraint_Table> compile(std::u8string_view grammar, Logger& logger = ignorant_logger)
{
    Result<Constraint_Table, Schema_Parse_Error> result = compile_constraints(grammar, logger);
    if (!result) {
        ADD_FAILURE() << "Compilation failed: " << as_string_view(result.error().message);
        return {};
    }
    return std::move(*result);
}

TEST(Compile_Constraints, speech_attributes)
{
    const std::optional<Constraint_Table> table = load_test_schema(u8"tei-all");
    ASSERT_TRUE(table);

    const Tag_Constraint* const said = table->find_tag(u8"said");
    ASSERT_TRUE(said);

    const std::vector<std::u8string> required { u8"who", u8"direct" };
    EXPECT_EQ(said->required_attributes, required);
    const std::vector<std::u8string> optional { u8"xml:id", u8"n", u8"toWhom", u8"aloud" };
    EXPECT_EQ(said->optional_attributes, optional);

    EXPECT_TRUE(said->is_required(u8"who"));
    EXPECT_FALSE(said->is_required(u8"toWhom"));
    EXPECT_FALSE(said->find_attribute(u8"rend"));

    const Attribute_Constraint* const who = table->find_attribute(u8"said", u8"who");
    ASSERT_TRUE(who);
    EXPECT_EQ(who->type, Attribute_Type::idref);

    const Attribute_Constraint* const direct = table->find_attribute(u8"said", u8"direct");
    ASSERT_TRUE(direct);
    EXPECT_EQ(direct->type, Attribute_Type::enumerated);
    const std::vector<std::u8string> values { u8"true", u8"false" };
    EXPECT_EQ(direct->allowed_values, values);

    const Attribute_Constraint* const id = table->find_attribute(u8"said", u8"xml:id");
    ASSERT_TRUE(id);
    EXPECT_EQ(id->type, Attribute_Type::id);

    const Attribute_Constraint* const rend = table->find_attribute(u8"hi", u8"rend");
    ASSERT_TRUE(rend);
    EXPECT_EQ(rend->type, Attribute_Type::token);

    const Attribute_Constraint* const type = table->find_attribute(u8"div", u8"type");
    ASSERT_TRUE(type);
    EXPECT_EQ(type->type, Attribute_Type::ncname);
}

TEST(Compile_Constraints, content_models)
{
    const std::optional<Constraint_Table> table = load_test_schema(u8"tei-all");
    ASSERT_TRUE(table);

    const Content_Model* const p = table->find_content_model(u8"p");
    ASSERT_TRUE(p);
    EXPECT_TRUE(p->mixed_content);
    EXPECT_FALSE(p->text_only);
    EXPECT_FALSE(p->inferred);
    const std::vector<std::u8string> phrase { u8"said", u8"q",  u8"persName", u8"placeName", u8"orgName",
                                              u8"rs",   u8"hi", u8"emph",     u8"lb" };
    EXPECT_EQ(p->allowed_children, phrase);
    EXPECT_TRUE(p->allows_text());
    EXPECT_TRUE(p->allows_child(u8"said"));
    EXPECT_FALSE(p->allows_child(u8"p"));

    const Content_Model* const pers_name = table->find_content_model(u8"persName");
    ASSERT_TRUE(pers_name);
    EXPECT_TRUE(pers_name->text_only);
    EXPECT_TRUE(pers_name->allowed_children.empty());

    const Content_Model* const lb = table->find_content_model(u8"lb");
    ASSERT_TRUE(lb);
    EXPECT_FALSE(lb->allows_text());
    EXPECT_TRUE(lb->allowed_children.empty());
    EXPECT_FALSE(lb->inferred);

    const Content_Model* const lg = table->find_content_model(u8"lg");
    ASSERT_TRUE(lg);
    EXPECT_FALSE(lg->allows_text());
    EXPECT_EQ(lg->allowed_children, std::vector<std::u8string> { u8"l" });

    EXPECT_TRUE(table->unrecognized.empty());
    EXPECT_FALSE(table->find_tag(u8"foreign"));
}

TEST(Compile_Constraints, tag_names_sorted)
{
    const std::optional<Constraint_Table> table = load_test_schema(u8"tei-novel");
    ASSERT_TRUE(table);
    const std::vector<std::u8string_view> names = table->tag_names();
    EXPECT_TRUE(std::ranges::is_sorted(names));
    EXPECT_TRUE(std::ranges::find(names, u8"said") != names.end());
    EXPECT_TRUE(std::ranges::find(names, u8"rs") == names.end());
    EXPECT_EQ(names.size(), table->tags.size());
}

TEST(Compile_Constraints, name_classes_are_unrecognized)
{
    Collecting_Logger logger;
    Result<Constraint_Table, Schema_Parse_Error> table
        = compile_constraints(load_test_file(u8"schemas/tei-minimal.rng"), logger);
    ASSERT_TRUE(table);

    ASSERT_FALSE(table->unrecognized.empty());
    for (const Unrecognized_Pattern& pattern : table->unrecognized) {
        EXPECT_EQ(pattern.pattern, u8"element (name class)");
    }
    const Unrecognized_Pattern in_header { u8"element (name class)", u8"teiHeader" };
    EXPECT_TRUE(std::ranges::find(table->unrecognized, in_header) != table->unrecognized.end());
    EXPECT_TRUE(logger.was_logged(diagnostic::schema_pattern_unrecognized));

    // Free-text speech attributes.
    const Attribute_Constraint* const who = table->find_attribute(u8"said", u8"who");
    ASSERT_TRUE(who);
    EXPECT_EQ(who->type, Attribute_Type::string);
    EXPECT_TRUE(table->find_tag(u8"said")->required_attributes.empty());
}

TEST(Compile_Constraints, content_defaulted_to_text)
{
    Collecting_Logger logger;
    Result<Constraint_Table, Schema_Parse_Error> table
        = compile_constraints(load_test_file(u8"schemas/tei-minimal.rng"), logger);
    ASSERT_TRUE(table);

    const Content_Model* const foreign = table->find_content_model(u8"foreign");
    ASSERT_TRUE(foreign);
    EXPECT_TRUE(foreign->text_only);
    EXPECT_TRUE(foreign->inferred);
    EXPECT_EQ(logger.count(diagnostic::schema_content_defaulted), 1u);

    // An element with only an attribute has empty content, which is not inferred.
    const Content_Model* const div = table->find_content_model(u8"div");
    ASSERT_TRUE(div);
    EXPECT_FALSE(div->inferred);
}

TEST(Compile_Constraints, inline_grammar)
{
    constexpr std::u8string_view grammar = u8R"(
<grammar xmlns="http://relaxng.org/ns/structure/1.0">
  <start>
    <element name="p">
      <zeroOrMore>
        <element>
          <name>q</name>
          <attribute name="type">
            <choice>
              <data type="string"/>
              <value>spoken</value>
            </choice>
          </attribute>
          <text/>
        </element>
      </zeroOrMore>
    </element>
  </start>
</grammar>)";
    const std::optional<Constraint_Table> table = compile(grammar);
    ASSERT_TRUE(table);
    ASSERT_EQ(table->tags.size(), 2u);

    const Content_Model* const p = table->find_content_model(u8"p");
    ASSERT_TRUE(p);
    EXPECT_FALSE(p->allows_text());
    EXPECT_EQ(p->allowed_children, std::vector<std::u8string> { u8"q" });

    const Tag_Constraint* const q = table->find_tag(u8"q");
    ASSERT_TRUE(q);
    EXPECT_TRUE(q->is_required(u8"type"));
    const Attribute_Constraint* const type = q->find_attribute(u8"type");
    ASSERT_TRUE(type);
    EXPECT_EQ(type->type, Attribute_Type::string);
    EXPECT_TRUE(type->allowed_values.empty());
}

TEST(Compile_Constraints, prefixed_grammar)
{
    constexpr std::u8string_view grammar = u8R"(
<rng:grammar xmlns:rng="http://relaxng.org/ns/structure/1.0">
  <rng:start>
    <rng:element name="said">
      <rng:attribute name="who"/>
      <rng:mixed><rng:empty/></rng:mixed>
    </rng:element>
  </rng:start>
</rng:grammar>)";
    const std::optional<Constraint_Table> table = compile(grammar);
    ASSERT_TRUE(table);
    const Tag_Constraint* const said = table->find_tag(u8"said");
    ASSERT_TRUE(said);
    EXPECT_TRUE(said->is_required(u8"who"));
    EXPECT_TRUE(said->content.mixed_content);
}

TEST(Compile_Constraints, required_declaration_wins)
{
    constexpr std::u8string_view grammar = u8R"(
<grammar xmlns="http://relaxng.org/ns/structure/1.0">
  <define name="att.who">
    <optional><attribute name="who"/></optional>
  </define>
  <start>
    <element name="said">
      <ref name="att.who"/>
      <attribute name="who"/>
      <text/>
    </element>
  </start>
</grammar>)";
    const std::optional<Constraint_Table> table = compile(grammar);
    ASSERT_TRUE(table);
    const Tag_Constraint* const said = table->find_tag(u8"said");
    ASSERT_TRUE(said);
    EXPECT_EQ(said->required_attributes, std::vector<std::u8string> { u8"who" });
    EXPECT_TRUE(said->optional_attributes.empty());
}

TEST(Compile_Constraints, unresolved_and_circular_references)
{
    constexpr std::u8string_view grammar = u8R"(
<grammar xmlns="http://relaxng.org/ns/structure/1.0">
  <define name="a"><ref name="b"/></define>
  <define name="b"><ref name="a"/></define>
  <start>
    <element name="p">
      <ref name="a"/>
      <ref name="missing"/>
      <text/>
    </element>
  </start>
</grammar>)";
    Collecting_Logger logger;
    const std::optional<Constraint_Table> table = compile(grammar, logger);
    ASSERT_TRUE(table);
    EXPECT_TRUE(table->find_tag(u8"p"));
    EXPECT_TRUE(logger.was_logged(diagnostic::schema_ref_circular));
    EXPECT_TRUE(logger.was_logged(diagnostic::schema_ref_unresolved));
}

TEST(Compile_Constraints, unsupported_patterns)
{
    constexpr std::u8string_view grammar = u8R"(
<grammar xmlns="http://relaxng.org/ns/structure/1.0">
  <include href="tei-core.rng"/>
  <start>
    <element name="p">
      <parentRef name="x"/>
      <text/>
    </element>
  </start>
</grammar>)";
    Collecting_Logger logger;
    const std::optional<Constraint_Table> table = compile(grammar, logger);
    ASSERT_TRUE(table);

    const std::vector<Unrecognized_Pattern> expected {
        { u8"include", u8"" },
        { u8"parentRef", u8"p" },
    };
    EXPECT_EQ(table->unrecognized, expected);
    EXPECT_EQ(logger.count(diagnostic::schema_pattern_unrecognized), 2u);
}

TEST(Compile_Constraints, malformed)
{
    Result<Constraint_Table, Schema_Parse_Error> result = compile_constraints(u8"<grammar><start>");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Schema_Parse_Error_Code::malformed);
}

TEST(Compile_Constraints, no_grammar)
{
    Result<Constraint_Table, Schema_Parse_Error> result = compile_constraints(u8"<schema/>");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Schema_Parse_Error_Code::no_grammar);
}

} // namespace
} // namespace parley
