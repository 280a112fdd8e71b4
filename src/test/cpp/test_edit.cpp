#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "parley/util/result.hpp"

#include "parley/delta.hpp"
#include "parley/document.hpp"
#include "parley/edit.hpp"
#include "parley/entities.hpp"
#include "parley/parse.hpp"
#include "parley/validation.hpp"
#include "parley/xml.hpp"

#include "test_data.hpp"

namespace parley {
namespace {

[[nodiscard]]
xml::Element parse_element(std::u8string_view markup)
{
    Result<xml::Element, Parse_Error> result = parse_xml(markup);
    if (!result) {
        ADD_FAILURE() << as_string_view(result.error().message);
        return {};
    }
    return std::move(*result);
}

[[nodiscard]]
std::vector<std::u8string> tag_ids(const Passage& passage)
{
    std::vector<std::u8string> result;
    for (const Tag& tag : passage.tags) {
        result.push_back(tag.id);
    }
    return result;
}

TEST(Locate_Tag_Placement, innermost_element)
{
    const xml::Element p = parse_element(u8"<p>a<hi>b<emph>cd</emph></hi>e</p>");

    const Tag_Placement outside = locate_tag_placement(p, { 0, 5 });
    EXPECT_TRUE(outside.parent_path.empty());
    EXPECT_EQ(outside.parent_start, 0u);

    const Tag_Placement in_hi = locate_tag_placement(p, { 1, 3 });
    EXPECT_EQ(in_hi.parent_path, xml::Node_Path { 1 });
    EXPECT_EQ(in_hi.parent_start, 1u);

    const Tag_Placement in_emph = locate_tag_placement(p, { 3, 4 });
    EXPECT_EQ(in_emph.parent_path, (xml::Node_Path { 1, 1 }));
    EXPECT_EQ(in_emph.parent_start, 2u);
}

TEST(Locate_Tag_Placement, empty_range_at_boundary)
{
    const xml::Element p = parse_element(u8"<p>a<hi>bc</hi>d</p>");
    EXPECT_TRUE(locate_tag_placement(p, { 1, 1 }).parent_path.empty());
    EXPECT_TRUE(locate_tag_placement(p, { 3, 3 }).parent_path.empty());
    EXPECT_EQ(locate_tag_placement(p, { 2, 2 }).parent_path, xml::Node_Path { 1 });
}

TEST(Split_Children, text_and_elements)
{
    const xml::Element p = parse_element(u8"<p>abc<hi>de</hi>fg</p>");

    const Split_Children split = split_children(p, 0, { 1, 6 });
    ASSERT_EQ(split.before.size(), 1u);
    EXPECT_EQ(split.before[0].as_text()->text, u8"a");
    ASSERT_EQ(split.inside.size(), 3u);
    EXPECT_EQ(split.inside[0].as_text()->text, u8"bc");
    EXPECT_EQ(split.inside[1].as_element()->name, u8"hi");
    EXPECT_EQ(split.inside[2].as_text()->text, u8"f");
    ASSERT_EQ(split.after.size(), 1u);
    EXPECT_EQ(split.after[0].as_text()->text, u8"g");

    const Split_Children empty = split_children(p, 0, { 3, 3 });
    EXPECT_EQ(empty.before.size(), 1u);
    EXPECT_TRUE(empty.inside.empty());
    EXPECT_EQ(empty.after.size(), 2u);
}

struct Edit_Test : testing::Test {
    std::optional<Document> document;
    std::optional<Constraint_Table> constraints;

    void SetUp() override
    {
        document = load_test_document(u8"test/documents/pride.xml");
        constraints = load_test_schema(u8"tei-all");
        ASSERT_TRUE(document);
        ASSERT_TRUE(constraints);
    }

    [[nodiscard]]
    const Passage& passage(std::size_t index) const
    {
        return document->get_passages()[index];
    }

    [[nodiscard]]
    Text_Range range_of(std::size_t index, std::u8string_view part) const
    {
        const std::size_t start = passage(index).content.find(part);
        EXPECT_NE(start, std::u8string::npos);
        return { start, start + part.size() };
    }
};

TEST_F(Edit_Test, add_tag)
{
    const std::vector<xml::Attribute> attributes { { u8"ref", u8"#mr-bennet" } };
    const Result<Document, Validation_Error> result = add_tag(
        *document, *constraints, passage(2).id, range_of(2, u8"Mr. Bennet"), u8"persName", attributes
    );
    ASSERT_TRUE(result);

    EXPECT_EQ(result->get_revision(), 1u);
    EXPECT_EQ(result->get_lineage(), document->get_lineage());
    EXPECT_FALSE(result->is_same_state(*document));

    const Passage& edited = result->get_passages()[2];
    EXPECT_EQ(edited.id, passage(2).id);
    EXPECT_EQ(edited.content, passage(2).content);
    ASSERT_EQ(edited.tags.size(), 1u);
    EXPECT_EQ(edited.tags[0].type, u8"persName");
    EXPECT_EQ(edited.tags[0].range, range_of(2, u8"Mr. Bennet"));
    EXPECT_EQ(edited.tags[0].attributes, attributes);

    const xml::Element& element = xml::element_at(result->get_root(), edited.path);
    ASSERT_EQ(element.children.size(), 2u);
    EXPECT_EQ(element.children[0].as_element()->text_content(), u8"Mr. Bennet");
    EXPECT_EQ(element.children[1].as_text()->text, u8" replied that he had not.");

    // The original document is unaffected.
    EXPECT_EQ(document->get_revision(), 0u);
    EXPECT_TRUE(passage(2).tags.empty());
    EXPECT_EQ(result->find_referencing_tags(u8"mr-bennet").size(), 3u);
    EXPECT_EQ(document->find_referencing_tags(u8"mr-bennet").size(), 2u);
}

TEST_F(Edit_Test, tag_ids_are_stable)
{
    const std::vector<std::u8string> before = tag_ids(passage(1));
    const Result<Document, Validation_Error> result
        = add_tag(*document, *constraints, passage(1).id, range_of(1, u8"Mr. Bennet"), u8"persName");
    ASSERT_TRUE(result);

    const Passage& edited = result->get_passages()[1];
    ASSERT_EQ(edited.tags.size(), 4u);
    for (const std::u8string& id : before) {
        EXPECT_TRUE(edited.find_tag(id)) << as_string_view(id);
    }
    // The new tag is nested in the first speech.
    EXPECT_EQ(edited.tags[1].type, u8"persName");
    EXPECT_EQ(edited.tags[1].path.size(), 2u);

    // Other passages are untouched.
    EXPECT_EQ(result->get_passages()[4], passage(4));
    EXPECT_EQ(result->get_dialogue().size(), document->get_dialogue().size());
}

TEST_F(Edit_Test, add_tag_around_existing)
{
    const Result<Document, Validation_Error> result = add_tag(
        *document, *constraints, passage(1).id, range_of(1, u8"heard that Netherfield Park is"), u8"hi"
    );
    ASSERT_TRUE(result);
    const Passage& edited = result->get_passages()[1];
    ASSERT_EQ(edited.tags.size(), 4u);
    EXPECT_EQ(edited.tags[2].type, u8"hi");
    EXPECT_EQ(edited.tags[3].type, u8"placeName");
    EXPECT_TRUE(edited.tags[2].range.contains(edited.tags[3].range));
    EXPECT_EQ(edited.tags[3].id, passage(1).tags[2].id);
}

TEST_F(Edit_Test, rejected_addition)
{
    const Result<Document, Validation_Error> result
        = add_tag(*document, *constraints, passage(2).id, range_of(2, u8"replied"), u8"said");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Validation_Error_Code::missing_required_attr);
    EXPECT_EQ(document->get_revision(), 0u);
    EXPECT_TRUE(passage(2).tags.empty());
}

TEST_F(Edit_Test, remove_tag)
{
    const Tag& place = passage(1).tags[2];
    const Result<Document, Validation_Error> result = remove_tag(*document, passage(1).id, place.id);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->get_revision(), 1u);

    const Passage& edited = result->get_passages()[1];
    EXPECT_EQ(edited.content, passage(1).content);
    ASSERT_EQ(edited.tags.size(), 2u);
    EXPECT_FALSE(edited.find_tag(place.id));
    EXPECT_EQ(tag_ids(edited), (std::vector<std::u8string> { passage(1).tags[0].id, passage(1).tags[1].id }));

    // The text around the removed tag is merged.
    const xml::Element& said = xml::element_at(xml::element_at(result->get_root(), edited.path), edited.tags[1].path);
    ASSERT_EQ(said.children.size(), 1u);
    EXPECT_EQ(said.children[0].as_text()->text, u8"have you heard that Netherfield Park is let at last?");

    EXPECT_TRUE(result->find_referencing_tags(u8"netherfield").empty());
}

TEST_F(Edit_Test, remove_then_add_restores_id)
{
    const Tag place = passage(1).tags[2];
    const Result<Document, Validation_Error> removed = remove_tag(*document, passage(1).id, place.id);
    ASSERT_TRUE(removed);
    const Result<Document, Validation_Error> added = add_tag(
        *removed, *constraints, passage(1).id, place.range, place.type, place.attributes
    );
    ASSERT_TRUE(added);
    EXPECT_EQ(added->get_revision(), 2u);
    EXPECT_EQ(added->get_passages()[1], passage(1));
}

TEST_F(Edit_Test, remove_missing_tag)
{
    const Result<Document, Validation_Error> result
        = remove_tag(*document, passage(1).id, u8"tag-000000000000");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Validation_Error_Code::tag_not_found);
}

TEST_F(Edit_Test, set_and_remove_attribute)
{
    const Passage& p = passage(1);
    const Tag& said = p.tags[1];

    const Result<Document, Validation_Error> addressed
        = set_tag_attribute(*document, *constraints, p.id, said.id, u8"toWhom", u8"#mr-bennet");
    ASSERT_TRUE(addressed);
    EXPECT_EQ(addressed->get_dialogue()[1].addressee, u8"mr-bennet");
    ASSERT_TRUE(addressed->find_tag(said.id));
    EXPECT_EQ(*addressed->find_tag(said.id)->find_attribute(u8"toWhom"), u8"#mr-bennet");

    const Result<Document, Validation_Error> indirect
        = set_tag_attribute(*addressed, *constraints, p.id, said.id, u8"direct", u8"false");
    ASSERT_TRUE(indirect);
    EXPECT_EQ(*indirect->find_tag(said.id)->find_attribute(u8"direct"), u8"false");
    EXPECT_EQ(indirect->get_revision(), 2u);

    const Result<Document, Validation_Error> unaddressed
        = remove_tag_attribute(*indirect, *constraints, p.id, said.id, u8"toWhom");
    ASSERT_TRUE(unaddressed);
    EXPECT_TRUE(unaddressed->get_dialogue()[1].addressee.empty());
    EXPECT_FALSE(unaddressed->find_tag(said.id)->find_attribute(u8"toWhom"));
}

TEST_F(Edit_Test, rejected_attribute_changes)
{
    const Passage& p = passage(1);
    const Tag& said = p.tags[0];

    const Result<Document, Validation_Error> no_speaker
        = remove_tag_attribute(*document, *constraints, p.id, said.id, u8"who");
    ASSERT_FALSE(no_speaker);
    EXPECT_EQ(no_speaker.error().code, Validation_Error_Code::missing_required_attr);

    const Result<Document, Validation_Error> unknown_speaker
        = set_tag_attribute(*document, *constraints, p.id, said.id, u8"who", u8"#lizzy");
    ASSERT_FALSE(unknown_speaker);
    EXPECT_EQ(unknown_speaker.error().code, Validation_Error_Code::invalid_idref);

    EXPECT_EQ(*passage(1).tags[0].find_attribute(u8"who"), u8"#mrs-bennet");
}

TEST_F(Edit_Test, apply_entity_delta)
{
    Character jane;
    jane.id = u8"char-1";
    jane.xml_id = u8"jane-bennet";
    jane.name = u8"Jane Bennet";
    const Entity_Delta delta { Delta_Operation::create, Entity_Kind::character, jane, 0 };

    const Result<Document, Validation_Error> result = apply_entity_delta(*document, delta);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->get_revision(), 1u);
    EXPECT_TRUE(result->get_entities().find(u8"char-1"));
    EXPECT_FALSE(document->get_entities().find(u8"char-1"));
    EXPECT_EQ(result->get_passages().size(), document->get_passages().size());

    // Jane can now be named as a speaker.
    const std::vector<xml::Attribute> attributes { { u8"who", u8"#jane-bennet" }, { u8"direct", u8"true" } };
    EXPECT_TRUE(add_tag(*result, *constraints, passage(2).id, range_of(2, u8"replied"), u8"said", attributes));
}

TEST_F(Edit_Test, delete_entity_referenced_by_tag)
{
    const Character& bennet = std::get<Character>(*document->get_entities().find(u8"char-mr-bennet"));
    const Entity_Delta delta { Delta_Operation::remove, Entity_Kind::character, bennet, 0 };
    const Result<Document, Validation_Error> result = apply_entity_delta(*document, delta);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Validation_Error_Code::entity_referenced);
}

} // namespace
} // namespace parley
