#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "parley/util/result.hpp"

#include "parley/constraints.hpp"
#include "parley/delta.hpp"
#include "parley/document.hpp"
#include "parley/entities.hpp"
#include "parley/validation.hpp"
#include "parley/xml.hpp"

#include "test_data.hpp"

namespace parley {
namespace {

struct Validation_Test : testing::Test {
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

    [[nodiscard]]
    Result<void, Validation_Error> add(
        std::size_t index,
        Text_Range range,
        std::u8string_view type,
        const std::vector<xml::Attribute>& attributes = {}
    ) const
    {
        return validate_tag_addition(*document, *constraints, passage(index).id, range, type, attributes);
    }
};

TEST_F(Validation_Test, valid_additions)
{
    EXPECT_TRUE(add(2, range_of(2, u8"Mr. Bennet"), u8"persName", { { u8"ref", u8"#mr-bennet" } }));
    EXPECT_TRUE(add(2, range_of(2, u8"replied"), u8"said", { { u8"who", u8"#mr-bennet" }, { u8"direct", u8"false" } }));
    // Inside an existing tag.
    EXPECT_TRUE(add(1, range_of(1, u8"Mr. Bennet"), u8"persName"));
    // Around an existing tag.
    EXPECT_TRUE(add(1, range_of(1, u8"heard that Netherfield Park is"), u8"hi"));
    EXPECT_TRUE(add(2, { 0, 0 }, u8"lb"));
}

TEST_F(Validation_Test, passage_not_found)
{
    const auto result = validate_tag_addition(
        *document, *constraints, u8"passage-000000000000", { 0, 1 }, u8"persName", {}
    );
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Validation_Error_Code::passage_not_found);
    EXPECT_TRUE(result.error().fixes.empty());
}

TEST_F(Validation_Test, range_out_of_bounds)
{
    const std::size_t size = passage(2).content.size();
    const auto past_end = add(2, { 5, size + 10 }, u8"persName");
    ASSERT_FALSE(past_end);
    EXPECT_EQ(past_end.error().code, Validation_Error_Code::range_out_of_bounds);
    ASSERT_TRUE(past_end.error().first_fix());
    EXPECT_EQ(*past_end.error().first_fix(), Fix { Expand_Selection { { 5, size } } });

    const auto reversed = add(2, { 10, 5 }, u8"persName");
    ASSERT_FALSE(reversed);
    EXPECT_EQ(reversed.error().code, Validation_Error_Code::range_out_of_bounds);
    EXPECT_TRUE(reversed.error().fixes.empty());
}

TEST_F(Validation_Test, range_not_on_boundary)
{
    const std::optional<Document> cafe
        = parse_test_document(u8"<TEI><text><body><p>Café au lait</p></body></text></TEI>");
    ASSERT_TRUE(cafe);
    const Passage& p = cafe->get_passages()[0];
    ASSERT_EQ(p.content.size(), 13u);

    // The two code units of U+00E9 are at [3, 5).
    const auto result = validate_tag_addition(*cafe, *constraints, p.id, { 4, 8 }, u8"emph", {});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Validation_Error_Code::range_not_on_boundary);
    const std::vector<Fix> expected { Expand_Selection { { 3, 8 } } };
    EXPECT_EQ(result.error().fixes, expected);

    const auto end_inside = validate_tag_addition(*cafe, *constraints, p.id, { 0, 4 }, u8"emph", {});
    ASSERT_FALSE(end_inside);
    EXPECT_EQ(end_inside.error().fixes, std::vector<Fix> { Expand_Selection { { 0, 5 } } });
}

TEST_F(Validation_Test, unknown_tag_type)
{
    const auto typo = add(2, range_of(2, u8"Mr. Bennet"), u8"persname");
    ASSERT_FALSE(typo);
    EXPECT_EQ(typo.error().code, Validation_Error_Code::unknown_tag_type);
    EXPECT_EQ(typo.error().fixes, std::vector<Fix> { Change_Tag_Type { u8"persName" } });

    const auto unrelated = add(2, range_of(2, u8"Mr. Bennet"), u8"marginalia");
    ASSERT_FALSE(unrelated);
    EXPECT_EQ(unrelated.error().code, Validation_Error_Code::unknown_tag_type);
    EXPECT_TRUE(unrelated.error().fixes.empty());
}

TEST_F(Validation_Test, missing_required_reference)
{
    const auto result = add(2, range_of(2, u8"replied"), u8"said");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Validation_Error_Code::missing_required_attr);

    const std::vector<Fix> expected {
        Add_Attribute { u8"who", u8"" },
        Add_Attribute { u8"who", u8"#mr-bennet" },
        Add_Attribute { u8"who", u8"#mrs-bennet" },
        Add_Attribute { u8"who", u8"#bingley" },
        Add_Attribute { u8"who", u8"#netherfield" },
    };
    EXPECT_EQ(result.error().fixes, expected);
}

TEST_F(Validation_Test, missing_required_enumerated)
{
    const auto result = add(2, range_of(2, u8"replied"), u8"said", { { u8"who", u8"#mr-bennet" } });
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Validation_Error_Code::missing_required_attr);
    EXPECT_EQ(result.error().fixes, std::vector<Fix> { Add_Attribute { u8"direct", u8"true" } });
}

TEST_F(Validation_Test, missing_reference_without_entities)
{
    const std::optional<Document> bare
        = parse_test_document(u8"<TEI><text><body><p>Hello.</p></body></text></TEI>");
    ASSERT_TRUE(bare);
    const auto result = validate_tag_addition(
        *bare, *constraints, bare->get_passages()[0].id, { 0, 6 }, u8"said", {}
    );
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Validation_Error_Code::missing_required_attr);
    const std::vector<Fix> expected {
        Add_Attribute { u8"who", u8"" },
        Create_Entity { Entity_Kind::character, u8"" },
    };
    EXPECT_EQ(result.error().fixes, expected);
}

TEST_F(Validation_Test, unknown_attribute)
{
    const auto result = add(2, range_of(2, u8"Mr. Bennet"), u8"persName", { { u8"rend", u8"bold" } });
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Validation_Error_Code::unknown_attribute);
    EXPECT_EQ(result.error().fixes, std::vector<Fix> { Remove_Attribute { u8"rend" } });

    // Attributes in the xml namespace are always accepted.
    EXPECT_TRUE(add(2, range_of(2, u8"Mr. Bennet"), u8"persName", { { u8"xml:lang", u8"en" } }));
}

TEST_F(Validation_Test, invalid_enumerated_value)
{
    const auto result = add(
        2, range_of(2, u8"replied"), u8"said", { { u8"who", u8"#mr-bennet" }, { u8"direct", u8"ture" } }
    );
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Validation_Error_Code::invalid_attribute_value);
    const std::vector<Fix> expected {
        Change_Attribute { u8"direct", u8"true" },
        Change_Attribute { u8"direct", u8"false" },
    };
    EXPECT_EQ(result.error().fixes, expected);
}

TEST_F(Validation_Test, invalid_idref)
{
    const auto typo = add(
        2, range_of(2, u8"replied"), u8"said", { { u8"who", u8"#mrs-benet" }, { u8"direct", u8"true" } }
    );
    ASSERT_FALSE(typo);
    EXPECT_EQ(typo.error().code, Validation_Error_Code::invalid_idref);
    ASSERT_EQ(typo.error().fixes.size(), 4u);
    EXPECT_EQ(typo.error().fixes.front(), Fix { Change_Attribute { u8"who", u8"#mrs-bennet" } });

    const auto empty
        = add(2, range_of(2, u8"replied"), u8"said", { { u8"who", u8"" }, { u8"direct", u8"true" } });
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, Validation_Error_Code::invalid_idref);
}

TEST_F(Validation_Test, splits_existing_tag)
{
    // The first speech covers "My dear Mr. Bennet,".
    const Text_Range first = passage(1).tags[0].range;
    const Text_Range crossing { first.start + 8, first.end + 6 };
    const auto result = add(1, crossing, u8"emph");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Validation_Error_Code::splits_existing_tag);
    const std::vector<Fix> expected { Expand_Selection { { first.start, crossing.end } } };
    EXPECT_EQ(result.error().fixes, expected);
}

TEST_F(Validation_Test, child_not_allowed_by_parent)
{
    const auto result = add(1, range_of(1, u8"My dear"), u8"p");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Validation_Error_Code::child_not_allowed);
    EXPECT_EQ(result.error().fixes, std::vector<Fix> { Change_Tag_Type { u8"q" } });
}

TEST_F(Validation_Test, child_not_allowed_by_new_tag)
{
    const auto text_in_empty = add(2, range_of(2, u8"Mr. Bennet"), u8"lb");
    ASSERT_FALSE(text_in_empty);
    EXPECT_EQ(text_in_empty.error().code, Validation_Error_Code::child_not_allowed);

    // <persName> only allows text, but the range encloses the first speech.
    const Text_Range first = passage(1).tags[0].range;
    const auto element_in_text = add(1, { first.start, first.end + 6 }, u8"persName");
    ASSERT_FALSE(element_in_text);
    EXPECT_EQ(element_in_text.error().code, Validation_Error_Code::child_not_allowed);
}

TEST_F(Validation_Test, attribute_change)
{
    const Passage& p = passage(1);
    const Tag& said = p.tags[0];

    EXPECT_TRUE(validate_attribute_change(*document, *constraints, p.id, said.id, u8"direct", u8"false"));
    EXPECT_TRUE(validate_attribute_change(*document, *constraints, p.id, said.id, u8"toWhom", std::nullopt));
    EXPECT_TRUE(validate_attribute_change(*document, *constraints, p.id, said.id, u8"xml:id", u8"s1"));

    const auto removed = validate_attribute_change(*document, *constraints, p.id, said.id, u8"who", std::nullopt);
    ASSERT_FALSE(removed);
    EXPECT_EQ(removed.error().code, Validation_Error_Code::missing_required_attr);

    const auto invalid
        = validate_attribute_change(*document, *constraints, p.id, said.id, u8"direct", u8"maybe");
    ASSERT_FALSE(invalid);
    EXPECT_EQ(invalid.error().code, Validation_Error_Code::invalid_attribute_value);

    const auto unknown = validate_attribute_change(*document, *constraints, p.id, said.id, u8"rend", u8"x");
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, Validation_Error_Code::unknown_attribute);

    const auto no_tag
        = validate_attribute_change(*document, *constraints, p.id, u8"tag-000000000000", u8"n", u8"1");
    ASSERT_FALSE(no_tag);
    EXPECT_EQ(no_tag.error().code, Validation_Error_Code::tag_not_found);

    const auto no_passage
        = validate_attribute_change(*document, *constraints, u8"passage-x", said.id, u8"n", u8"1");
    ASSERT_FALSE(no_passage);
    EXPECT_EQ(no_passage.error().code, Validation_Error_Code::passage_not_found);
}

TEST_F(Validation_Test, tag_removal)
{
    const Passage& p = passage(1);
    EXPECT_TRUE(validate_tag_removal(*document, p.id, p.tags[2].id));

    const auto wrong_passage = validate_tag_removal(*document, passage(0).id, p.tags[2].id);
    ASSERT_FALSE(wrong_passage);
    EXPECT_EQ(wrong_passage.error().code, Validation_Error_Code::tag_not_found);

    const auto no_passage = validate_tag_removal(*document, u8"passage-x", p.tags[2].id);
    ASSERT_FALSE(no_passage);
    EXPECT_EQ(no_passage.error().code, Validation_Error_Code::passage_not_found);
}

TEST(Validation_Error, code_names)
{
    EXPECT_EQ(validation_error_code_name(Validation_Error_Code::missing_required_attr), u8"MISSING_REQUIRED_ATTR");
    EXPECT_EQ(validation_error_code_name(Validation_Error_Code::splits_existing_tag), u8"SPLITS_EXISTING_TAG");
    EXPECT_EQ(validation_error_code_name(Validation_Error_Code::entity_referenced), u8"ENTITY_REFERENCED");
}

// Entity deltas

struct Entity_Validation_Test : testing::Test {
    std::optional<Document> document;

    void SetUp() override
    {
        document = load_test_document(u8"test/documents/pride.xml");
        ASSERT_TRUE(document);
    }

    [[nodiscard]]
    const Entity_Set& entities() const
    {
        return document->get_entities();
    }

    [[nodiscard]]
    Result<void, Validation_Error> validate(Delta_Operation operation, Entity_Record record) const
    {
        const Entity_Delta delta { operation, record_kind(record), std::move(record), 0 };
        return validate_entity_delta(entities(), delta, &*document);
    }
};

[[nodiscard]]
Character make_character(std::u8string_view id, std::u8string_view xml_id, std::u8string_view name)
{
    Character result;
    result.id = id;
    result.xml_id = xml_id;
    result.name = name;
    return result;
}

[[nodiscard]]
Relationship make_relationship(
    std::u8string_view id,
    std::u8string_view from,
    std::u8string_view to,
    std::u8string_view type,
    bool mutual = false
)
{
    Relationship result;
    result.id = id;
    result.from = from;
    result.to = to;
    result.type = type;
    result.mutual = mutual;
    return result;
}

TEST_F(Entity_Validation_Test, create)
{
    EXPECT_TRUE(validate(Delta_Operation::create, make_character(u8"char-1", u8"jane", u8"Jane Bennet")));

    const auto no_name = validate(Delta_Operation::create, make_character(u8"char-1", u8"jane", u8"  "));
    ASSERT_FALSE(no_name);
    EXPECT_EQ(no_name.error().code, Validation_Error_Code::missing_name);

    const auto bad_xml_id
        = validate(Delta_Operation::create, make_character(u8"char-1", u8"jane bennet", u8"Jane Bennet"));
    ASSERT_FALSE(bad_xml_id);
    EXPECT_EQ(bad_xml_id.error().code, Validation_Error_Code::invalid_xml_id);
    EXPECT_EQ(bad_xml_id.error().fixes, std::vector<Fix> { Use_Xml_Id { u8"jane-bennet" } });

    const auto taken_id
        = validate(Delta_Operation::create, make_character(u8"char-bingley", u8"charles", u8"Charles"));
    ASSERT_FALSE(taken_id);
    EXPECT_EQ(taken_id.error().code, Validation_Error_Code::duplicate_id);

    const auto taken_xml_id
        = validate(Delta_Operation::create, make_character(u8"char-9", u8"bingley", u8"Caroline Bingley"));
    ASSERT_FALSE(taken_xml_id);
    EXPECT_EQ(taken_xml_id.error().code, Validation_Error_Code::duplicate_xml_id);
    EXPECT_EQ(taken_xml_id.error().fixes, std::vector<Fix> { Use_Xml_Id { u8"bingley-2" } });
}

TEST_F(Entity_Validation_Test, declared_kind_mismatch)
{
    const Entity_Delta delta { Delta_Operation::create, Entity_Kind::place,
                               make_character(u8"char-1", u8"jane", u8"Jane"), 0 };
    const auto result = validate_entity_delta(entities(), delta);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Validation_Error_Code::type_mismatch);
}

TEST_F(Entity_Validation_Test, update)
{
    Character bingley = std::get<Character>(*entities().find(u8"char-bingley"));
    bingley.age = 23;
    EXPECT_TRUE(validate(Delta_Operation::update, bingley));

    const auto missing = validate(Delta_Operation::update, make_character(u8"char-9", u8"x", u8"X"));
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, Validation_Error_Code::entity_not_found);

    Place as_place;
    as_place.id = u8"char-bingley";
    as_place.xml_id = u8"bingley";
    as_place.name = u8"Bingley";
    const auto kind_changed = validate(Delta_Operation::update, as_place);
    ASSERT_FALSE(kind_changed);
    EXPECT_EQ(kind_changed.error().code, Validation_Error_Code::type_mismatch);

    Character renamed = bingley;
    renamed.xml_id = u8"charles-bingley";
    const auto xml_id_changed = validate(Delta_Operation::update, renamed);
    ASSERT_FALSE(xml_id_changed);
    EXPECT_EQ(xml_id_changed.error().code, Validation_Error_Code::xml_id_immutable);
    EXPECT_EQ(xml_id_changed.error().fixes, std::vector<Fix> { Use_Xml_Id { u8"bingley" } });
}

TEST_F(Entity_Validation_Test, delete_referenced_by_relationship)
{
    const Entity& bingley = *entities().find(u8"char-bingley");
    const auto result = validate(Delta_Operation::remove, std::get<Character>(bingley));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Validation_Error_Code::entity_referenced);
    EXPECT_EQ(result.error().fixes, std::vector<Fix> { Archive_Entity { u8"char-bingley" } });

    const auto missing = validate(Delta_Operation::remove, make_character(u8"char-9", u8"x", u8"X"));
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, Validation_Error_Code::entity_not_found);
}

TEST_F(Entity_Validation_Test, delete_referenced_by_tag)
{
    const std::optional<Document> novel = load_test_document(u8"test/documents/novel.xml");
    ASSERT_TRUE(novel);
    const Entity_Set& novel_entities = novel->get_entities();
    const Entity_Delta delta { Delta_Operation::remove, Entity_Kind::character,
                               std::get<Character>(*novel_entities.find(u8"char-holmes")), 0 };

    EXPECT_TRUE(validate_entity_delta(novel_entities, delta));

    const auto result = validate_entity_delta(novel_entities, delta, &*novel);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Validation_Error_Code::entity_referenced);
    EXPECT_EQ(result.error().fixes, std::vector<Fix> { Archive_Entity { u8"char-holmes" } });
}

TEST_F(Entity_Validation_Test, relationships)
{
    EXPECT_TRUE(validate(
        Delta_Operation::create,
        make_relationship(u8"rel-1", u8"char-bingley", u8"char-mrs-bennet", u8"acquaintance")
    ));

    const auto no_type = validate(
        Delta_Operation::create, make_relationship(u8"rel-1", u8"char-bingley", u8"char-mrs-bennet", u8"")
    );
    ASSERT_FALSE(no_type);
    EXPECT_EQ(no_type.error().code, Validation_Error_Code::missing_name);

    const auto unknown = validate(
        Delta_Operation::create, make_relationship(u8"rel-1", u8"char-bingley", u8"char-darcy", u8"friend")
    );
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, Validation_Error_Code::unknown_entity);

    const auto duplicate = validate(
        Delta_Operation::create,
        make_relationship(u8"rel-1", u8"char-bingley", u8"place-netherfield", u8"tenant")
    );
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, Validation_Error_Code::duplicate_relationship);

    const auto taken_id = validate(
        Delta_Operation::create,
        make_relationship(u8"tenant-bingley", u8"char-bingley", u8"char-mr-bennet", u8"neighbor")
    );
    ASSERT_FALSE(taken_id);
    EXPECT_EQ(taken_id.error().code, Validation_Error_Code::duplicate_id);
}

TEST_F(Entity_Validation_Test, relationship_update_and_removal)
{
    Relationship marriage = *entities().find_relationship(u8"marriage-bennet");
    marriage.subtype = u8"unhappy";
    EXPECT_TRUE(validate(Delta_Operation::update, marriage));

    // The reciprocal record is maintained through its primary record.
    Relationship reciprocal = *entities().find_relationship(u8"marriage-bennet-reciprocal");
    const auto update_reciprocal = validate(Delta_Operation::update, reciprocal);
    ASSERT_FALSE(update_reciprocal);
    EXPECT_EQ(update_reciprocal.error().code, Validation_Error_Code::entity_not_found);

    EXPECT_TRUE(validate(Delta_Operation::remove, reciprocal));

    const auto missing = validate(
        Delta_Operation::remove, make_relationship(u8"rel-404", u8"char-bingley", u8"char-mr-bennet", u8"x")
    );
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, Validation_Error_Code::entity_not_found);
}

} // namespace
} // namespace parley
