#ifndef PARLEY_DOCUMENT_HPP
#define PARLEY_DOCUMENT_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parley/util/assert.hpp"
#include "parley/util/result.hpp"

#include "parley/entities.hpp"
#include "parley/fwd.hpp"
#include "parley/parse.hpp"
#include "parley/services.hpp"
#include "parley/xml.hpp"

namespace parley {

/// @brief A half-open range `[start, end)` of UTF-8 code units within the content of a passage.
struct Text_Range {
    std::size_t start = 0;
    std::size_t end = 0;

    [[nodiscard]]
    constexpr std::size_t length() const noexcept
    {
        return end - start;
    }

    [[nodiscard]]
    constexpr bool empty() const noexcept
    {
        return start == end;
    }

    /// @brief Returns `true` if `other` lies entirely within this range.
    [[nodiscard]]
    constexpr bool contains(const Text_Range& other) const noexcept
    {
        return start <= other.start && other.end <= end;
    }

    /// @brief Returns `true` if the ranges share at least one code unit.
    [[nodiscard]]
    constexpr bool intersects(const Text_Range& other) const noexcept
    {
        return start < other.end && other.start < end;
    }

    /// @brief Returns `true` if the ranges intersect, but neither contains the other.
    [[nodiscard]]
    constexpr bool partially_overlaps(const Text_Range& other) const noexcept
    {
        return intersects(other) && !contains(other) && !other.contains(*this);
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Text_Range&, const Text_Range&)
        = default;
};

/// @brief An element nested within a passage, seen as a typed span over the passage content.
struct Tag {
    std::u8string id;
    /// @brief The element name, like `said`.
    std::u8string type;
    std::vector<xml::Attribute> attributes;
    Text_Range range;
    /// @brief The location of the element relative to the passage element.
    xml::Node_Path path;

    [[nodiscard]]
    const std::u8string* find_attribute(std::u8string_view name) const;

    [[nodiscard]]
    friend bool operator==(const Tag&, const Tag&)
        = default;
};

/// @brief A block-level unit of text, such as a paragraph or a verse line.
struct Passage {
    std::u8string id;
    /// @brief The position of the passage among all passages, in document order.
    std::size_t index;
    /// @brief The concatenated character data of the passage element.
    std::u8string content;
    /// @brief The tags within this passage, in document (pre-)order.
    std::vector<Tag> tags;
    /// @brief The location of the passage element relative to the root element.
    xml::Node_Path path;

    [[nodiscard]]
    const Tag* find_tag(std::u8string_view tag_id) const;

    [[nodiscard]]
    friend bool operator==(const Passage&, const Passage&)
        = default;
};

/// @brief One utterance, derived from a speech tag.
struct Dialogue_Span {
    /// @brief The id of the speech tag from which this span is derived.
    std::u8string id;
    std::u8string passage_id;
    /// @brief The xml id of the speaker, or an empty string if unknown.
    std::u8string speaker;
    /// @brief The xml id of the addressee, or an empty string if unknown.
    std::u8string addressee;
    std::u8string content;
    Text_Range range;

    [[nodiscard]]
    friend bool operator==(const Dialogue_Span&, const Dialogue_Span&)
        = default;
};

struct Document_Metadata {
    std::u8string title;
    std::u8string author;

    [[nodiscard]]
    friend bool operator==(const Document_Metadata&, const Document_Metadata&)
        = default;
};

/// @brief Returns `true` if elements named `name` are block-level text units.
[[nodiscard]]
bool is_passage_element(std::u8string_view name);

/// @brief Returns `true` if elements named `name` represent speech.
[[nodiscard]]
bool is_speech_element(std::u8string_view name);

/// @brief Returns `true` if the attribute named `name` holds pointers to entities,
/// like `who="#jane"`.
[[nodiscard]]
bool is_reference_attribute(std::u8string_view name);

/// @brief The immutable state of a document at one revision.
struct Document_Data {
    /// @brief Identifies the sequence of revisions that started with one `load_document` call.
    /// Two documents with the same lineage and revision have the same state.
    std::uint64_t lineage;
    /// @brief The markup text from which the document was loaded.
    /// It is not updated by mutations; use `serialize_document` to obtain current markup.
    std::u8string source_text;
    xml::Element root;
    std::uint64_t revision = 0;
    Document_Metadata metadata;
    std::vector<Passage> passages;
    std::vector<Dialogue_Span> dialogue;
    Entity_Set entities;
};

/// @brief A cheaply copyable handle to an immutable `Document_Data`.
/// Mutations produce new documents; a rejected mutation returns nothing new,
/// so the caller's document keeps referring to the same data.
struct Document {
private:
    std::shared_ptr<const Document_Data> m_data;

public:
    [[nodiscard]]
    explicit Document(std::shared_ptr<const Document_Data> data)
        : m_data { std::move(data) }
    {
        PARLEY_ASSERT(m_data);
    }

    [[nodiscard]]
    const Document_Data& get_data() const
    {
        return *m_data;
    }

    /// @brief Returns `true` if both handles refer to the very same state.
    [[nodiscard]]
    bool is_same_state(const Document& other) const
    {
        return m_data == other.m_data;
    }

    [[nodiscard]]
    std::uint64_t get_lineage() const
    {
        return m_data->lineage;
    }

    [[nodiscard]]
    std::uint64_t get_revision() const
    {
        return m_data->revision;
    }

    [[nodiscard]]
    const xml::Element& get_root() const
    {
        return m_data->root;
    }

    [[nodiscard]]
    std::span<const Passage> get_passages() const
    {
        return m_data->passages;
    }

    [[nodiscard]]
    std::span<const Dialogue_Span> get_dialogue() const
    {
        return m_data->dialogue;
    }

    [[nodiscard]]
    const Entity_Set& get_entities() const
    {
        return m_data->entities;
    }

    [[nodiscard]]
    const Document_Metadata& get_metadata() const
    {
        return m_data->metadata;
    }

    [[nodiscard]]
    const Passage* find_passage(std::u8string_view passage_id) const;

    /// @brief Returns the tag with the given id, searching all passages.
    [[nodiscard]]
    const Tag* find_tag(std::u8string_view tag_id) const;

    /// @brief Returns the tags which point to the entity with the given xml id
    /// through a reference attribute, in document order.
    [[nodiscard]]
    std::vector<const Tag*> find_referencing_tags(std::u8string_view xml_id) const;
};

/// @brief Parses markup text into a document at revision zero.
/// Malformed standoff records are logged and skipped rather than failing the whole document.
[[nodiscard]]
Result<Document, Parse_Error> load_document(std::u8string_view text, Logger& logger = ignorant_logger);

/// @brief Recomputes the passages, tags and dialogue of `data` from `data.root`.
/// Entities and metadata are left unchanged.
void rebuild_text_index(Document_Data& data);

/// @brief Returns a new lineage value which differs from all previously returned values.
[[nodiscard]]
std::uint64_t next_document_lineage();

} // namespace parley

#endif
