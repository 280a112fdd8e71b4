#ifndef PARLEY_XML_HPP
#define PARLEY_XML_HPP

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "parley/util/assert.hpp"

#include "parley/fwd.hpp"

namespace parley::xml {

struct Attribute {
    std::u8string name;
    std::u8string value;

    [[nodiscard]]
    friend bool operator==(const Attribute&, const Attribute&)
        = default;
};

struct Text {
    std::u8string text;

    [[nodiscard]]
    friend bool operator==(const Text&, const Text&)
        = default;
};

/// @brief An element with its attributes in source order and its children.
/// Comments, processing instructions and the document type declaration
/// are not part of the tree.
struct Element {
    std::u8string name;
    std::vector<Attribute> attributes;
    std::vector<Node> children;

    /// @brief Returns the value of the attribute with the given name,
    /// or a null pointer if there is no such attribute.
    [[nodiscard]]
    const std::u8string* find_attribute(std::u8string_view attribute_name) const;

    /// @brief Sets the attribute with the given name,
    /// appending a new attribute if none exists yet.
    void set_attribute(std::u8string_view attribute_name, std::u8string_view value);

    /// @brief Removes the attribute with the given name.
    /// @return `true` if an attribute was removed.
    bool remove_attribute(std::u8string_view attribute_name);

    /// @brief Returns the first child element with the given name, or a null pointer.
    [[nodiscard]]
    const Element* find_child(std::u8string_view child_name) const;

    /// @brief Returns the concatenation of all descendant text, in document order.
    [[nodiscard]]
    std::u8string text_content() const;

    [[nodiscard]]
    friend bool operator==(const Element&, const Element&);
};

struct Node {
    std::variant<Element, Text> value;

    [[nodiscard]]
    bool is_element() const noexcept
    {
        return std::holds_alternative<Element>(value);
    }

    [[nodiscard]]
    bool is_text() const noexcept
    {
        return std::holds_alternative<Text>(value);
    }

    [[nodiscard]]
    const Element* as_element() const noexcept
    {
        return std::get_if<Element>(&value);
    }

    [[nodiscard]]
    Element* as_element() noexcept
    {
        return std::get_if<Element>(&value);
    }

    [[nodiscard]]
    const Text* as_text() const noexcept
    {
        return std::get_if<Text>(&value);
    }

    [[nodiscard]]
    Text* as_text() noexcept
    {
        return std::get_if<Text>(&value);
    }

    [[nodiscard]]
    friend bool operator==(const Node&, const Node&)
        = default;
};

/// @brief A sequence of child indices leading from some element to one of its descendants.
using Node_Path = std::vector<std::size_t>;

/// @brief Returns the element reached by following `path` from `root`.
/// Every index in `path` shall refer to an element child.
[[nodiscard]]
const Element& element_at(const Element& root, std::span<const std::size_t> path);
[[nodiscard]]
Element& element_at(Element& root, std::span<const std::size_t> path);

/// @brief Receives the nodes of a tree in document order.
struct Node_Visitor {
    /// @brief Called when an element is entered.
    /// @return `false` to skip the element's children and the matching `leave`.
    virtual bool enter(const Element& element) = 0;
    virtual void leave(const Element& element) = 0;
    virtual void text(const Text& text) = 0;
};

/// @brief Traverses `node` and its descendants in document order.
void walk(const Node& node, Node_Visitor& visitor);

/// @brief Traverses `element` and its descendants in document order.
void walk(const Element& element, Node_Visitor& visitor);

/// @brief Appends `text` to `children`, merging it into a preceding text node if there is one.
/// Empty text is not appended.
void append_text(std::vector<Node>& children, std::u8string_view text);

/// @brief Merges adjacent text nodes and removes empty ones among `children`.
void normalize_text(std::vector<Node>& children);

} // namespace parley::xml

#endif
