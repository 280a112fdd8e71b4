#include <algorithm>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parley/util/assert.hpp"

#include "parley/xml.hpp"

namespace parley::xml {

const std::u8string* Element::find_attribute(std::u8string_view attribute_name) const
{
    const auto it = std::ranges::find(attributes, attribute_name, &Attribute::name);
    return it == attributes.end() ? nullptr : &it->value;
}

void Element::set_attribute(std::u8string_view attribute_name, std::u8string_view value)
{
    const auto it = std::ranges::find(attributes, attribute_name, &Attribute::name);
    if (it == attributes.end()) {
        attributes.push_back({ std::u8string { attribute_name }, std::u8string { value } });
    }
    else {
        it->value = value;
    }
}

bool Element::remove_attribute(std::u8string_view attribute_name)
{
    return std::erase_if(attributes, [&](const Attribute& a) { return a.name == attribute_name; })
        != 0;
}

const Element* Element::find_child(std::u8string_view child_name) const
{
    for (const Node& child : children) {
        if (const Element* const e = child.as_element(); e && e->name == child_name) {
            return e;
        }
    }
    return nullptr;
}

namespace {

void append_text_content(std::u8string& out, const Element& element)
{
    for (const Node& child : element.children) {
        if (const Text* const t = child.as_text()) {
            out += t->text;
        }
        else {
            append_text_content(out, *child.as_element());
        }
    }
}

} // namespace

std::u8string Element::text_content() const
{
    std::u8string result;
    append_text_content(result, *this);
    return result;
}

bool operator==(const Element& x, const Element& y)
{
    return x.name == y.name && x.attributes == y.attributes && x.children == y.children;
}

const Element& element_at(const Element& root, std::span<const std::size_t> path)
{
    const Element* current = &root;
    for (const std::size_t index : path) {
        PARLEY_ASSERT(index < current->children.size());
        current = current->children[index].as_element();
        PARLEY_ASSERT(current);
    }
    return *current;
}

Element& element_at(Element& root, std::span<const std::size_t> path)
{
    return const_cast<Element&>(element_at(std::as_const(root), path)); // NOLINT
}

void walk(const Node& node, Node_Visitor& visitor)
{
    if (const Text* const t = node.as_text()) {
        visitor.text(*t);
        return;
    }
    walk(*node.as_element(), visitor);
}

void walk(const Element& element, Node_Visitor& visitor)
{
    if (!visitor.enter(element)) {
        return;
    }
    for (const Node& child : element.children) {
        walk(child, visitor);
    }
    visitor.leave(element);
}

void append_text(std::vector<Node>& children, std::u8string_view text)
{
    if (text.empty()) {
        return;
    }
    if (!children.empty()) {
        if (Text* const last = children.back().as_text()) {
            last->text += text;
            return;
        }
    }
    children.push_back(Node { Text { std::u8string { text } } });
}

void normalize_text(std::vector<Node>& children)
{
    std::vector<Node> result;
    result.reserve(children.size());
    for (Node& child : children) {
        if (const Text* const t = child.as_text()) {
            append_text(result, t->text);
        }
        else {
            result.push_back(std::move(child));
        }
    }
    children = std::move(result);
}

} // namespace parley::xml
