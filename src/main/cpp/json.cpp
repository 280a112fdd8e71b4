#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "ulight/json.hpp"

#include "parley/util/assert.hpp"

#include "parley/json.hpp"

namespace parley::json {
namespace {

/// @brief Assembles a value tree from the events of the ulight JSON parser.
/// Arrays and objects under construction are kept on a stack,
/// and property names wait on a separate stack until their value is complete.
struct Tree_Builder final : ulight::JSON_Visitor {
    using Pos = ulight::Source_Position;

    std::pmr::memory_resource* memory;
    std::optional<Value> root;
    std::pmr::vector<Value> open_structures;
    std::pmr::vector<String> pending_keys;
    String text;

    [[nodiscard]]
    explicit Tree_Builder(std::pmr::memory_resource* memory)
        : memory { memory }
        , open_structures { memory }
        , pending_keys { memory }
        , text { memory }
    {
    }

    void literal(const Pos&, std::u8string_view chars) final
    {
        text.append(chars);
    }

    void escape(const Pos&, std::u8string_view, char32_t, std::u8string_view code_units) final
    {
        text.append(code_units);
    }

    void number(const Pos&, std::u8string_view, double value) final
    {
        add(value);
    }

    void null(const Pos&) final
    {
        add(Null {});
    }

    void boolean(const Pos&, bool value) final
    {
        add(value);
    }

    void push_string(const Pos&) final
    {
        text.clear();
    }

    void pop_string(const Pos&) final
    {
        add(text);
    }

    void push_property(const Pos&) final
    {
        text.clear();
    }

    void pop_property(const Pos&) final
    {
        pending_keys.push_back(text);
    }

    void push_object(const Pos&) final
    {
        open_structures.push_back(Object { memory });
    }

    void pop_object(const Pos&) final
    {
        close_structure();
    }

    void push_array(const Pos&) final
    {
        open_structures.push_back(Array { memory });
    }

    void pop_array(const Pos&) final
    {
        close_structure();
    }

private:
    void close_structure()
    {
        PARLEY_ASSERT(!open_structures.empty());
        Value finished = std::move(open_structures.back());
        open_structures.pop_back();
        add(std::move(finished));
    }

    void add(Value&& value)
    {
        if (open_structures.empty()) {
            PARLEY_ASSERT(pending_keys.empty());
            root = std::move(value);
            return;
        }
        Value& parent = open_structures.back();
        if (auto* const array = std::get_if<Array>(&parent)) {
            array->push_back(std::move(value));
            return;
        }
        auto* const object = std::get_if<Object>(&parent);
        PARLEY_ASSERT(object && !pending_keys.empty());
        object->push_back({ std::move(pending_keys.back()), std::move(value) });
        pending_keys.pop_back();
    }
};

} // namespace

std::optional<Value> load(std::u8string_view source, std::pmr::memory_resource* memory)
{
    constexpr ulight::JSON_Options options { .allow_comments = true,
                                             .parse_numbers = true,
                                             .escapes = ulight::Escape_Parsing::parse_encode };
    Tree_Builder builder { memory };
    if (!ulight::parse_json(builder, source, options)) {
        return {};
    }
    return std::move(builder.root);
}

} // namespace parley::json
