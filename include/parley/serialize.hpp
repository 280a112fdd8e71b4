#ifndef PARLEY_SERIALIZE_HPP
#define PARLEY_SERIALIZE_HPP

#include <string>

#include "parley/document.hpp"
#include "parley/entities.hpp"
#include "parley/fwd.hpp"
#include "parley/util/xml_writer.hpp"

namespace parley {

/// @brief Writes the standoff lists (`listPerson`, `listPlace`, `listOrg`, `listRelation`)
/// describing `entities`, each list on its own line at the current depth.
/// Consecutive entities of the same kind share a list, so that entity order is preserved.
/// A mutual relationship is written once, as a single `relation` with `mutual="true"`.
void write_standoff_lists(XML_Writer& writer, const Entity_Set& entities);

/// @brief Renders `document` as markup text.
/// Passages and other elements with character data are written exactly as they are,
/// while whitespace between purely structural elements is replaced with indentation.
/// The standoff section is regenerated from the document's entities,
/// so that entity edits are reflected in the output.
/// Loading the result yields the same passages, dialogue, and entities.
[[nodiscard]]
std::u8string serialize_document(const Document& document);

} // namespace parley

#endif
