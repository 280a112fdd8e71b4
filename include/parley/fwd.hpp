#ifndef PARLEY_FWD_HPP
#define PARLEY_FWD_HPP

#include "parley/settings.hpp"

PARLEY_IF_DEBUG() // silence unused warning for settings.hpp

namespace parley {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define PARLEY_ENUM_STRING_CASE8(...)                                                              \
    case __VA_ARGS__: return u8## #__VA_ARGS__

struct Attribute_Constraint;
enum struct Attribute_Type : Default_Underlying;
struct Character;
struct Clock;
struct Collecting_Logger;
struct Constraint_Cache;
struct Constraint_Table;
struct Content_Model;
enum struct Delta_Operation : Default_Underlying;
struct Diagnostic;
struct Dialogue_Span;
struct Document;
struct Document_Data;
struct Entity_Delta;
struct Entity_History;
enum struct Entity_Kind : Default_Underlying;
struct Entity_Set;
struct Error_Tag;
struct Fallback_Error;
enum struct Fallback_Error_Code : Default_Underlying;
struct Id_Generator;
struct Ignorant_Logger;
enum struct IO_Error_Code : Default_Underlying;
enum struct Issue_Severity : Default_Underlying;
struct Logger;
struct Organization;
struct Parse_Error;
enum struct Parse_Error_Code : Default_Underlying;
struct Passage;
struct Persistence_Error;
enum struct Persistence_Error_Code : Default_Underlying;
struct Place;
struct Relationship;
template <typename, typename>
struct Result;
struct Schema_Catalog;
struct Schema_Error;
enum struct Schema_Error_Code : Default_Underlying;
struct Schema_Info;
struct Schema_Resolver;
struct Schema_Source;
enum struct Severity : Default_Underlying;
struct Source_Position;
struct Source_Span;
struct Success_Tag;
struct Tag;
struct Tag_Constraint;
struct Text_Range;
struct Validation_Cache;
struct Validation_Error;
enum struct Validation_Error_Code : Default_Underlying;
struct Validation_Issue;
struct Validation_Report;

namespace xml {
struct Attribute;
struct Element;
struct Node;
struct Text;
struct Node_Visitor;
} // namespace xml

} // namespace parley

#endif
