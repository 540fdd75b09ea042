#ifndef TPP_FWD_HPP
#define TPP_FWD_HPP

#include "tpp/settings.hpp"

TPP_IF_DEBUG() // silence unused warning for settings.hpp

namespace tpp {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define TPP_ENUM_STRING_CASE8(...)                                                                 \
    case __VA_ARGS__: return u8## #__VA_ARGS__

struct Asset_Packer;
template <typename File>
struct Basic_File_Source_Position;
template <typename File>
struct Basic_File_Source_Span;
template <typename>
struct Basic_Transparent_String_View_Equals;
template <typename>
struct Basic_Transparent_String_View_Hash;
enum struct Block_Kind : Default_Underlying;
struct Compilation_Cache;
struct Compiled_Artifact;
struct Compile_Error;
enum struct Compile_Error_Kind : Default_Underlying;
struct Debug_Record;
struct Diagnostic;
struct Directive_Entry;
struct Directive_Registry;
struct Ignorant_Logger;
enum struct IO_Error_Code : Default_Underlying;
struct Logger;
struct Option_Config;
enum struct Option_Flag : Default_Underlying;
struct Option_Set;
struct Pass_Context;
struct Path_Pattern;
enum struct Purity : Default_Underlying;
template <typename, typename>
struct Result;
enum struct Severity : Default_Underlying;
struct Source_Position;
struct Source_Span;
struct Template_Entry;
struct Template_Loader;
struct Token;
enum struct Token_Kind : Default_Underlying;

namespace ast {

struct Branch;
struct Node;
enum struct Node_Kind : Default_Underlying;

} // namespace ast

using Transparent_String_View_Equals8 = Basic_Transparent_String_View_Equals<char8_t>;
using Transparent_String_View_Hash8 = Basic_Transparent_String_View_Hash<char8_t>;

/// @brief A numeric file identifier.
/// Identifiers are handed out by a `Template_Loader`;
/// `main` refers to a source that was not obtained from any loader.
enum struct File_Id : int { main = -1 }; // NOLINT(performance-enum-size)

using File_Source_Position = Basic_File_Source_Position<File_Id>;
using File_Source_Span = Basic_File_Source_Span<File_Id>;

} // namespace tpp

#endif
