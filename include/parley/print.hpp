#ifndef PARLEY_PRINT_HPP
#define PARLEY_PRINT_HPP

#include <cstddef>
#include <cstdio>
#include <iosfwd>
#include <string>
#include <string_view>

#include "parley/util/io.hpp"
#include "parley/util/severity.hpp"
#include "parley/util/source_position.hpp"

#include "parley/fwd.hpp"

namespace parley {

/// @brief Returns `true` if `file` refers to a terminal.
[[nodiscard]]
bool is_tty(std::FILE* file) noexcept;

/// @brief Returns the line that contains the given index.
/// @param source the source string
/// @param index the index within the source string, in range `[0, source.size()]`
/// @return A line which contains the given `index`, without its line terminator.
[[nodiscard]]
std::u8string_view find_line(std::u8string_view source, std::size_t index);

/// @brief Returns the ANSI escape sequence used for the tag of a diagnostic with `severity`.
[[nodiscard]]
std::u8string_view severity_highlight(Severity severity);

/// @brief Prints a position within a file, like `emma.xml:12:4:`.
/// Line and column are printed one-based.
void print_file_position(
    std::u8string& out,
    std::u8string_view file,
    const Source_Position& pos,
    bool colors,
    bool colon_suffix = true
);

/// @brief Prints the contents of the affected line within `source`,
/// followed by a line of position indicators underneath the span affected by some diagnostic.
void print_affected_line(
    std::u8string& out,
    std::u8string_view source,
    const Source_Span& pos,
    bool colors
);

/// @brief Prints a diagnostic in the form `SEVERITY: file:line:col: message [id]`.
/// If the diagnostic has a non-empty location,
/// the affected line of `source` is printed as well.
void print_diagnostic(std::u8string& out, const Diagnostic& diagnostic, std::u8string_view source, bool colors);

void print_io_error(std::u8string& out, std::u8string_view file, IO_Error_Code error, bool colors);

std::ostream& operator<<(std::ostream& out, std::u8string_view str);

void print_stdout(std::u8string_view text);
void print_stderr(std::u8string_view text);

} // namespace parley

#endif
