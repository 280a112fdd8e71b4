#ifdef __unix__
#include "stdio.h" // NOLINT for fileno
#include <unistd.h>
#endif

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <iostream>
#include <string>
#include <string_view>

#include "parley/util/ansi.hpp"
#include "parley/util/assert.hpp"
#include "parley/util/io.hpp"
#include "parley/util/severity.hpp"
#include "parley/util/source_position.hpp"
#include "parley/util/strings.hpp"

#include "parley/diagnostic.hpp"
#include "parley/print.hpp"

namespace parley {

bool is_tty(std::FILE* file) noexcept
{
#ifdef __unix__
    return isatty(fileno(file));
#else
    return false;
#endif
}

namespace {

/// @brief Appends `text`, wrapped in `highlight` and a reset sequence if `colors` is `true`.
void append_highlighted(
    std::u8string& out,
    std::u8string_view text,
    std::u8string_view highlight,
    bool colors
)
{
    if (colors) {
        out += highlight;
    }
    out += text;
    if (colors) {
        out += ansi::reset;
    }
}

} // namespace

std::u8string_view find_line(std::u8string_view source, std::size_t index)
{
    PARLEY_ASSERT(index <= source.size());
    if (source.empty()) {
        return source;
    }

    if (index != 0 && (index == source.size() || source[index] == u8'\n')) {
        // Positions at the end of a line (or of the source) belong to the line they end.
        --index;
    }
    if (source[index] == u8'\n') {
        return {};
    }

    std::size_t begin = source.rfind(u8'\n', index);
    begin = begin != std::u8string_view::npos ? begin + 1 : 0;

    const std::size_t end = std::min(source.find(u8'\n', index), source.size());
    return source.substr(begin, end - begin);
}

std::u8string_view severity_highlight(Severity severity)
{
    return severity <= Severity::trace  ? ansi::black
        : severity <= Severity::debug   ? ansi::h_black
        : severity <= Severity::info    ? ansi::blue
        : severity <= Severity::soft_warning ? ansi::green
        : severity <= Severity::warning ? ansi::h_yellow
        : severity <= Severity::error   ? ansi::h_red
        : severity <= Severity::fatal   ? ansi::red
                                        : ansi::magenta;
}

void print_file_position(
    std::u8string& out,
    std::u8string_view file,
    const Source_Position& pos,
    bool colors,
    bool colon_suffix
)
{
    std::u8string position { file };
    position += u8':';
    append_integer(position, pos.line + 1);
    position += u8':';
    append_integer(position, pos.column + 1);
    if (colon_suffix) {
        position += u8':';
    }
    append_highlighted(out, position, ansi::h_black, colors);
}

void print_affected_line(
    std::u8string& out,
    std::u8string_view source,
    const Source_Span& pos,
    bool colors
)
{
    PARLEY_ASSERT(!pos.empty());

    const std::u8string_view cited_code = find_line(source, pos.begin);

    std::u8string line_number;
    append_integer(line_number, pos.line + 1);
    constexpr std::size_t pad_max = 6;
    const std::size_t pad_length = pad_max - std::min(line_number.length(), pad_max - 1);
    out.append(pad_length, u8' ');
    append_highlighted(out, line_number, ansi::h_yellow, colors);
    out += u8" | ";
    out += cited_code;
    out += u8'\n';

    const std::size_t align_length = std::max(pad_max, line_number.length() + 1);
    out.append(align_length, u8' ');
    out += u8" | ";
    const std::size_t column = std::min(pos.column, cited_code.length());
    out.append(column, u8' ');

    // Spans that continue past the end of the line are only marked up to the line end.
    const std::size_t indicator_length = std::min(pos.length, cited_code.length() - column);
    std::u8string indicator = u8"^";
    if (indicator_length > 1) {
        indicator.append(indicator_length - 1, u8'~');
    }
    append_highlighted(out, indicator, ansi::h_green, colors);
    out += u8'\n';
}

void print_diagnostic(std::u8string& out, const Diagnostic& diagnostic, std::u8string_view source, bool colors)
{
    append_highlighted(out, severity_tag(diagnostic.severity), severity_highlight(diagnostic.severity), colors);
    out += u8": ";
    if (!diagnostic.file.empty()) {
        if (diagnostic.location.empty()) {
            append_highlighted(out, diagnostic.file, ansi::h_black, colors);
            out += u8':';
        }
        else {
            print_file_position(out, diagnostic.file, diagnostic.location, colors);
        }
        out += u8' ';
    }
    out += diagnostic.message;

    std::u8string id = u8" [";
    id += diagnostic.id;
    id += u8']';
    append_highlighted(out, id, ansi::h_black, colors);
    out += u8'\n';

    if (!diagnostic.location.empty() && diagnostic.location.begin < source.size()) {
        print_affected_line(out, source, diagnostic.location, colors);
    }
}

void print_io_error(std::u8string& out, std::u8string_view file, IO_Error_Code error, bool colors)
{
    std::u8string location { file };
    location += u8':';
    append_highlighted(out, location, ansi::h_black, colors);
    out += u8' ';
    out += io_error_code_message(error);
    out += u8'\n';
}

std::ostream& operator<<(std::ostream& out, std::u8string_view str)
{
    return out << as_string_view(str);
}

void print_stdout(std::u8string_view text)
{
    std::cout << text;
    std::cout.flush();
}

void print_stderr(std::u8string_view text)
{
    std::cerr << text;
    std::cerr.flush();
}

} // namespace parley
