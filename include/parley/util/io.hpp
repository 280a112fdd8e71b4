#ifndef PARLEY_IO_HPP
#define PARLEY_IO_HPP

#include <cstddef>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "parley/util/function_ref.hpp"
#include "parley/util/result.hpp"

#include "parley/fwd.hpp"

namespace parley {

enum struct IO_Error_Code : Default_Underlying {
    /// @brief The file couldn't be opened.
    /// This may be due to disk errors, security issues, bad file paths, or other issues.
    cannot_open,
    /// @brief An error occurred while reading a file.
    read_error,
    /// @brief An error occurred while writing a file.
    write_error,
    /// @brief The file is not properly encoded as UTF-8.
    corrupted,
};

[[nodiscard]]
constexpr std::u8string_view io_error_code_message(IO_Error_Code code)
{
    switch (code) {
    case IO_Error_Code::cannot_open: return u8"Failed to open file.";
    case IO_Error_Code::read_error: return u8"I/O error occurred when reading from file.";
    case IO_Error_Code::write_error: return u8"I/O error occurred when writing to file.";
    case IO_Error_Code::corrupted: return u8"Data in the file is corrupted (not UTF-8).";
    }
    return u8"Unknown I/O error.";
}

struct [[nodiscard]] Unique_File {
private:
    std::FILE* m_file = nullptr;

public:
    constexpr Unique_File() = default;

    constexpr Unique_File(std::FILE* f)
        : m_file { f }
    {
    }

    constexpr Unique_File(Unique_File&& other) noexcept
        : m_file { std::exchange(other.m_file, nullptr) }
    {
    }

    Unique_File(const Unique_File&) = delete;
    Unique_File& operator=(const Unique_File&) = delete;

    Unique_File& operator=(Unique_File&& other) noexcept
    {
        close();
        m_file = std::exchange(other.m_file, nullptr);
        return *this;
    }

    void close() noexcept
    {
        if (m_file) {
            std::fclose(m_file);
            m_file = nullptr;
        }
    }

    [[nodiscard]]
    constexpr std::FILE* get() const noexcept
    {
        return m_file;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return m_file != nullptr;
    }

    ~Unique_File()
    {
        close();
    }
};

/// @brief Forwards the arguments to `std::fopen` and wraps the result in `Unique_File`.
[[nodiscard]]
Unique_File fopen_unique(std::u8string_view path, const char* mode);

/// @brief Reads all bytes from a file and calls a given consumer with them, chunk by chunk.
/// @param consume_chunk Invoked repeatedly with temporary chunks of bytes.
/// The chunks are located within the same underlying buffer,
/// so they should not be used after `consume_chunk` has returned.
/// @param path the file path
[[nodiscard]]
Result<void, IO_Error_Code> file_to_bytes_chunked(
    Function_Ref<void(std::span<const char8_t>)> consume_chunk,
    std::u8string_view path
);

/// @brief Loads a whole file and verifies that it is valid UTF-8.
[[nodiscard]]
Result<std::u8string, IO_Error_Code> load_utf8_file(std::u8string_view path);

/// @brief Writes `text` to the file at `path`, replacing its contents.
[[nodiscard]]
Result<void, IO_Error_Code> text_to_file(std::u8string_view text, std::u8string_view path);

} // namespace parley

#endif
