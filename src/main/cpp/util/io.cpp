#include <cstddef>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

#include "parley/util/function_ref.hpp"
#include "parley/util/io.hpp"
#include "parley/util/result.hpp"
#include "parley/util/unicode.hpp"

namespace parley {

Unique_File fopen_unique(std::u8string_view path, const char* mode)
{
    const std::string c_path(reinterpret_cast<const char*>(path.data()), path.size());
    return std::fopen(c_path.c_str(), mode);
}

Result<void, IO_Error_Code> file_to_bytes_chunked(
    Function_Ref<void(std::span<const char8_t>)> consume_chunk,
    std::u8string_view path
)
{
    constexpr std::size_t block_size = BUFSIZ;
    char8_t buffer[block_size] {};

    const Unique_File stream = fopen_unique(path, "rb");
    if (!stream) {
        return IO_Error_Code::cannot_open;
    }

    std::size_t read_size;
    do {
        read_size = std::fread(buffer, 1, block_size, stream.get());
        if (std::ferror(stream.get())) {
            return IO_Error_Code::read_error;
        }
        consume_chunk(std::span<const char8_t> { buffer, read_size });
    } while (read_size == block_size);

    return {};
}

Result<std::u8string, IO_Error_Code> load_utf8_file(std::u8string_view path)
{
    std::u8string result;
    const Result<void, IO_Error_Code> r = file_to_bytes_chunked(
        [&result](std::span<const char8_t> chunk) { result.append(chunk.begin(), chunk.end()); },
        path
    );
    if (!r) {
        return r.error();
    }
    if (!utf8::is_valid(result)) {
        return IO_Error_Code::corrupted;
    }
    return result;
}

Result<void, IO_Error_Code> text_to_file(std::u8string_view text, std::u8string_view path)
{
    const Unique_File file = fopen_unique(path, "wb");
    if (!file) {
        return IO_Error_Code::cannot_open;
    }
    const std::size_t bytes_written = std::fwrite(text.data(), 1, text.size(), file.get());
    if (bytes_written != text.size()) {
        return IO_Error_Code::write_error;
    }
    if (std::fflush(file.get()) != 0) {
        return IO_Error_Code::write_error;
    }
    return {};
}

} // namespace parley
