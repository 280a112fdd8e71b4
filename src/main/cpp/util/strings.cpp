#include <charconv>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include "parley/util/assert.hpp"
#include "parley/util/strings.hpp"

namespace parley {

void append_double(std::u8string& out, double x)
{
    char buffer[32];
    const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), x);
    PARLEY_ASSERT(ec == std::errc {});
    out.append(buffer, end);
}

bool parse_double(std::u8string_view str, double& out)
{
    const std::string_view chars = as_string_view(str);
    const auto [end, ec] = std::from_chars(chars.data(), chars.data() + chars.size(), out);
    return ec == std::errc {} && end == chars.data() + chars.size();
}

std::u8string join(std::span<const std::u8string> parts, std::u8string_view separator)
{
    std::u8string result;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i != 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

} // namespace parley
