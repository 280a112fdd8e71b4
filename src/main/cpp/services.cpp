#include <chrono>
#include <cstdint>
#include <random>
#include <string>

#include "parley/util/hash.hpp"
#include "parley/util/strings.hpp"

#include "parley/services.hpp"

namespace parley {

Random_Id_Generator::Random_Id_Generator()
    : m_engine { std::random_device {}() }
{
}

std::u8string Random_Id_Generator::generate(Entity_Kind kind)
{
    std::u8string result { entity_id_prefix(kind) };
    result += u8'-';
    append_hex(result, m_engine(), 16);
    return result;
}

std::u8string Counting_Id_Generator::generate(Entity_Kind kind)
{
    std::u8string result { entity_id_prefix(kind) };
    result += u8'-';
    append_integer(result, m_next++);
    return result;
}

std::int64_t System_Clock::now_ms()
{
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

} // namespace parley
