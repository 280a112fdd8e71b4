#ifndef PARLEY_SETTINGS_HPP
#define PARLEY_SETTINGS_HPP

#include <cstddef>

#include "ulight/impl/platform.h"

#ifndef NDEBUG // debug builds
#define PARLEY_DEBUG 1
#define PARLEY_IF_DEBUG(...) __VA_ARGS__
#define PARLEY_IF_NOT_DEBUG(...)
#else // release builds
#define PARLEY_IF_DEBUG(...)
#define PARLEY_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

#ifdef ULIGHT_CLANG
#define PARLEY_CLANG 1
#endif

#ifdef ULIGHT_GCC
#define PARLEY_GCC 1
#endif

#define PARLEY_UNREACHABLE() __builtin_unreachable()

namespace parley {

/// @brief If `true`, the current build is a debug build (not a release build).
inline constexpr bool is_debug_build = PARLEY_IF_DEBUG(true) PARLEY_IF_NOT_DEBUG(false);

/// @brief The number of hexadecimal digits used for content-derived passage and tag ids.
inline constexpr std::size_t content_id_hex_digits = 12;

/// @brief The number of compiled constraint tables kept by a default `Lru_Constraint_Cache`.
inline constexpr std::size_t default_constraint_cache_capacity = 8;

/// @brief The maximum Levenshtein distance at which a name is offered as a typo correction.
inline constexpr std::size_t max_typo_distance = 3;

/// @brief The maximum number of entity candidates offered as fixes for a missing reference.
inline constexpr std::size_t max_entity_fix_candidates = 5;

} // namespace parley

#endif
