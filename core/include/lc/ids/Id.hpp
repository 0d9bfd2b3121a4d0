#pragma once
#include <cstdint>

namespace lc {

// Monotonically increasing tag attached to every decode request.
// A result is only applied if its generation matches the session's
// current navigation target.
using Generation = std::uint64_t;

inline constexpr Generation kNoGeneration = 0;

} // namespace lc
