#pragma once

#include <cstddef>
#include <cstdint>

namespace chronoid {

// -----------------------------------------------------------------------------
// IRandomProvider — abstract source of cryptographically-secure bytes
// -----------------------------------------------------------------------------
//
// @brief  The generator asks for 7 bytes per identifier; where those bytes
//         come from is injected.
//
// Failure contract:
//   If the provider cannot deliver, it throws EntropyError. It must not
//   return partially filled output and must not retry silently: retrying
//   could mask entropy exhaustion.
//
// Thread-safety contract:
//   fill() is called concurrently by every thread that generates ids.
//   Implementations synchronize internally.
// -----------------------------------------------------------------------------
class IRandomProvider {
 public:
  virtual ~IRandomProvider() = default;

  // Writes exactly `count` random bytes to `dest`.
  virtual void fill(std::uint8_t* dest, std::size_t count) = 0;
};

}  // namespace chronoid
