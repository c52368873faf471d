#pragma once

#include "chronoid/random/i_random_provider.hpp"

#include <mutex>
#include <random>
#include <string>

namespace chronoid {

// -----------------------------------------------------------------------------
// SystemRandomProvider — OS entropy via std::random_device
// -----------------------------------------------------------------------------
//
// @details
// On Linux libstdc++ backs std::random_device with getrandom(2) or
// /dev/urandom, which is suitable for the 54 random bits of a UUIDv7.
// std::random_device is not thread-safe, so calls are serialized by a
// mutex; each call draws 32 bits at a time.
//
// Any exception from the device, whether opening it or reading from it, is
// logged and rethrown as EntropyError.
//
// Ownership:
//   Owned by whoever builds the generator (main(), tests). Non-copyable.
// -----------------------------------------------------------------------------
class SystemRandomProvider final : public IRandomProvider {
 public:
  // `token` is forwarded to std::random_device; "default" lets the
  // standard library pick its preferred entropy source. Throws EntropyError
  // when the source cannot be opened.
  explicit SystemRandomProvider(const std::string& token = "default");

  SystemRandomProvider(const SystemRandomProvider&) = delete;
  SystemRandomProvider& operator=(const SystemRandomProvider&) = delete;

  void fill(std::uint8_t* dest, std::size_t count) override;

 private:
  std::mutex mutex_;
  std::random_device device_;
};

}  // namespace chronoid
