#include "chronoid/random/system_random_provider.hpp"
#include "chronoid/domain/errors.hpp"

#include <exception>
#include <iostream>

namespace chronoid {

// A token the standard library does not recognise, or an entropy device it
// cannot open, throws from the std::random_device constructor.
SystemRandomProvider::SystemRandomProvider(const std::string& token) try
    : device_(token) {
} catch (const std::exception& e) {
  std::cerr << "[SystemRandomProvider] ERROR: cannot open entropy source '"
            << token << "': " << e.what() << "\n";
  throw EntropyError("cannot open entropy source '" + token +
                     "': " + e.what());
}

void SystemRandomProvider::fill(std::uint8_t* dest, std::size_t count) {
  std::lock_guard lock(mutex_);
  try {
    std::size_t i = 0;
    while (i < count) {
      std::random_device::result_type word = device_();
      for (int b = 0; b < 4 && i < count; ++b, ++i) {
        dest[i] = static_cast<std::uint8_t>(word >> (8 * b));
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "[SystemRandomProvider] ERROR: entropy source failed: "
              << e.what() << "\n";
    throw EntropyError(std::string("entropy source failed: ") + e.what());
  }
}

}  // namespace chronoid
