#pragma once

#include "ulidkit/common.hpp"
#include "ulidkit/core/ulid.hpp"

namespace ulidkit::core {

/**
 * @brief Source of the current UTC time for identity minting.
 *
 * Kept separate from IdentitySource so that time can be scripted in tests
 * and swapped independently of the entropy source.
 */
class Clock {
 public:
  virtual ~Clock() = default;

  /**
   * @brief Read the current time at millisecond precision
   * @return The time, or an error if the clock could not be read
   */
  virtual Result<Ulid::Timestamp> now() = 0;
};

}  // namespace ulidkit::core
