#pragma once

#include "ulidkit/common.hpp"
#include "ulidkit/core/ulid.hpp"

namespace ulidkit::core {

/**
 * @brief Mints new identifiers for persistable entities.
 *
 * Implementations own everything the Ulid type deliberately does not:
 * reading the clock, drawing entropy, and keeping successive results
 * strictly increasing. The expected sequence is:
 *
 *   1. read the current time from a Clock;
 *   2. if it equals the time of the last issued id, try last.increment();
 *   3. when increment() returns nullopt, read the Clock again until it
 *      reports a later millisecond;
 *   4. otherwise draw fresh random bits and call
 *      Ulid::fromParts(time, random).
 *
 * Implementations shared between threads must serialize steps 1-4.
 */
class IdentitySource {
 public:
  virtual ~IdentitySource() = default;

  /**
   * @brief Generate a new, unique identifier
   * @return The identifier, or an error if the clock or entropy failed
   */
  virtual Result<Ulid> generate() = 0;
};

}  // namespace ulidkit::core
