#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

#include "ulidkit/common.hpp"

namespace ulidkit::core {

// Unsigned 128-bit integer held as two 64-bit halves.
// Arithmetic wraps modulo 2^128; shifts by 128 or more yield zero.
struct Uint128 {
  std::uint64_t high = 0;
  std::uint64_t low = 0;

  constexpr Uint128() = default;
  constexpr Uint128(std::uint64_t high_bits, std::uint64_t low_bits)
      : high(high_bits), low(low_bits) {}

  // Widening conversion from a 64-bit value
  static constexpr Uint128 fromU64(std::uint64_t value) { return Uint128(0, value); }

  // Right-aligned mask of `bits` ones (bits >= 128 gives all ones)
  static constexpr Uint128 mask(unsigned bits) {
    if (bits == 0) return Uint128();
    if (bits >= 128) return Uint128(~std::uint64_t{0}, ~std::uint64_t{0});
    if (bits >= 64) {
      const unsigned high_bits = bits - 64;
      const std::uint64_t high_mask =
          high_bits == 0 ? 0 : (~std::uint64_t{0} >> (64 - high_bits));
      return Uint128(high_mask, ~std::uint64_t{0});
    }
    return Uint128(0, ~std::uint64_t{0} >> (64 - bits));
  }

  static constexpr Uint128 max() { return mask(128); }

  constexpr bool isZero() const noexcept { return high == 0 && low == 0; }

  constexpr Uint128 operator<<(unsigned shift) const noexcept {
    if (shift == 0) return *this;
    if (shift >= 128) return Uint128();
    if (shift >= 64) return Uint128(low << (shift - 64), 0);
    return Uint128((high << shift) | (low >> (64 - shift)), low << shift);
  }

  constexpr Uint128 operator>>(unsigned shift) const noexcept {
    if (shift == 0) return *this;
    if (shift >= 128) return Uint128();
    if (shift >= 64) return Uint128(0, high >> (shift - 64));
    return Uint128(high >> shift, (low >> shift) | (high << (64 - shift)));
  }

  constexpr Uint128 operator&(const Uint128& other) const noexcept {
    return Uint128(high & other.high, low & other.low);
  }

  constexpr Uint128 operator|(const Uint128& other) const noexcept {
    return Uint128(high | other.high, low | other.low);
  }

  constexpr Uint128 operator~() const noexcept { return Uint128(~high, ~low); }

  constexpr Uint128 operator+(const Uint128& other) const noexcept {
    const std::uint64_t sum_low = low + other.low;
    const std::uint64_t carry = sum_low < low ? 1 : 0;
    return Uint128(high + other.high + carry, sum_low);
  }

  // Halves are compared high first, which is numeric order
  constexpr auto operator<=>(const Uint128& other) const noexcept = default;
  constexpr bool operator==(const Uint128& other) const noexcept = default;

  // 32 lowercase hex digits, zero padded
  std::string toHex() const;

  // Parse 1-32 hex digits with an optional 0x prefix
  static Result<Uint128> fromHex(std::string_view text);
};

}  // namespace ulidkit::core
