#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "ulidkit/core/base32.hpp"
#include "ulidkit/core/uint128.hpp"

namespace ulidkit::core {

// ULID (Universally Unique Lexicographically Sortable Identifier)
//
// 128 bits: a 48-bit millisecond Unix timestamp in the high bits followed
// by 80 random bits. Canonically written as 26 Crockford Base32 characters.
// Numeric order, text order and time order agree.
//
// Values are immutable. Minting (clock + entropy) and monotonic sequencing
// belong to an IdentitySource; this type only composes and converts.
class Ulid {
 public:
  static constexpr unsigned kTimeBits = 48;
  static constexpr unsigned kRandomBits = 80;
  static constexpr std::size_t kByteLength = 16;

  using Bytes = std::array<std::uint8_t, kByteLength>;

  // Millisecond clock reading. The whole 48-bit range fits; a nanosecond
  // system_clock::time_point does not.
  using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

  // Default constructor creates the nil ULID
  Ulid() = default;

  // Compose from parts. Bits beyond 48 (time) and 80 (random) are dropped.
  static Ulid fromParts(std::uint64_t timestamp_ms, Uint128 random) noexcept;

  // Same, from a clock reading. Instants before the epoch clamp to 0.
  static Ulid fromParts(Timestamp timestamp, Uint128 random) noexcept;
  static Ulid fromParts(std::chrono::system_clock::time_point timestamp, Uint128 random) noexcept;

  // Parse the 26-character text form (either case)
  static std::expected<Ulid, base32::DecodeError> fromString(std::string_view str) noexcept;

  // Big-endian: byte 0 holds the top 8 bits of the timestamp
  static Ulid fromBytes(const Bytes& bytes) noexcept;

  static Ulid fromHalves(std::uint64_t msb, std::uint64_t lsb) noexcept;
  static Ulid fromUint128(Uint128 value) noexcept;

  // All 128 bits zero
  static Ulid nil() noexcept;

  bool isNil() const noexcept;

  // Low 80 bits
  Uint128 random() const noexcept;

  // High 48 bits, milliseconds since the Unix epoch
  std::uint64_t timestampMs() const noexcept;
  Timestamp timestamp() const noexcept;

  // Next value within the same millisecond. Returns nullopt when the
  // random field is exhausted; the time field is never touched.
  std::optional<Ulid> increment() const noexcept;

  std::string toString() const;

  // Writes 26 bytes into `buffer`, no terminator
  std::expected<std::size_t, base32::EncodeError> encodeTo(std::span<char> buffer) const noexcept;

  Bytes toBytes() const noexcept;
  std::pair<std::uint64_t, std::uint64_t> toHalves() const noexcept;
  Uint128 toUint128() const noexcept { return value_; }

  // Comparison operators
  bool operator==(const Ulid& other) const noexcept;
  bool operator!=(const Ulid& other) const noexcept;
  bool operator<(const Ulid& other) const noexcept;
  bool operator<=(const Ulid& other) const noexcept;
  bool operator>(const Ulid& other) const noexcept;
  bool operator>=(const Ulid& other) const noexcept;

  // Hash support for containers
  struct Hash {
    std::size_t operator()(const Ulid& id) const noexcept;
  };

 private:
  explicit constexpr Ulid(Uint128 value) : value_(value) {}

  Uint128 value_;
};

std::ostream& operator<<(std::ostream& os, const Ulid& id);

// Reads one whitespace-delimited token; sets failbit if it is not a ULID
std::istream& operator>>(std::istream& is, Ulid& id);

}  // namespace ulidkit::core

// Hash specialization for std::unordered_map
namespace std {
template <>
struct hash<ulidkit::core::Ulid> : ulidkit::core::Ulid::Hash {};
}  // namespace std
