#include "ulidkit/core/ulid.hpp"

#include <functional>
#include <istream>
#include <ostream>

namespace ulidkit::core {

namespace {

constexpr Uint128 kTimeMask = Uint128::mask(Ulid::kTimeBits);
constexpr Uint128 kRandomMask = Uint128::mask(Ulid::kRandomBits);

}  // namespace

Ulid Ulid::fromParts(std::uint64_t timestamp_ms, Uint128 random) noexcept {
  Uint128 time_part = Uint128::fromU64(timestamp_ms) & kTimeMask;
  Uint128 random_part = random & kRandomMask;
  return Ulid((time_part << kRandomBits) | random_part);
}

Ulid Ulid::fromParts(Timestamp timestamp, Uint128 random) noexcept {
  auto milliseconds = timestamp.time_since_epoch().count();
  if (milliseconds < 0) {
    milliseconds = 0;
  }
  return fromParts(static_cast<std::uint64_t>(milliseconds), random);
}

Ulid Ulid::fromParts(std::chrono::system_clock::time_point timestamp, Uint128 random) noexcept {
  return fromParts(std::chrono::floor<std::chrono::milliseconds>(timestamp), random);
}

std::expected<Ulid, base32::DecodeError> Ulid::fromString(std::string_view str) noexcept {
  auto decoded = base32::decode(str);
  if (!decoded.has_value()) {
    return std::unexpected(decoded.error());
  }
  return Ulid(*decoded);
}

Ulid Ulid::fromBytes(const Bytes& bytes) noexcept {
  std::uint64_t msb = 0;
  std::uint64_t lsb = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    msb = (msb << 8) | bytes[i];
    lsb = (lsb << 8) | bytes[i + 8];
  }
  return Ulid(Uint128(msb, lsb));
}

Ulid Ulid::fromHalves(std::uint64_t msb, std::uint64_t lsb) noexcept {
  return Ulid(Uint128(msb, lsb));
}

Ulid Ulid::fromUint128(Uint128 value) noexcept {
  return Ulid(value);
}

Ulid Ulid::nil() noexcept {
  return Ulid();
}

bool Ulid::isNil() const noexcept {
  return value_.isZero();
}

Uint128 Ulid::random() const noexcept {
  return value_ & kRandomMask;
}

std::uint64_t Ulid::timestampMs() const noexcept {
  return (value_ >> kRandomBits).low;
}

Ulid::Timestamp Ulid::timestamp() const noexcept {
  return Timestamp{std::chrono::milliseconds(static_cast<std::int64_t>(timestampMs()))};
}

std::optional<Ulid> Ulid::increment() const noexcept {
  if ((value_ & kRandomMask) == kRandomMask) {
    return std::nullopt;
  }
  return Ulid(value_ + Uint128::fromU64(1));
}

std::string Ulid::toString() const {
  return base32::encode(value_);
}

std::expected<std::size_t, base32::EncodeError> Ulid::encodeTo(std::span<char> buffer) const noexcept {
  return base32::encodeTo(value_, buffer);
}

Ulid::Bytes Ulid::toBytes() const noexcept {
  Bytes bytes{};
  for (std::size_t i = 0; i < 8; ++i) {
    const unsigned shift = static_cast<unsigned>(56 - i * 8);
    bytes[i] = static_cast<std::uint8_t>(value_.high >> shift);
    bytes[i + 8] = static_cast<std::uint8_t>(value_.low >> shift);
  }
  return bytes;
}

std::pair<std::uint64_t, std::uint64_t> Ulid::toHalves() const noexcept {
  return {value_.high, value_.low};
}

bool Ulid::operator==(const Ulid& other) const noexcept {
  return value_ == other.value_;
}

bool Ulid::operator!=(const Ulid& other) const noexcept {
  return !(*this == other);
}

bool Ulid::operator<(const Ulid& other) const noexcept {
  return value_ < other.value_;
}

bool Ulid::operator<=(const Ulid& other) const noexcept {
  return value_ <= other.value_;
}

bool Ulid::operator>(const Ulid& other) const noexcept {
  return value_ > other.value_;
}

bool Ulid::operator>=(const Ulid& other) const noexcept {
  return value_ >= other.value_;
}

std::size_t Ulid::Hash::operator()(const Ulid& id) const noexcept {
  std::size_t seed = std::hash<std::uint64_t>{}(id.value_.high);
  seed ^= std::hash<std::uint64_t>{}(id.value_.low) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
  return seed;
}

std::ostream& operator<<(std::ostream& os, const Ulid& id) {
  std::array<char, base32::kUlidLength> buffer;
  base32::encodeToArray(id.toUint128(), buffer);
  return os.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
}

std::istream& operator>>(std::istream& is, Ulid& id) {
  std::string token;
  if (!(is >> token)) {
    return is;
  }

  auto parsed = Ulid::fromString(token);
  if (!parsed.has_value()) {
    is.setstate(std::ios_base::failbit);
    return is;
  }

  id = *parsed;
  return is;
}

}  // namespace ulidkit::core
