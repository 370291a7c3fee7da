/// @file
/// @brief Deterministic "character of the day" selection.
///
/// The seed is a pure function of the UTC calendar day, so every caller
/// gets the same pick until UTC midnight. Not cryptographically secure.
#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <vector>

namespace nikke_db {

using Seed = std::uint32_t;

/// xorshift32 step.
constexpr Seed XorShift(Seed seed) noexcept {
  seed ^= seed << 13;
  seed ^= seed >> 17;
  seed ^= seed <<  5;
  return seed;
} // XorShift

static_assert(XorShift(1) == 270369u);

/// day + month0 * 12 + year * 384, month0 counted from 0 (January).
Seed SeedFor(std::chrono::year_month_day date);

/// SeedFor() of the current UTC calendar day.
Seed SeedForToday();

/// "YYYY-MM-DD", digits only, as a date SeedFor() accepts.
/// Throws std::runtime_error otherwise.
std::chrono::year_month_day ParseDate(std::string_view s);

/// Maps XorShift(@p seed) into [min, max).
std::uint32_t IntRange(Seed seed, std::uint32_t min, std::uint32_t max);

/// The element for @p seed, or nullptr when @p list is empty.
template<typename T>
const T* Pick(Seed seed, const std::vector<T>& list) {
  if (list.empty())
    return nullptr;
  const auto n = static_cast<std::uint32_t>(list.size());
  return &list[IntRange(seed, 0, n)];
} // Pick

class DailyRandom {
  Seed _seed;

public:
  DailyRandom() : _seed{SeedForToday()} { }
  explicit DailyRandom(Seed seed) noexcept : _seed{seed} { }

  Seed seed() const noexcept { return _seed; }

  /// Advances the seed, then maps it into [min, max).
  std::uint32_t next(std::uint32_t min, std::uint32_t max);

  template<typename T>
  const T* pick(const std::vector<T>& list) {
    if (list.empty())
      return nullptr;
    return &list[next(0, static_cast<std::uint32_t>(list.size()))];
  }
}; // DailyRandom

} // nikke_db
