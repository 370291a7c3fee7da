#include "DailyRandom.hpp"

#include <gsl-lite/gsl-lite.hpp>

#include <charconv>
#include <stdexcept>
#include <string>
#include <system_error>

namespace nikke_db {

namespace {

// Unsigned digits filling all of @p s.
unsigned Digits(std::string_view s, std::string_view date) {
  auto v = 0u;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (s.empty() || s.front() < '0' || s.front() > '9'
      || ec != std::errc{} || ptr != s.data() + s.size())
    throw std::runtime_error{"invalid date (want YYYY-MM-DD): "
                             + std::string{date}};
  return v;
} // Digits

} // local

Seed SeedFor(std::chrono::year_month_day date) {
  gsl_Expects(date.ok());
  const auto day   = static_cast<unsigned>(date.day());
  const auto month = static_cast<unsigned>(date.month()) - 1;
  const auto year  = static_cast<int>(date.year());
  gsl_Expects(year >= 0);
  return static_cast<Seed>(day + month * 12 + static_cast<unsigned>(year) * 12 * 32);
} // SeedFor

Seed SeedForToday() {
  using namespace std::chrono;
  const auto today = floor<days>(system_clock::now());
  return SeedFor(year_month_day{today});
} // SeedForToday

std::chrono::year_month_day ParseDate(std::string_view s) {
  if (s.size() != 10 || s[4] != '-' || s[7] != '-')
    throw std::runtime_error{"invalid date (want YYYY-MM-DD): " + std::string{s}};
  const auto ymd = std::chrono::year_month_day{
      std::chrono::year {static_cast<int>(Digits(s.substr(0, 4), s))},
      std::chrono::month{Digits(s.substr(5, 2), s)},
      std::chrono::day  {Digits(s.substr(8, 2), s)}};
  if (!ymd.ok())
    throw std::runtime_error{"invalid date: " + std::string{s}};
  return ymd;
} // ParseDate

std::uint32_t IntRange(Seed seed, std::uint32_t min, std::uint32_t max) {
  gsl_Expects(min < max);
  return XorShift(seed) % (max - min) + min;
} // IntRange

std::uint32_t DailyRandom::next(std::uint32_t min, std::uint32_t max) {
  _seed = XorShift(_seed);
  return IntRange(_seed, min, max);
} // next

} // nikke_db
