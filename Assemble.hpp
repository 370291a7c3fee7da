/// @file
/// @brief Turn a fixed list of per-field Results into either a complete
///        record or a report of every field that failed.
#pragma once

#include "Result.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nikke_db {

/// Field name -> Error, in the order the fields were declared. Holds only
/// the fields that failed.
class ErrorReport {
public:
  using Entry          = std::pair<std::string, Error>;
  using const_iterator = std::vector<Entry>::const_iterator;

  void add(std::string_view field, Error err);

  bool empty() const noexcept { return _entries.empty(); }
  std::size_t size() const noexcept { return _entries.size(); }
  const_iterator begin() const noexcept { return _entries.begin(); }
  const_iterator end()   const noexcept { return _entries.end(); }

  bool contains(std::string_view field) const
    { return find(field) != nullptr; }
  const Error* find(std::string_view field) const;
  const Error& at(std::string_view field) const;
  std::vector<std::string> fields() const;

  bool operator==(const ErrorReport&) const = default;

private:
  std::vector<Entry> _entries;
}; // ErrorReport

std::ostream& operator<<(std::ostream& os, const ErrorReport& report);

template<typename T>
struct Field {
  std::string_view name;
  Result<T> value;
  Field(std::string_view name_, Result<T> value_)
    : name{name_}, value{std::move(value_)} { }
  Field(std::string_view name_, T plain)
    : name{name_}, value{std::move(plain)} { }
}; // Field

template<typename T> Field(std::string_view, Result<T>) -> Field<T>;
template<typename T> Field(std::string_view, T) -> Field<T>;

namespace detail {

template<typename T>
void Collect(ErrorReport& report, const Field<T>& f) {
  if (!f.value)
    report.add(f.name, f.value.error());
} // Collect

} // detail

/// Builds @p Record by aggregate initialisation from the unwrapped fields,
/// which must be passed in the record's member order. The record is only
/// constructed when every field is Ok.
template<typename Record, typename... Ts>
Result<Record, ErrorReport> Assemble(Field<Ts>... fields) {
  auto report = ErrorReport{};
  (detail::Collect(report, fields), ...);
  if (!report.empty())
    return std::unexpected{std::move(report)};
  return Record{std::move(*fields.value)...};
} // Assemble

} // nikke_db
