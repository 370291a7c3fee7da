#include "Assemble.hpp"

#include <algorithm>
#include <stdexcept>

namespace nikke_db {

void ErrorReport::add(std::string_view field, Error err) {
  auto it = std::ranges::find(_entries, field, &Entry::first);
  if (it != _entries.end()) {
    it->second = std::move(err);
    return;
  }
  _entries.emplace_back(std::string{field}, std::move(err));
} // add

const Error* ErrorReport::find(std::string_view field) const {
  auto it = std::ranges::find(_entries, field, &Entry::first);
  return (it != _entries.end()) ? &it->second : nullptr;
} // find

const Error& ErrorReport::at(std::string_view field) const {
  if (auto e = find(field))
    return *e;
  throw std::out_of_range{"ErrorReport: no error for field '"
                          + std::string{field} + "'"};
} // at

std::vector<std::string> ErrorReport::fields() const {
  auto out = std::vector<std::string>{};
  out.reserve(_entries.size());
  for (const auto& [field, err]: _entries)
    out.push_back(field);
  return out;
} // fields

std::ostream& operator<<(std::ostream& os, const ErrorReport& report) {
  auto sep = "";
  for (const auto& [field, err]: report) {
    os << sep << field << ": " << err.message;
    sep = "; ";
  }
  return os;
} // operator<<

} // nikke_db
