#include "Catalog.hpp"

#include <boost/algorithm/string/compare.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <utility>

namespace nikke_db {

namespace {

// Case-insensitive first, then exact, so the order is total.
bool NameLess(std::string_view a, std::string_view b) {
  if (boost::algorithm::ilexicographical_compare(a, b))
    return true;
  if (boost::algorithm::ilexicographical_compare(b, a))
    return false;
  return a < b;
} // NameLess

} // local

bool Catalog::add(Character c) {
  if (contains(c.name))
    return false;
  auto pos = std::ranges::upper_bound(_characters, c.name, NameLess,
                                      &Character::name);
  _characters.insert(pos, std::move(c));
  return true;
} // add

const Character* Catalog::find(std::string_view name) const {
  auto it = std::ranges::find_if(_characters, [name](const Character& c) {
    return boost::algorithm::iequals(c.name, name);
  });
  return (it != _characters.end()) ? &*it : nullptr;
} // find

bool Catalog::contains(std::string_view name) const
  { return find(name) != nullptr; }

} // nikke_db
