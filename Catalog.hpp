/// @file
/// @brief Known characters, unique by case-insensitive name.
#pragma once

#include "Nikke.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace nikke_db {

class Catalog {
public:
  /// False (and no change) if a character of that name is already known.
  bool add(Character c);

  bool contains(std::string_view name) const;
  const Character* find(std::string_view name) const;

  /// Sorted by name.
  const std::vector<Character>& characters() const noexcept
    { return _characters; }

  bool empty() const noexcept { return _characters.empty(); }
  std::size_t size() const noexcept { return _characters.size(); }

private:
  std::vector<Character> _characters;
}; // Catalog

} // nikke_db
