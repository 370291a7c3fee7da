#include "Nikke.hpp"

namespace nikke_db {

std::ostream& operator<<(std::ostream& os, const ListEntry& e) {
  return os << e.name << " <" << e.url << "> image=" << e.image_url;
}

std::ostream& operator<<(std::ostream& os, const Character& c) {
  os << c.name
     << " [" << Name(c.rarity) << ", burst " << Name(c.burst)
     << ", " << Name(c.code) << ", " << Name(c.weapon_type)
     << ", " << Name(c.position) << ", " << Name(c.manufacturer) << "]"
     << " squad=\"" << c.squad << "\"";
  if (c.weapon_name)
    os << " weapon=\"" << *c.weapon_name << "\"";
  return os << " image=" << c.image_url;
} // operator<<(Character)

} // nikke_db
