/// @file
/// @brief Character record and its closed-set categories.
///
/// Enumerator values are the stable 0-based codes used by the database.
#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace nikke_db {

enum class Rarity { R, Sr, Ssr };

enum class Burst { I, II, III, A };

enum class Code { Fire, Water, Electric, Iron, Wind };

enum class Weapon {
  Shotgun,
  SubmachineGun,
  MachineGun,
  AssaultRifle,
  SniperRifle,
  RocketLauncher
}; // Weapon

enum class Position { Attacker, Supporter, Defender };

enum class Manufacturer { Elysion, Missilis, Tetra, Pilgrim, Abnormal };

constexpr const char* Name(Rarity x) {
  switch (x) {
    case Rarity::R:   return "R";
    case Rarity::Sr:  return "SR";
    case Rarity::Ssr: return "SSR";
    default: return nullptr;
  }
} // Name(Rarity)

constexpr const char* Name(Burst x) {
  switch (x) {
    case Burst::I:   return "I";
    case Burst::II:  return "II";
    case Burst::III: return "III";
    case Burst::A:   return "A";
    default: return nullptr;
  }
} // Name(Burst)

constexpr const char* Name(Code x) {
  switch (x) {
    case Code::Fire:     return "Fire";
    case Code::Water:    return "Water";
    case Code::Electric: return "Electric";
    case Code::Iron:     return "Iron";
    case Code::Wind:     return "Wind";
    default: return nullptr;
  }
} // Name(Code)

constexpr const char* Name(Weapon x) {
  switch (x) {
    case Weapon::Shotgun:        return "Shotgun";
    case Weapon::SubmachineGun:  return "Submachine Gun";
    case Weapon::MachineGun:     return "Machine Gun";
    case Weapon::AssaultRifle:   return "Assault Rifle";
    case Weapon::SniperRifle:    return "Sniper Rifle";
    case Weapon::RocketLauncher: return "Rocket Launcher";
    default: return nullptr;
  }
} // Name(Weapon)

constexpr const char* Name(Position x) {
  switch (x) {
    case Position::Attacker:  return "Attacker";
    case Position::Supporter: return "Supporter";
    case Position::Defender:  return "Defender";
    default: return nullptr;
  }
} // Name(Position)

constexpr const char* Name(Manufacturer x) {
  switch (x) {
    case Manufacturer::Elysion:  return "Elysion";
    case Manufacturer::Missilis: return "Missilis";
    case Manufacturer::Tetra:    return "Tetra";
    case Manufacturer::Pilgrim:  return "Pilgrim";
    case Manufacturer::Abnormal: return "Abnormal";
    default: return nullptr;
  }
} // Name(Manufacturer)

/// One card of the character listing.
struct ListEntry {
  std::string name;
  std::string url;        // absolute page url
  std::string image_url;  // full-size image, revision suffix removed
  bool operator==(const ListEntry&) const = default;
}; // ListEntry

/// A fully extracted character. Members are in assembly order.
struct Character {
  std::string name;
  Rarity rarity;
  Burst burst;
  std::optional<std::string> weapon_name;  // absent for some characters
  std::string squad;
  Code code;
  Weapon weapon_type;
  Position position;
  Manufacturer manufacturer;
  std::string image_url;                   // image file name
  bool operator==(const Character&) const = default;
}; // Character

std::ostream& operator<<(std::ostream& os, const ListEntry& e);
std::ostream& operator<<(std::ostream& os, const Character& c);

} // nikke_db
