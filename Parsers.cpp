#include "Parsers.hpp"

#include <gsl-lite/gsl-lite.hpp>

#include <cstddef>
#include <regex>
#include <string>
#include <utility>

namespace nikke_db {

namespace {

namespace gsl = gsl_lite;

template<typename E>
using NameTable = std::pair<std::string_view, E>;

constexpr NameTable<Rarity> RarityNames[] = {
  {"R",   Rarity::R  },
  {"Sr",  Rarity::Sr },
  {"Ssr", Rarity::Ssr},
};

constexpr NameTable<Burst> BurstNames[] = {
  {"Step1",   Burst::I  },
  {"Step2",   Burst::II },
  {"Step3",   Burst::III},
  {"StepAll", Burst::A  },
};

constexpr NameTable<Code> CodeNames[] = {
  {"(Fire)",     Code::Fire    },
  {"(Water)",    Code::Water   },
  {"(Electric)", Code::Electric},
  {"(Iron)",     Code::Iron    },
  {"(Wind)",     Code::Wind    },
};

constexpr NameTable<Weapon> WeaponNames[] = {
  {"Shotgun",         Weapon::Shotgun       },
  {"Submachine Gun",  Weapon::SubmachineGun },
  {"Machine Gun",     Weapon::MachineGun    },
  {"Assault Rifle",   Weapon::AssaultRifle  },
  {"Sniper Rifle",    Weapon::SniperRifle   },
  {"Rocket Launcher", Weapon::RocketLauncher},
};

constexpr NameTable<Position> PositionNames[] = {
  {"Category:Attackers",  Position::Attacker },
  {"Category:Supporters", Position::Supporter},
  {"Category:Defenders",  Position::Defender },
};

constexpr NameTable<Manufacturer> ManufacturerNames[] = {
  {"Elysion",           Manufacturer::Elysion },
  {"Missilis Industry", Manufacturer::Missilis},
  {"Tetra Line",        Manufacturer::Tetra   },
  {"Pilgrim",           Manufacturer::Pilgrim },
  {"Abnormal",          Manufacturer::Abnormal},
};

template<typename E, std::size_t N>
Result<E> Lookup(const NameTable<E> (&table)[N], std::string_view key,
                 std::string_view raw, gsl::czstring what)
{
  for (const auto& [name, value]: table) {
    if (name == key)
      return value;
  }
  auto msg = std::string{"unknown "} + what + " '";
  msg += raw;
  msg += "'";
  return ParseMiss(std::move(msg), std::string{raw});
} // Lookup

} // local

Result<Rarity> ParseRarity(std::string_view raw)
  { return Lookup(RarityNames, raw, raw, "rarity"); }

Result<Burst> ParseBurst(std::string_view raw)
  { return Lookup(BurstNames, raw, raw, "burst"); }

Result<Code> ParseCode(std::string_view raw) {
  static const auto re = std::regex{R"(\(\w+\))"};
  auto m = std::cmatch{};
  auto key = std::string_view{};
  if (std::regex_search(raw.data(), raw.data() + raw.size(), m, re))
    key = std::string_view{m[0].first, static_cast<std::size_t>(m[0].length())};
  return Lookup(CodeNames, key, raw, "element code");
} // ParseCode

Result<Weapon> ParseWeapon(std::string_view raw)
  { return Lookup(WeaponNames, raw, raw, "weapon"); }

Result<Position> ParsePosition(std::string_view raw)
  { return Lookup(PositionNames, raw, raw, "position"); }

Result<Manufacturer> ParseManufacturer(std::string_view raw)
  { return Lookup(ManufacturerNames, raw, raw, "manufacturer"); }

} // nikke_db
