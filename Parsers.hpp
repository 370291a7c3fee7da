/// @file
/// @brief Raw wiki strings -> closed-set categories.
///
/// Every parser is total: unknown input is a ParseMiss whose message and
/// context carry the raw string. There is no fallback value.
#pragma once

#include "Nikke.hpp"
#include "Result.hpp"

#include <string_view>

namespace nikke_db {

/// "R", "Sr", "Ssr" (image alt text).
Result<Rarity> ParseRarity(std::string_view raw);

/// "Step1", "Step2", "Step3", "StepAll" (image alt text).
Result<Burst> ParseBurst(std::string_view raw);

/// First parenthesised word, e.g. "Burst Code (Fire)" -> Code::Fire.
Result<Code> ParseCode(std::string_view raw);

Result<Weapon> ParseWeapon(std::string_view raw);

/// Category link label, e.g. "Category:Attackers".
Result<Position> ParsePosition(std::string_view raw);

/// Display name, e.g. "Missilis Industry".
Result<Manufacturer> ParseManufacturer(std::string_view raw);

} // nikke_db
