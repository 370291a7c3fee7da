/// @file
/// @brief Extract characters and the character listing from wiki pages.
///
/// A character page is all or nothing: every field is extracted on its
/// own and Assemble() yields either a Character or the report of failed
/// fields. The listing is best effort: a failing card is logged and
/// skipped.
#pragma once

#include "Dom.hpp"

#include "../Assemble.hpp"
#include "../Nikke.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nikke_db {

// ---------------------------------------------------------------------
// Wiki layout constants.
namespace wiki {

constexpr char BaseUrl[]  = "https://nikke-goddess-of-victory-international.fandom.com";
constexpr char HomePath[] = "/wiki/Home";

constexpr char DataSource[]     = "data-source";
constexpr char TitleSource[]    = "title";
constexpr char WeaponSource[]   = "weaponname";
constexpr char SquadSource[]    = "squad";
constexpr char InfoGroupClass[] = "pi-horizontal-group";

constexpr char ListTag[]        = "div";
constexpr char ListClass[]      = "lcs-container";

constexpr char RevisionMarker[] = "/revision/latest/";

namespace path {
  constexpr char Rarity[]       = "$vvvvv";  // group 1
  constexpr char Burst[]        = "$v$vvv";  // group 1
  constexpr char Code[]         = "$vvvv";   // group 2
  constexpr char WeaponType[]   = "$vv>vv";  // group 2
  constexpr char Position[]     = "$v$<vv";  // group 2
  constexpr char Manufacturer[] = "$v$vv";   // group 2
  constexpr char ListBody[]     = "$$";      // from the list container
  constexpr char CardLink[]     = "vv";      // from a card
} // path

} // wiki

namespace html {

/// Nodes found once per character page. Missing anchors stay null.
struct InfoAnchors {
  Node title;
  Node weapon;
  Node squad;
  Node group1;
  Node group2;
}; // InfoAnchors

InfoAnchors FindAnchors(const Node& doc);

Result<std::string>                ExtractName(const InfoAnchors& a);
Result<Rarity>                     ExtractRarity(const InfoAnchors& a);
Result<Burst>                      ExtractBurst(const InfoAnchors& a);
Result<std::optional<std::string>> ExtractWeaponName(const InfoAnchors& a);
Result<std::string>                ExtractSquad(const InfoAnchors& a);
Result<Code>                       ExtractCode(const InfoAnchors& a);
Result<Weapon>                     ExtractWeaponType(const InfoAnchors& a);
Result<Position>                   ExtractPosition(const InfoAnchors& a);
Result<Manufacturer>               ExtractManufacturer(const InfoAnchors& a);

/// @p image_url is taken as is (normally from the page's ListEntry).
Result<Character, ErrorReport>
ExtractCharacter(const Node& doc, std::string image_url);

Result<ListEntry, ErrorReport>
ExtractCard(const Node& card, std::string_view base_url = wiki::BaseUrl);

/// One "error:" line per skipped card is written to @p log.
std::vector<ListEntry> ExtractList(const Node& doc, std::ostream& log,
                                   std::string_view base_url = wiki::BaseUrl);

/// Image url of a page's og:image meta tag, if any.
std::optional<std::string> PageImage(const Node& doc);

/// Cuts @p url before "/revision/latest/"; unchanged if not present.
std::string StripRevision(std::string_view url);

/// Last path segment of @p url.
std::string ImageFilename(std::string_view url);

} // html

} // nikke_db
