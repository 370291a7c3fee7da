#include "Extract.hpp"
#include "Walk.hpp"

#include "../Parsers.hpp"

#include <gsl-lite/gsl-lite.hpp>

#include <initializer_list>
#include <ostream>
#include <utility>

namespace nikke_db::html {

namespace {

Result<Node> Anchor(const Node& n, std::string_view what) {
  auto msg = std::string{"could not find "};
  msg += what;
  msg += " in document";
  return FromNullish(n, std::move(msg));
} // Anchor

Result<Node> Group1(const InfoAnchors& a)
  { return Anchor(a.group1, ".pi-horizontal-group #1"); }

Result<Node> Group2(const InfoAnchors& a)
  { return Anchor(a.group2, ".pi-horizontal-group #2"); }

// Prefer the lazy-load source over the placeholder.
Result<std::string> ImageSource(const Node& img) {
  for (auto key: {"data-src", "src"}) {
    if (auto a = img.attribute(key); a && a.value()[0] != '\0')
      return std::string{a.value()};
  }
  return AttributeMiss(std::string{"could not find image url on <"}
                       + img.name() + ">", "src");
} // ImageSource

} // local

InfoAnchors FindAnchors(const Node& doc) {
  auto a = InfoAnchors{};
  a.title  = FindByAttr(doc, wiki::DataSource, wiki::TitleSource);
  a.weapon = FindByAttr(doc, wiki::DataSource, wiki::WeaponSource);
  a.squad  = FindByAttr(doc, wiki::DataSource, wiki::SquadSource);
  auto groups = FindAllByClass(doc, wiki::InfoGroupClass);
  if (groups.size() > 0) a.group1 = groups[0];
  if (groups.size() > 1) a.group2 = groups[1];
  return a;
} // FindAnchors

Result<std::string> ExtractName(const InfoAnchors& a) {
  return Anchor(a.title, "[data-source=title]")
         .and_then(RequireText);
} // ExtractName

Result<Rarity> ExtractRarity(const InfoAnchors& a) {
  return Group1(a)
         .and_then(Walker(wiki::path::Rarity))
         .and_then(Attr("alt"))
         .and_then(ParseRarity);
} // ExtractRarity

Result<Burst> ExtractBurst(const InfoAnchors& a) {
  return Group1(a)
         .and_then(Walker(wiki::path::Burst))
         .and_then(Attr("alt"))
         .and_then(ParseBurst);
} // ExtractBurst

Result<std::optional<std::string>> ExtractWeaponName(const InfoAnchors& a) {
  return Optional(Anchor(a.weapon, "[data-source=weaponname]")
                  .and_then(LastChild)
                  .and_then(RequireText));
} // ExtractWeaponName

Result<std::string> ExtractSquad(const InfoAnchors& a) {
  return Anchor(a.squad, "[data-source=squad]")
         .and_then(LastChild)
         .and_then(RequireText);
} // ExtractSquad

Result<Code> ExtractCode(const InfoAnchors& a) {
  return Group2(a)
         .and_then(Walker(wiki::path::Code))
         .and_then(Attr("title"))
         .and_then(ParseCode);
} // ExtractCode

Result<Weapon> ExtractWeaponType(const InfoAnchors& a) {
  return Group2(a)
         .and_then(Walker(wiki::path::WeaponType))
         .and_then(Attr("title"))
         .and_then(ParseWeapon);
} // ExtractWeaponType

Result<Position> ExtractPosition(const InfoAnchors& a) {
  return Group2(a)
         .and_then(Walker(wiki::path::Position))
         .and_then(Attr("title"))
         .and_then(ParsePosition);
} // ExtractPosition

Result<Manufacturer> ExtractManufacturer(const InfoAnchors& a) {
  return Group2(a)
         .and_then(Walker(wiki::path::Manufacturer))
         .and_then(Attr("title"))
         .and_then(ParseManufacturer);
} // ExtractManufacturer

Result<Character, ErrorReport>
ExtractCharacter(const Node& doc, std::string image_url)
{
  const auto a = FindAnchors(doc);
  return Assemble<Character>(
      Field{"name",         ExtractName(a)},
      Field{"rarity",       ExtractRarity(a)},
      Field{"burst",        ExtractBurst(a)},
      Field{"weapon_name",  ExtractWeaponName(a)},
      Field{"squad",        ExtractSquad(a)},
      Field{"code",         ExtractCode(a)},
      Field{"weapon_type",  ExtractWeaponType(a)},
      Field{"position",     ExtractPosition(a)},
      Field{"manufacturer", ExtractManufacturer(a)},
      Field{"image_url",    std::move(image_url)});
} // ExtractCharacter

Result<ListEntry, ErrorReport>
ExtractCard(const Node& card, std::string_view base_url)
{
  const auto link = Walk(card, wiki::path::CardLink)
                    .transform_error(Prefix("missing <a>: "));
  const auto img  = link.and_then([](const Node& n) {
    return FirstChild(n).transform_error(Prefix("missing <img>: "));
  });
  return Assemble<ListEntry>(
      Field{"name", img.and_then(Attr("alt"))},
      Field{"url",  link.and_then(Attr("href"))
                        .transform([base_url](const std::string& href) {
                          return std::string{base_url} + href;
                        })},
      Field{"image_url", img.and_then(ImageSource)
                            .transform(StripRevision)});
} // ExtractCard

std::vector<ListEntry>
ExtractList(const Node& doc, std::ostream& log, std::string_view base_url)
{
  const auto body =
      Anchor(FindByClass(doc, wiki::ListTag, wiki::ListClass),
             "div.lcs-container")
      .and_then(Walker(wiki::path::ListBody));
  if (!body) {
    log << "error: extract list: " << body.error() << '\n';
    return {};
  }

  auto out = std::vector<ListEntry>{};
  auto index = gsl::index{0};
  for (const auto& card: ElementChildren(*body)) {
    ++index;
    auto entry = ExtractCard(card, base_url);
    if (entry)
      out.push_back(std::move(*entry));
    else
      log << "error: extract list: card " << index << ": "
          << entry.error() << '\n';
  }
  return out;
} // ExtractList

std::optional<std::string> PageImage(const Node& doc) {
  auto meta = FindByAttr(doc, "property", "og:image");
  if (auto a = meta.attribute("content"); a && a.value()[0] != '\0')
    return std::string{a.value()};
  return std::nullopt;
} // PageImage

std::string StripRevision(std::string_view url) {
  auto pos = url.find(wiki::RevisionMarker);
  return std::string{url.substr(0, pos)};
} // StripRevision

std::string ImageFilename(std::string_view url) {
  auto pos = url.rfind('/');
  if (pos == std::string_view::npos)
    return std::string{url};
  return std::string{url.substr(pos + 1)};
} // ImageFilename

} // nikke_db::html
