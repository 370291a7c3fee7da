#include <gtest/gtest.h>
#include "Catalog.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace nikke_db;

namespace {

Character Make(std::string name, Rarity rarity = Rarity::Ssr) {
  return Character{std::move(name), rarity, Burst::III, std::nullopt,
                   "Counters", Code::Fire, Weapon::AssaultRifle,
                   Position::Attacker, Manufacturer::Elysion, "x.png"};
} // Make

std::vector<std::string> Names(const Catalog& c) {
  auto out = std::vector<std::string>{};
  for (const auto& ch: c.characters())
    out.push_back(ch.name);
  return out;
} // Names

} // local

TEST(CatalogTest, StartsEmpty) {
  auto c = Catalog{};
  EXPECT_TRUE(c.empty());
  EXPECT_EQ(c.size(), 0u);
  EXPECT_EQ(c.find("Rapi"), nullptr);
}

TEST(CatalogTest, KeepsNamesSortedIgnoringCase) {
  auto c = Catalog{};
  EXPECT_TRUE(c.add(Make("Rapi")));
  EXPECT_TRUE(c.add(Make("anis")));
  EXPECT_TRUE(c.add(Make("Neon")));
  EXPECT_TRUE(c.add(Make("Marian")));
  EXPECT_EQ(Names(c),
            (std::vector<std::string>{"anis", "Marian", "Neon", "Rapi"}));
}

TEST(CatalogTest, DuplicateNamesAreRejected) {
  auto c = Catalog{};
  EXPECT_TRUE(c.add(Make("Rapi", Rarity::Ssr)));
  EXPECT_FALSE(c.add(Make("RAPI", Rarity::R)));
  EXPECT_FALSE(c.add(Make("Rapi", Rarity::Sr)));
  ASSERT_EQ(c.size(), 1u);
  EXPECT_EQ(c.characters().front().rarity, Rarity::Ssr);
}

TEST(CatalogTest, FindIgnoresCase) {
  auto c = Catalog{};
  c.add(Make("Scarlet"));
  const auto* s = c.find("scarlet");
  ASSERT_NE(s, nullptr);
  EXPECT_EQ(s->name, "Scarlet");
  EXPECT_TRUE(c.contains("SCARLET"));
  EXPECT_FALSE(c.contains("Scar"));
}
