// Saved-page fixtures shaped like the wiki's infobox and listing markup.
#pragma once

#include <string>
#include <string_view>

namespace nikke_db::test {

inline constexpr std::string_view CharacterPage = R"(<html>
<head>
  <title>Rapi | NIKKE Wiki</title>
  <meta property="og:image" content="https://static.wikia.nocookie.net/nikke/images/4/4b/Rapi.png/revision/latest/scale-to-width-down/1200?cb=2022"/>
</head>
<body>
<aside class="portable-infobox pi-theme-wikia">
  <h2 class="pi-item pi-title" data-source="title">  Rapi  </h2>
  <table class="pi-horizontal-group">
    <thead><tr><th>Rarity</th><th>Burst</th></tr></thead>
    <tbody>
      <tr>
        <td>Rarity: <span><a href="/wiki/Category:SSR"><img alt="Ssr" src="ssr.png"/></a></span></td>
        <td><span><a href="/wiki/Category:Burst_III"><img alt="Step3" src="b3.png"/></a></span></td>
      </tr>
    </tbody>
  </table>
  <div class="pi-item pi-data" data-source="weaponname">
    <h3 class="pi-data-label">Weapon</h3>
    <div class="pi-data-value">Wolf Destroyer</div>
  </div>
  <div class="pi-item pi-data" data-source="squad">
    <h3 class="pi-data-label">Squad</h3>
    <div class="pi-data-value">Counters</div>
  </div>
  <table class="pi-horizontal-group pi-horizontal-group-no-labels">
    <tbody>
      <tr>
        <td><span><a href="/wiki/Fire" title="Burst Code (Fire)">Fire</a></span></td>
        <td><span><a href="/wiki/Assault_Rifle" title="Assault Rifle">AR</a></span></td>
        <td><span><a href="/wiki/Category:Attackers" title="Category:Attackers">Attacker</a></span></td>
        <td><span><a href="/wiki/Elysion" title="Elysion">Elysion</a></span></td>
      </tr>
    </tbody>
  </table>
</aside>
</body>
</html>
)";

inline constexpr std::string_view WeaponNameBlock = R"(<div class="pi-item pi-data" data-source="weaponname">
    <h3 class="pi-data-label">Weapon</h3>
    <div class="pi-data-value">Wolf Destroyer</div>
  </div>)";

inline constexpr std::string_view ListPage = R"(<html>
<body>
<div class="lcs-container">
  <div class="lcs-header">Characters</div>
  <div class="lcs-body">
    <div class="lcs-filters"><span>All</span></div>
    <div class="lcs-grid">
      <div class="lcs-card">
        <div class="lcs-card-image"><a href="/wiki/Rapi"><img alt="Rapi" src="data:image/gif;base64,R0lGODlhAQABAIABAAAAAP" data-src="https://static.wikia.nocookie.net/nikke/images/4/4b/Rapi.png/revision/latest/scale-to-width-down/80?cb=1"/></a></div>
        <div class="lcs-card-name">Rapi</div>
      </div>
      <div class="lcs-card">
        <div class="lcs-card-image"></div>
        <div class="lcs-card-name">Anis</div>
      </div>
      <div class="lcs-card">
        <div class="lcs-card-image"><a href="/wiki/Neon"><img alt="Neon" src="https://static.wikia.nocookie.net/nikke/images/1/1a/Neon.png/revision/latest/scale-to-width-down/80?cb=2"/></a></div>
      </div>
    </div>
  </div>
</div>
</body>
</html>
)";

/// @p text with the first occurrence of @p from replaced by @p to.
inline std::string Replace(std::string_view text, std::string_view from,
                           std::string_view to)
{
  auto out = std::string{text};
  auto pos = out.find(from);
  if (pos != std::string::npos)
    out.replace(pos, from.size(), to);
  return out;
} // Replace

} // nikke_db::test
