/**
 * @file Logos.cpp
 * @brief Logo art tables and color substitution.
 */

#include "src/display/inc/Logos.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cstddef> // std::size_t

namespace cpufetch {

namespace display {

using cpufetch::helpers::strings::equalsIgnoreCase;

namespace {

/* ----------------------------- Art ----------------------------- */

constexpr std::array<std::string_view, 15> AMD_LOGO{{
    "$C2          '###############             ",
    "$C2             ,#############            ",
    "$C2                      .####            ",
    "$C2              #.      .####            ",
    "$C2            :##.      .####            ",
    "$C2           :###.      .####            ",
    "$C2           #########.   :##            ",
    "$C2           #######.       ;            ",
    "$C1                                       ",
    "$C1    ###     ###      ###   #######     ",
    "$C1   ## ##    #####  #####   ##     ##   ",
    "$C1  ##   ##   ### #### ###   ##      ##  ",
    "$C1 #########  ###  ##  ###   ##      ##  ",
    "$C1##       ## ###      ###   ##     ##   ",
    "$C1##       ## ###      ###   #######     ",
}};

constexpr std::array<std::string_view, 9> INTEL_LOGO{{
    "$C1  MMM                 oddl                   MMN   ",
    "$C1  MMM                 dMMN                   MMN   ",
    "$C1  ...  ....   ...     dMMM..      .cc.       NMN   ",
    "$C1  MMM  :MMMdWMMMMMX.  dMMMMM,  .XMMMMMMNo    MMN   ",
    "$C1  MMM  :MMMp    dMMM  dMMX   .NMW      WMN.  MMN   ",
    "$C1  MMM  :MMM      WMM  dMMK   kMMXooooooNMMx  MMN   ",
    "$C1  MMM  :MMM      NMM  dMMK   dMMX            MMN   ",
    "$C1  MMM  :MMM      NMM  dMMMoo  OMM0....:Nx.   MMN   ",
    "$C1  MMM  :WWW      XWW   lONMM   'xXMMMMNOc    MMN   ",
}};

constexpr std::array<std::string_view, 5> ARM_LOGO{{
    "$C1   #####  ##   # #####  ## ####  ######   ",
    "$C1 ###    ####   ###      ####  ###   ###   ",
    "$C1###       ##   ###      ###    ##    ###  ",
    "$C1 ###    ####   ###      ###    ##    ###  ",
    "$C1  ######  ##   ###      ###    ##    ###  ",
}};

constexpr std::array<std::string_view, 18> NVIDIA_LOGO{{
    "$C1               'cccccccccccccccccccccccccc   ",
    "$C1               ;oooooooooooooooooooooooool   ",
    "$C1           .:::.     .oooooooooooooooooool   ",
    "$C1      .:cll;   ,c:::.     cooooooooooooool   ",
    "$C1   ,clo'      ;.   oolc:     ooooooooooool   ",
    "$C1.cloo    ;cclo .      .olc.    coooooooool   ",
    "$C1oooo   :lo,    ;ll;    looc    :oooooooool      ",
    "$C1 oooc   ool.   ;oooc;clol    :looooooooool      ",
    "$C1  :ooc   ,ol;  ;oooooo.   .cloo;     loool      ",
    "$C1    ool;   .olc.       ,:lool        .lool      ",
    "$C1      ool:.    ,::::ccloo.        :clooool      ",
    "$C1         oolc::.            ':cclooooooool      ",
    "$C1               ;oooooooooooooooooooooooool      ",
    "                                                ",
    "$C2######.  ##   ##  ##  ######   ##    ###     ",
    "$C2##   ##  ##   ##  ##  ##   ##  ##   #: :#    ",
    "$C2##   ##   ## ##   ##  ##   ##  ##  #######   ",
    "$C2##   ##    ###    ##  ######   ## ##     ##  ",
}};

constexpr std::array<std::string_view, 5> POWERPC_LOGO{{
    "$C1     //////                                   //////    /////  ",
    "$C1    //// /// ,//// /// ///  /// /////  ///// /// ////////      ",
    "$C1   */////// /// ///////////// /// /// ///// ////////////       ",
    "$C1   ///     /// /// ///////// ///     ///   ///        ////.    ",
    "$C1  ///      /////   //  ///     //// ///   ///          /////   ",
}};

constexpr std::array<std::string_view, 17> APPLE_LOGO{{
    "$C1                    'c.                     ",
    "$C2                 ,xNMM.                     ",
    "$C3               .OMMMMo                      ",
    "$C4               OMMM0,                       ",
    "$C5     .;loddo:' loolloddol;.                 ",
    "$C6   cKMMMMMMMMMMNWMMMMMMMMMM0:               ",
    "$C7 .KMMMMMMMMMMMMMMMMMMMMMMMWd.               ",
    "$C1 XMMMMMMMMMMMMMMMMMMMMMMMX.                 ",
    "$C2;MMMMMMMMMMMMMMMMMMMMMMMM:                  ",
    "$C3:MMMMMMMMMMMMMMMMMMMMMMMM:                  ",
    "$C4.MMMMMMMMMMMMMMMMMMMMMMMMX.                 ",
    "$C5 kMMMMMMMMMMMMMMMMMMMMMMMMWd.               ",
    "$C6 .XMMMMMMMMMMMMMMMMMMMMMMMMMMk              ",
    "$C7  .XMMMMMMMMMMMMMMMMMMMMMMMMK.              ",
    "$C1    kMMMMMMMMMMMMMMMMMMMMMMd                ",
    "$C2     ;KMMMMMMMWXXWMMMMMMMk.                 ",
    "$C3       .cooc,.    .,coo:.                   ",
}};
/// One catalog row: accepted keys, art, palette.
struct LogoEntry {
  std::array<std::string_view, 3> keys; ///< Unused slots are empty
  const std::string_view* art;
  std::size_t artLines;
  std::array<std::string_view, 7> palette;
  std::size_t paletteSize;
};

const std::array<LogoEntry, 6> CATALOG{{
    {{"amd", "authenticamd", ""}, AMD_LOGO.data(), AMD_LOGO.size(), {COLOR_WHITE, COLOR_RED}, 2},
    {{"intel", "genuineintel", ""}, INTEL_LOGO.data(), INTEL_LOGO.size(), {COLOR_CYAN}, 1},
    {{"arm", "", ""}, ARM_LOGO.data(), ARM_LOGO.size(), {COLOR_CYAN}, 1},
    {{"nvidia", "", ""},
     NVIDIA_LOGO.data(),
     NVIDIA_LOGO.size(),
     {COLOR_GREEN, COLOR_WHITE},
     2},
    {{"powerpc", "", ""}, POWERPC_LOGO.data(), POWERPC_LOGO.size(), {COLOR_YELLOW}, 1},
    {{"apple", "", ""},
     APPLE_LOGO.data(),
     APPLE_LOGO.size(),
     {COLOR_RED, COLOR_YELLOW, COLOR_GREEN, COLOR_CYAN, COLOR_BLUE, COLOR_MAGENTA, COLOR_WHITE},
     7},
}};

const LogoEntry* findEntry(std::string_view key) noexcept {
  for (const LogoEntry& ENTRY : CATALOG) {
    for (const std::string_view ALIAS : ENTRY.keys) {
      if (!ALIAS.empty() && equalsIgnoreCase(key, ALIAS)) {
        return &ENTRY;
      }
    }
  }
  return nullptr;
}

} // namespace

/* ----------------------------- API ----------------------------- */

std::string substituteColors(std::string_view raw, const std::vector<std::string_view>& palette) {
  std::string out;
  out.reserve(raw.size() + 16);

  std::size_t i = 0;
  while (i < raw.size()) {
    if (raw[i] == '$' && i + 2 < raw.size() && raw[i + 1] == 'C') {
      const char TAG = raw[i + 2];
      if (TAG == 'R') {
        out.append(COLOR_RESET);
        i += 3;
        continue;
      }
      if (TAG >= '1' && TAG <= '9') {
        const std::size_t IDX = static_cast<std::size_t>(TAG - '1');
        if (IDX < palette.size()) {
          out.append(palette[IDX]);
        }
        i += 3;
        continue;
      }
    }
    out.push_back(raw[i]);
    ++i;
  }
  return out;
}

std::optional<std::vector<std::string>> lookupLogo(std::string_view vendorKey) {
  const LogoEntry* entry = findEntry(vendorKey);
  if (entry == nullptr) {
    return std::nullopt;
  }

  const std::vector<std::string_view> PALETTE(entry->palette.begin(),
                                              entry->palette.begin() + entry->paletteSize);
  std::vector<std::string> lines;
  lines.reserve(entry->artLines);
  for (std::size_t i = 0; i < entry->artLines; ++i) {
    lines.push_back(substituteColors(entry->art[i], PALETTE));
  }
  return lines;
}

bool isLogoName(std::string_view name) noexcept {
  for (const std::string_view LOGO : LOGO_NAMES) {
    if (equalsIgnoreCase(name, LOGO)) {
      return true;
    }
  }
  return false;
}

} // namespace display

} // namespace cpufetch
