#pragma once

#include <array>
#include <cstdint>
#include <string_view>

#ifndef GAMBIT_APP_VERSION
#define GAMBIT_APP_VERSION "0.7.0"
#endif

#ifndef GAMBIT_BUILD_RELEASE
#define GAMBIT_BUILD_RELEASE "Multi-device rounds"
#endif

namespace gambit {

inline constexpr std::string_view kAppDisplayName = "Gambit Golf";
inline constexpr std::string_view kClientTag = "gambit-golf-core";
inline constexpr std::string_view kHashtag = "gambitgolf";
inline constexpr std::string_view kAppVersion = GAMBIT_APP_VERSION;
inline constexpr std::string_view kBuildRelease = GAMBIT_BUILD_RELEASE;

inline constexpr std::array<std::string_view, 3> kDefaultPublishRelays = {
    "wss://relay.damus.io",
    "wss://nos.lol",
    "wss://relay.nostr.band",
};

inline constexpr std::array<std::string_view, 3> kDefaultReadRelays = {
    "wss://relay.damus.io",
    "wss://nos.lol",
    "wss://purplepag.es",
};

inline constexpr std::array<std::string_view, 2> kDefaultDmRelays = {
    "wss://relay.damus.io",
    "wss://nos.lol",
};

}  // namespace gambit
