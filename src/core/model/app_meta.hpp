#pragma once

#include <cstdint>
#include <string_view>

#ifndef FIELDOPS_APP_VERSION
#define FIELDOPS_APP_VERSION "0.4.0"
#endif

#ifndef FIELDOPS_BUILD_RELEASE
#define FIELDOPS_BUILD_RELEASE "Offline Core"
#endif

namespace fieldops {

inline constexpr std::string_view kAppDisplayName = "fieldops::Offline Operations Core";
inline constexpr std::string_view kAppVersion = FIELDOPS_APP_VERSION;
inline constexpr std::string_view kBuildRelease = FIELDOPS_BUILD_RELEASE;

inline constexpr std::uint32_t kCurrentSchemaVersion = 1;
inline constexpr std::string_view kGenesisHash =
    "0000000000000000000000000000000000000000000000000000000000000000";

inline constexpr std::string_view kResolverActorId = "system:conflict-resolver";
inline constexpr std::string_view kResolverSessionId = "conflict-resolver";

}  // namespace fieldops
