#pragma once

#include <string_view>

#include "core/model/types.hpp"

namespace fieldops {

// Reads a `key=value` engine profile over the values already in `config`. Lines starting with
// '#' are comments. `policy.<wire kind>=<spec>` lines become policy overrides.
Result load_engine_profile(std::string_view path, EngineConfig& config);
Result write_engine_profile(std::string_view path, const EngineConfig& config);

}  // namespace fieldops
