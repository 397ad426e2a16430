#pragma once

#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace fieldops {

// Canonical key=value form. Absent optionals are omitted, so equal payloads encode identically.
std::string encode_payload(const Payload& payload);

Result decode_payload(EventKind kind, std::string_view canonical, Payload& out);

// Structural checks only. On failure `Result::data` names the offending field.
Result validate_payload(const Payload& payload);

}  // namespace fieldops
