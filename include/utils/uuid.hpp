#pragma once

#include <string>

namespace updown {

/**
 * Random RFC 4122 version 4 UUID, lowercase hex.
 */
std::string generate_uuid();

} // namespace updown
