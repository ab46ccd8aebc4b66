#pragma once

#include <functional>
#include <string>

namespace FlightLock {

using TokenGenerator = std::function<std::string()>;

/**
 * @brief Unique owner token for one lock acquisition attempt.
 *
 * 128 random bits as hex followed by a per-process sequence number, so two
 * attempts never share a token even if the random source repeats.
 */
std::string newOwnerToken();

} // namespace FlightLock
