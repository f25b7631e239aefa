#pragma once

#include <optional>
#include <string>

namespace bookdrop {
namespace server {

/**
 * IPv4 address of the named network interface, if it is up.
 * An empty name picks the first up, non-loopback IPv4 interface.
 */
std::optional<std::string> resolveLocalAddress(const std::string& interfaceName);

} // namespace server
} // namespace bookdrop
