#include "bookdrop/server/LocalAddress.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace bookdrop {
namespace server {

std::optional<std::string> resolveLocalAddress(const std::string& interfaceName)
{
    ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0 || !ifaddr) {
        std::cerr << "getifaddrs failed: " << std::strerror(errno) << std::endl;
        return std::nullopt;
    }

    std::optional<std::string> address;
    for (ifaddrs* ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_name || !ifa->ifa_addr) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;
        if (ifa->ifa_addr->sa_family != AF_INET) continue;

        if (interfaceName.empty()) {
            if (ifa->ifa_flags & IFF_LOOPBACK) continue;
        } else if (interfaceName != ifa->ifa_name) {
            continue;
        }

        char buf[INET_ADDRSTRLEN] = { 0 };
        auto* sin = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
            address = std::string(buf);
            break;
        }
    }
    freeifaddrs(ifaddr);

    return address;
}

} // namespace server
} // namespace bookdrop
