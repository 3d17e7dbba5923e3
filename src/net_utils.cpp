#include "net_utils.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace {

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string ipv4_to_string(const sockaddr* addr) {
  if(!addr || addr->sa_family != AF_INET) return {};
  char buf[INET_ADDRSTRLEN] = {0};
  const auto* in = reinterpret_cast<const sockaddr_in*>(addr);
  if(!inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf))) return {};
  return buf;
}

int address_rank(const NetworkInterface& iface) {
  if(iface.is_loopback) return 100;
  int rank = iface.is_virtual ? 50 : 0;
  if(iface.address.rfind("192.168.", 0) == 0) return rank + 1;
  if(iface.address.rfind("10.", 0) == 0) return rank + 2;
  if(is_private_ipv4(iface.address)) return rank + 3;
  if(iface.address.rfind("169.254.", 0) == 0) return rank + 20;
  return rank + 10;
}

} // namespace

bool is_virtual_adapter_name(const std::string& name) {
  static const std::array<const char*, 16> kMarkers = {
    "docker", "veth", "virbr", "vmnet", "vmware", "vbox", "virtualbox",
    "hyper-v", "vethernet", "wsl", "tun", "tap", "wg", "zt", "br-", "lxc"
  };
  auto lowered = to_lower(name);
  for(const auto* marker : kMarkers) {
    if(lowered.find(marker) != std::string::npos) return true;
  }
  return false;
}

bool is_private_ipv4(const std::string& address) {
  in_addr addr{};
  if(inet_pton(AF_INET, address.c_str(), &addr) != 1) return false;
  uint32_t host = ntohl(addr.s_addr);
  if((host >> 24) == 10) return true;
  if((host >> 16) == ((192u << 8) | 168u)) return true;
  if((host >> 20) == ((172u << 4) | 1u)) return true; // 172.16.0.0/12
  return false;
}

std::vector<NetworkInterface> list_ipv4_interfaces() {
  std::vector<NetworkInterface> out;
  ifaddrs* head = nullptr;
  if(getifaddrs(&head) != 0) return out;
  for(auto* it = head; it; it = it->ifa_next) {
    if(!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
    if(!(it->ifa_flags & IFF_UP)) continue;
    NetworkInterface iface;
    iface.name = it->ifa_name ? it->ifa_name : "";
    iface.address = ipv4_to_string(it->ifa_addr);
    if(iface.address.empty()) continue;
    if((it->ifa_flags & IFF_BROADCAST) && it->ifa_broadaddr) {
      iface.broadcast = ipv4_to_string(it->ifa_broadaddr);
    }
    iface.is_loopback = (it->ifa_flags & IFF_LOOPBACK) != 0;
    iface.is_virtual = is_virtual_adapter_name(iface.name);
    out.push_back(std::move(iface));
  }
  freeifaddrs(head);
  return out;
}

std::optional<NetworkInterface> pick_lan_interface(const std::vector<NetworkInterface>& interfaces) {
  const NetworkInterface* best = nullptr;
  int best_rank = 0;
  for(const auto& iface : interfaces) {
    if(iface.is_loopback) continue;
    int rank = address_rank(iface);
    if(!best || rank < best_rank) {
      best = &iface;
      best_rank = rank;
    }
  }
  if(!best) return std::nullopt;
  return *best;
}
