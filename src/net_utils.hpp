#pragma once

#include <optional>
#include <string>
#include <vector>

struct NetworkInterface {
  std::string name;
  std::string address;
  std::string broadcast;
  bool is_loopback = false;
  bool is_virtual = false;
};

// All IPv4 interfaces that are up, loopback included.
std::vector<NetworkInterface> list_ipv4_interfaces();

bool is_virtual_adapter_name(const std::string& name);
bool is_private_ipv4(const std::string& address);

// Best address for LAN traffic: a private address on a physical adapter
// (192.168.x first, then 10.x, then 172.16-31.x), then any non-loopback
// physical address, then virtual adapters. nullopt when nothing but loopback.
std::optional<NetworkInterface> pick_lan_interface(const std::vector<NetworkInterface>& interfaces);
