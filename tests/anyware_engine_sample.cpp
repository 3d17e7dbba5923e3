#include "settings_manager.hpp"
#include "anyware_engine.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <thread>

int main() {
  namespace fs = std::filesystem;

  auto base = fs::temp_directory_path() / "anyware_engine_sample";
  std::error_code ec;
  fs::remove_all(base, ec);
  fs::create_directories(base / "deviceA", ec);
  fs::create_directories(base / "deviceB", ec);

  auto configure = [](const std::shared_ptr<SettingsManager>& settings,
                      const std::string& key,
                      const nlohmann::json& value){
    std::string error;
    if(!settings->set_from_json(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  };
  auto make_settings = [&](const fs::path& root, const std::string& name, const std::string& id){
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(root / ".config" / "settings.json");
    configure(settings, "bind_ip", "127.0.0.1");
    configure(settings, "transfer_port", 0);
    configure(settings, "discovery", false);
    configure(settings, "device_name", name);
    configure(settings, "device_id", id);
    return settings;
  };

  AnywareEngine::Options device_a;
  device_a.workspace_root = base / "deviceA";
  device_a.start_cli_thread = false;
  device_a.enable_latency = false;
  AnywareEngine engine_a(make_settings(base / "deviceA", "Sample A", "sample-a"), device_a);
  engine_a.start();
  engine_a.start_background();

  AnywareEngine::Options device_b;
  device_b.workspace_root = base / "deviceB";
  device_b.start_cli_thread = false;
  device_b.enable_latency = false;
  AnywareEngine engine_b(make_settings(base / "deviceB", "Sample B", "sample-b"), device_b);
  engine_b.start();
  engine_b.start_background();

  std::ofstream(base / "deviceB" / "hello.txt") << "hello from B";
  fs::create_directories(base / "deviceB" / "Shared", ec);
  std::ofstream(base / "deviceB" / "Shared" / "notes.txt") << "mirrored";

  engine_b.execute_command("add 127.0.0.1:" + std::to_string(engine_a.transfer_port()));
  engine_b.execute_command("devices");
  engine_b.execute_command("send sample-a " + (base / "deviceB" / "hello.txt").string());
  engine_b.execute_command("clip text sample-a copied on B");
  engine_b.execute_command("sync add " + (base / "deviceB" / "Shared").string() + " sample-a");
  engine_b.execute_command("sync list");

  std::this_thread::sleep_for(std::chrono::milliseconds(1500));

  engine_a.execute_command("transfers");
  engine_a.execute_command("clip history");
  engine_b.execute_command("queue history");
  engine_b.execute_command("settings");

  engine_b.stop();
  engine_a.stop();

  fs::remove_all(base, ec);
  return 0;
}
