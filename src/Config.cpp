#include "Config.hpp"
#include "Logger.hpp"

#include <cstdlib>  // for std::getenv
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <vector>

using json = nlohmann::json;

namespace {
std::filesystem::path FindConfigFile() {
  std::vector<std::filesystem::path> dirs;
  if (const char* h = std::getenv("HOME")) {
    dirs.push_back(std::filesystem::path{h} / ".cache" / "reqgate");
  }
  dirs.push_back(std::filesystem::current_path() / "reqgate");
  dirs.push_back(std::filesystem::path{"/etc"} / "reqgate");

  for (auto const& dir : dirs) {
    std::error_code ec;
    if (std::filesystem::exists(dir / "conf.json", ec)) {
      return dir / "conf.json";
    }
  }
  return std::filesystem::path{};
}
}  // namespace

Config::Config(Defaults) {
}

Config::Config() : Config(Defaults{}) {
  auto found = FindConfigFile();
  if (found.empty()) {
    logr::debug << "[Config] no conf.json found; using defaults";
    return;
  }
  *this = Config(found);
}

Config::Config(const std::filesystem::path& config_file)
    : config_file_{config_file} {
  if (config_file_.empty() || !std::filesystem::exists(config_file_)) {
    throw std::runtime_error("reqgate config not found: " +
                             config_file_.string());
  }

  std::ifstream in{config_file_};
  if (!in.is_open()) {
    throw std::runtime_error("Failed to open " + config_file_.string());
  }
  std::stringstream ss;
  ss << in.rdbuf();

  Load(ss.str(), config_file_.string());
  logr::info << "[Config] loaded " << config_file_.string();
}

Config Config::FromJson(const std::string& text) {
  Config conf{Defaults{}};
  conf.Load(text, "<inline>");
  return conf;
}

void Config::Load(const std::string& text, const std::string& origin) {
  try {
    json j = json::parse(text);

    // {
    //   "total_weight": 8,
    //   "timeout_ms": 60000,
    //   "max_waiting_weight": 1048576,
    //   "transport": {
    //     "connect_timeout_ms": 10000,
    //     "timeout_ms": 45000,
    //     "user_agent": "reqgate/1.0",
    //     "ca_info": "/etc/ssl/certs/ca-certificates.crt",
    //     "follow_redirects": true,
    //     "max_redirects": 10,
    //     "verbose": false
    //   }
    // }
    total_weight_ = j.value("total_weight", kDefaultTotalWeight);
    timeout_ = std::chrono::milliseconds{
      j.value("timeout_ms", static_cast<long long>(kDefaultTimeout.count()))};
    max_waiting_weight_ =
      j.value("max_waiting_weight", kDefaultMaxWaitingWeight);

    if (auto it = j.find("transport"); it != j.end()) {
      const json& t = *it;
      if (!t.is_object()) {
        throw std::runtime_error("\"transport\" must be an object");
      }
      transport_.connect_timeout = std::chrono::milliseconds{t.value(
        "connect_timeout_ms",
        static_cast<long long>(transport_.connect_timeout.count()))};
      transport_.timeout = std::chrono::milliseconds{t.value(
        "timeout_ms", static_cast<long long>(transport_.timeout.count()))};
      transport_.user_agent = t.value("user_agent", transport_.user_agent);
      transport_.ca_info = t.value("ca_info", transport_.ca_info);
      transport_.follow_redirects =
        t.value("follow_redirects", transport_.follow_redirects);
      transport_.max_redirects =
        t.value("max_redirects", transport_.max_redirects);
      transport_.verbose = t.value("verbose", transport_.verbose);
    }
  } catch (const std::exception& ex) {
    throw std::runtime_error("Error parsing " + origin + ": " + ex.what());
  }
}

std::filesystem::path Config::GetConfigFile() const {
  return config_file_;
}

std::int64_t Config::GetTotalWeight() const {
  return total_weight_;
}

std::chrono::milliseconds Config::GetTimeout() const {
  return timeout_;
}

std::int64_t Config::GetMaxWaitingWeight() const {
  return max_waiting_weight_;
}

const TransportOptions& Config::GetTransportOptions() const {
  return transport_;
}
