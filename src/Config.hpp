#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "CurlTransport.hpp"

class Config {
 public:
  static constexpr std::int64_t kDefaultTotalWeight{8};
  static constexpr std::chrono::milliseconds kDefaultTimeout{60000};
  static constexpr std::int64_t kDefaultMaxWaitingWeight{1 << 20};

  // Searches $HOME/.cache/reqgate, ./reqgate and /etc/reqgate for
  // conf.json; falls back to built-in defaults when none exists.
  Config();
  explicit Config(const std::filesystem::path& conf_file);

  Config(const Config& conf) = default;

  static Config FromJson(const std::string& text);

  std::filesystem::path GetConfigFile() const;

  std::int64_t GetTotalWeight() const;

  std::chrono::milliseconds GetTimeout() const;

  std::int64_t GetMaxWaitingWeight() const;

  const TransportOptions& GetTransportOptions() const;

 private:
  struct Defaults {};
  explicit Config(Defaults);

  void Load(const std::string& text, const std::string& origin);

  std::filesystem::path config_file_;
  std::int64_t total_weight_{kDefaultTotalWeight};
  std::chrono::milliseconds timeout_{kDefaultTimeout};
  std::int64_t max_waiting_weight_{kDefaultMaxWaitingWeight};
  TransportOptions transport_;
};
