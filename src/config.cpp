// SPDX-License-Identifier: BSD-3-Clause
// Copyright 2026 Joel Rosdahl

#include "config.hpp"

#include "logger.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>

template<typename T> std::optional<T> parse_int(std::string_view str, int base = 10)
{
  T value{};
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value, base);
  if (ec == std::errc{} && ptr == str.data() + str.size()) {
    return value;
  }
  return std::nullopt;
}

static const char* get_env(const char* name)
{
  const char* value = std::getenv(name);
  if (!value || value[0] == '\0') {
    return nullptr;
  }
  return value;
}

std::optional<Config> parse_config()
{
  Config config;

  if (const char* docker_host = get_env("DPULL_DOCKER_HOST")) {
    config.docker_host = docker_host;
  }

  if (const char* scheme = get_env("DPULL_DOCKER_SCHEME")) {
    std::string_view value(scheme);
    if (value != "http" && value != "https") {
      LOG("DPULL_DOCKER_SCHEME must be http or https, got " + std::string(value));
      return std::nullopt;
    }
    config.scheme = scheme;
  }

  if (const char* api_version = get_env("DPULL_DOCKER_API_VERSION")) {
    config.api_version = api_version;
  }

  const char* registry = get_env("DPULL_REGISTRY");
  if (!registry) {
    LOG("DPULL_REGISTRY not set");
    return std::nullopt;
  }
  config.registry = registry;

  const char* timeout = get_env("DPULL_TIMEOUT");
  if (!timeout) {
    timeout = "0";
  }
  auto timeout_val = parse_int<unsigned int>(timeout);
  if (!timeout_val) {
    LOG("DPULL_TIMEOUT must be a non-negative integer");
    return std::nullopt;
  }
  config.timeout_seconds = *timeout_val;

  return config;
}
