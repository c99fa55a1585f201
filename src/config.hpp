// SPDX-License-Identifier: BSD-3-Clause
// Copyright 2026 Joel Rosdahl

#pragma once

#include <optional>
#include <string>

constexpr const char* DEFAULT_DOCKER_HOST = "unix:///var/run/docker.sock";

struct Config
{
  std::string docker_host = DEFAULT_DOCKER_HOST;
  std::string scheme = "http"; // Scheme presented to the daemon, not the wire transport
  std::string api_version;     // Empty means no /v<version> segment
  std::string registry;        // Prefixed to every repository name
  unsigned int timeout_seconds = 0;
};

std::optional<Config> parse_config();
