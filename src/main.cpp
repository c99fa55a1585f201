// SPDX-License-Identifier: BSD-3-Clause
// Copyright 2026 Joel Rosdahl

#include "config.hpp"
#include "context.hpp"
#include "docker_client.hpp"
#include "logger.hpp"

#include <uv.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>

static constexpr auto USAGE =
  "Usage: dockerpull REPOSITORY TAG\n"
  "\n"
  "Asks a Docker daemon to pull REPOSITORY:TAG from the configured registry and\n"
  "waits until the daemon has finished.\n"
  "\n"
  "Environment:\n"
  "  DPULL_REGISTRY            registry host prefixed to REPOSITORY (required)\n"
  "  DPULL_DOCKER_HOST         daemon address, unix:///path or tcp://host:port[/path]\n"
  "                            (default unix:///var/run/docker.sock)\n"
  "  DPULL_DOCKER_SCHEME       http or https (default http)\n"
  "  DPULL_DOCKER_API_VERSION  API version, e.g. 1.24 (default: unversioned)\n"
  "  DPULL_TIMEOUT             seconds before giving up, 0 = never (default 0)\n"
  "  DPULL_LOGFILE             log file, - for stderr\n";

int main(int argc, char** argv)
{
  if (argc != 3) {
    std::cerr << USAGE;
    return 1;
  }

  init_logger();

  auto config = parse_config();
  if (!config) {
    std::cerr << "dockerpull: invalid configuration, see DPULL_LOGFILE output\n";
    LOG("Failed to parse configuration");
    return 1;
  }

  LOG("Starting");
  LOG("Docker host: " + config->docker_host);
  LOG("Registry: " + config->registry);
  LOG("API version: " + (config->api_version.empty() ? "none" : config->api_version));
  LOG("Timeout: " + std::to_string(config->timeout_seconds));

  uv_loop_t* loop = uv_default_loop();
  if (!loop) {
    LOG("Failed to create event loop");
    return 1;
  }

  std::optional<DockerResponse> outcome;
  {
    DockerClient client(*loop, *config);
    if (!client.init()) {
      std::cerr << "dockerpull: cannot use docker host " << config->docker_host << "\n";
      return 1;
    }

    Context context = Context::background();
    if (config->timeout_seconds > 0) {
      context = context.with_timeout(std::chrono::seconds(config->timeout_seconds));
    }

    // Idle pooled connections keep the loop alive, so stop it once the pull has completed.
    client.image_pull(context, argv[1], argv[2], [&outcome, loop](DockerResponse&& response) {
      outcome = std::move(response);
      uv_stop(loop);
    });

    int result = uv_run(loop, UV_RUN_DEFAULT);
    LOG("Event loop exited with code " + std::to_string(result));
  }

  uv_walk(
    loop,
    [](uv_handle_t* handle, void* /*arg*/) {
      if (!uv_is_closing(handle)) {
        uv_close(handle, nullptr);
      }
    },
    nullptr);

  // Run loop again to process close callbacks.
  uv_run(loop, UV_RUN_DEFAULT);
  uv_loop_close(loop);

  if (!outcome) {
    std::cerr << "dockerpull: pull did not complete\n";
    return 1;
  }
  if (!outcome->ok()) {
    std::cerr << "dockerpull: " << to_string(outcome->result) << ": " << outcome->error << "\n";
    LOG("Pull failed: " + outcome->error);
    return 1;
  }

  LOG("Pull of " + std::string(argv[1]) + ":" + argv[2] + " complete");
  return 0;
}
