// SPDX-License-Identifier: BSD-3-Clause
// Copyright 2026 Joel Rosdahl

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

// Connect timeout for every new connection to a Unix socket.
constexpr std::chrono::seconds UNIX_CONNECT_TIMEOUT{32};

// Synthetic host for requests that have no real network peer.
constexpr const char* DOCKER_HOST_HEADER = "docker";

size_t max_unix_socket_path_length();

struct TcpTransport
{
  std::string host_port;
};

struct UnixTransport
{
  std::string socket_path;
  bool disable_compression = true;
  std::chrono::milliseconds connect_timeout = UNIX_CONNECT_TIMEOUT;
};

using Transport = std::variant<TcpTransport, UnixTransport>;

struct DaemonHost
{
  Transport transport;
  std::string addr;      // host:port for TCP, the socket path for Unix
  std::string base_path; // Prefix of every request path, may be empty

  bool is_unix() const { return std::holds_alternative<UnixTransport>(transport); }
  bool is_tcp() const { return std::holds_alternative<TcpTransport>(transport); }

  // Authority to put in request URLs.
  std::string url_authority() const;
};

enum class HostError {
  NONE,
  INVALID_ADDRESS,      // no scheme:// separator
  UNSUPPORTED_PROTOCOL, // scheme other than tcp or unix
  PATH_TOO_LONG,        // Unix socket path does not fit in sockaddr_un
  INVALID_URL,          // tcp remainder is not a valid URL
};

struct DaemonHostResult
{
  HostError error = HostError::NONE;
  std::string message;
  DaemonHost host;

  bool ok() const { return error == HostError::NONE; }
};

DaemonHostResult parse_daemon_host(std::string_view address);
