// SPDX-License-Identifier: BSD-3-Clause
// Copyright 2026 Joel Rosdahl

#include "daemon_host.hpp"

#include <curl/curl.h>

#include <memory>

#ifndef _WIN32
#  include <sys/un.h>
#endif

namespace {

using CurlUrl = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

static DaemonHostResult failure(HostError error,
                                std::string_view address,
                                const std::string& reason)
{
  DaemonHostResult result;
  result.error = error;
  result.message = "parse docker host `" + std::string(address) + "`: " + reason;
  return result;
}

static std::string url_part(CURLU* url, CURLUPart part, CURLUcode& rc)
{
  char* value = nullptr;
  rc = curl_url_get(url, part, &value, 0);
  if (rc != CURLUE_OK) {
    return {};
  }
  std::string result(value);
  curl_free(value);
  return result;
}

static DaemonHostResult parse_tcp(std::string_view address, const std::string& addr)
{
  CurlUrl url(curl_url(), curl_url_cleanup);
  if (!url) {
    return failure(HostError::INVALID_URL, address, "out of memory");
  }

  std::string full = "tcp://" + addr;
  // Dot segments belong to the base path and are kept as written.
  CURLUcode rc = curl_url_set(
    url.get(), CURLUPART_URL, full.c_str(), CURLU_NON_SUPPORT_SCHEME | CURLU_PATH_AS_IS);
  if (rc != CURLUE_OK) {
    return failure(HostError::INVALID_URL, address, curl_url_strerror(rc));
  }

  std::string host = url_part(url.get(), CURLUPART_HOST, rc);
  if (rc != CURLUE_OK) {
    return failure(HostError::INVALID_URL, address, curl_url_strerror(rc));
  }

  std::string port = url_part(url.get(), CURLUPART_PORT, rc);
  if (rc != CURLUE_OK && rc != CURLUE_NO_PORT) {
    return failure(HostError::INVALID_URL, address, curl_url_strerror(rc));
  }

  std::string path = url_part(url.get(), CURLUPART_PATH, rc);
  if (rc != CURLUE_OK) {
    return failure(HostError::INVALID_URL, address, curl_url_strerror(rc));
  }
  // curl reports "/" for a URL without path.
  if (addr.find('/') == std::string::npos) {
    path.clear();
  }

  DaemonHostResult result;
  result.host.addr = port.empty() ? host : host + ":" + port;
  result.host.base_path = path;
  result.host.transport = TcpTransport{result.host.addr};
  return result;
}

static DaemonHostResult parse_unix(std::string_view address, const std::string& addr)
{
  if (addr.size() > max_unix_socket_path_length()) {
    return failure(HostError::PATH_TOO_LONG,
                   address,
                   "Unix socket path \"" + addr + "\" is too long");
  }

  DaemonHostResult result;
  result.host.addr = addr;
  result.host.transport = UnixTransport{addr};
  return result;
}

} // namespace

size_t max_unix_socket_path_length()
{
#ifdef _WIN32
  return 108;
#else
  return sizeof(sockaddr_un{}.sun_path);
#endif
}

std::string DaemonHost::url_authority() const
{
  if (is_unix()) {
    return DOCKER_HOST_HEADER;
  }
  return addr;
}

DaemonHostResult parse_daemon_host(std::string_view address)
{
  size_t separator = address.find("://");
  if (separator == std::string_view::npos) {
    return failure(HostError::INVALID_ADDRESS, address, "unable to parse docker host");
  }

  std::string protocol(address.substr(0, separator));
  std::string addr(address.substr(separator + 3));

  if (protocol == "tcp") {
    return parse_tcp(address, addr);
  } else if (protocol == "unix") {
    return parse_unix(address, addr);
  } else {
    return failure(
      HostError::UNSUPPORTED_PROTOCOL, address, "Protocol " + protocol + " not supported");
  }
}
