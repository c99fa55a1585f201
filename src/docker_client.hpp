// SPDX-License-Identifier: BSD-3-Clause
// Copyright 2026 Joel Rosdahl

#pragma once

#include "config.hpp"
#include "context.hpp"
#include "daemon_host.hpp"

#include <curl/curl.h>
#include <uv.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

enum class DockerResult {
  OK,
  REQUEST_ERROR,   // request URL could not be built
  TRANSPORT_ERROR, // connect/send failure or cancellation, no response received
  DAEMON_ERROR,    // non-200 status
  READ_ERROR,      // failure while reading an error body or draining a stream
};

const char* to_string(DockerResult result);

struct DockerResponse
{
  DockerResult result = DockerResult::OK;
  std::string error;
  long http_code = 0;
  bool cancelled = false; // Only set together with TRANSPORT_ERROR
  uint64_t bytes_read = 0;

  bool ok() const { return result == DockerResult::OK; }
};

using DockerCallback = std::function<void(DockerResponse&&)>;
using QueryParams = std::map<std::string, std::string>;
using HeaderList = std::vector<std::pair<std::string, std::string>>;

// base_path + "/v<version>" + path, with a leading "v" in version ignored. No version segment if
// version is empty.
std::string build_api_path(const std::string& base_path,
                           const std::string& version,
                           const std::string& path);

// Returns std::nullopt and sets error if the URL can't be built.
std::optional<std::string> build_request_url(const std::string& scheme,
                                             const std::string& authority,
                                             const std::string& api_path,
                                             const QueryParams& query,
                                             std::string& error);

class DockerClient;

struct HttpRequest
{
  DockerClient* client = nullptr;
  CURL* handle = nullptr;
  std::string path; // Operation path, used in error messages
  std::string url;
  std::vector<uint8_t> request_data;
  size_t upload_pos = 0;
  std::string error_body;
  uint64_t bytes_read = 0;
  long http_code = 0;
  bool drain_on_success = false;
  bool headers_done = false;
  bool acknowledged = false; // 200 seen and the body is not wanted
  std::string cancel_reason;
  Context context;
  CancellationRegistration cancellation;
  uv_timer_t timer; // Deadline and cancellation
  DockerCallback callback;
  struct curl_slist* headers = nullptr;
  char error_buf[CURL_ERROR_SIZE] = {0};
};

struct CurlSocketContext
{
  uv_poll_t poll_handle;
  curl_socket_t sockfd;
  DockerClient* client;
};

// Client for the image endpoints of a Docker daemon. All methods and callbacks run on the thread
// running the loop. Callbacks must not destroy the client.
//
// Destroying the client completes requests still in flight with TRANSPORT_ERROR and
// cancelled set. Those callbacks run from the destructor and must not use the client.
class DockerClient
{
public:
  DockerClient(uv_loop_t& loop, const Config& config);
  ~DockerClient();

  DockerClient(const DockerClient&) = delete;
  DockerClient& operator=(const DockerClient&) = delete;

  bool init();

  const DaemonHost& host() const { return _host; }

  // Completes after the daemon has streamed the whole pull progress.
  void image_pull(const Context& context,
                  const std::string& repository,
                  const std::string& tag,
                  DockerCallback&& callback);

  void post(const Context& context,
            const std::string& path,
            const QueryParams& query,
            const HeaderList& headers,
            std::vector<uint8_t>&& body,
            bool drain_on_success,
            DockerCallback&& callback);

private:
  CURL* create_easy_handle(HttpRequest* request, const HeaderList& headers);
  void check_multi_info();
  void complete(CURL* handle, DockerResponse&& response);
  void abort_request(HttpRequest* request);
  void finish_acknowledged(HttpRequest* request);

  CurlSocketContext* create_socket_context(curl_socket_t sockfd);
  void destroy_socket_context(CurlSocketContext* ctx);

  // Static callbacks for curl:
  static int socket_callback(CURL* handle, curl_socket_t s, int action, void* userp, void* socketp);
  static int timer_callback(CURLM* multi, long timeout_ms, void* userp);
  static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata);
  static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
  static size_t read_callback(char* ptr, size_t size, size_t nmemb, void* userdata);

  // Static callbacks for libuv:
  static void on_timeout(uv_timer_t* handle);
  static void on_poll(uv_poll_t* handle, int status, int events);
  static void on_request_timer(uv_timer_t* handle);

  uv_loop_t& _loop;
  const Config& _config;
  DaemonHost _host;
  bool _curl_initialized = false;
  CURLM* _multi_handle = nullptr;
  uv_timer_t* _timeout_timer = nullptr;
  std::unordered_map<CURL*, std::unique_ptr<HttpRequest>> _active_requests;
  std::unordered_set<CurlSocketContext*> _socket_contexts;
};
