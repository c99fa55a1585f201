// SPDX-License-Identifier: BSD-3-Clause
// Copyright 2026 Joel Rosdahl

#include "docker_client.hpp"

#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <string_view>
#include <type_traits>
#include <variant>

namespace {

using CurlUrl = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

constexpr const char* IMAGE_CREATE_PATH = "/images/create";

template<class> inline constexpr bool always_false = false;

// Frees everything owned by a request that is no longer known to the multi handle. The request
// itself is deleted when libuv has closed its timer.
static void release_request(HttpRequest* request)
{
  if (request->headers) {
    curl_slist_free_all(request->headers);
    request->headers = nullptr;
  }
  curl_easy_cleanup(request->handle);
  request->handle = nullptr;
  request->cancellation.reset();
  uv_timer_stop(&request->timer);
  uv_close(reinterpret_cast<uv_handle_t*>(&request->timer),
           [](uv_handle_t* handle) { delete static_cast<HttpRequest*>(handle->data); });
}

static DockerResponse make_error(DockerResult result, std::string error)
{
  DockerResponse response;
  response.result = result;
  response.error = std::move(error);
  return response;
}

} // namespace

const char* to_string(DockerResult result)
{
  switch (result) {
  case DockerResult::OK:
    return "ok";
  case DockerResult::REQUEST_ERROR:
    return "request error";
  case DockerResult::TRANSPORT_ERROR:
    return "transport error";
  case DockerResult::DAEMON_ERROR:
    return "daemon error";
  case DockerResult::READ_ERROR:
    return "response read error";
  }
  return "unknown";
}

std::string build_api_path(const std::string& base_path,
                           const std::string& version,
                           const std::string& path)
{
  if (version.empty()) {
    return base_path + path;
  }
  std::string_view v(version);
  if (v.front() == 'v') {
    v.remove_prefix(1);
  }
  return base_path + "/v" + std::string(v) + path;
}

std::optional<std::string> build_request_url(const std::string& scheme,
                                             const std::string& authority,
                                             const std::string& api_path,
                                             const QueryParams& query,
                                             std::string& error)
{
  CurlUrl url(curl_url(), curl_url_cleanup);
  if (!url) {
    error = "out of memory";
    return std::nullopt;
  }

  std::string base = scheme + "://" + authority + api_path;
  CURLUcode rc = curl_url_set(
    url.get(), CURLUPART_URL, base.c_str(), CURLU_NON_SUPPORT_SCHEME | CURLU_PATH_AS_IS);
  if (rc != CURLUE_OK) {
    error = std::string(curl_url_strerror(rc)) + ": " + base;
    return std::nullopt;
  }

  // The first '=' of each part is kept, everything else is URL encoded.
  for (const auto& param : query) {
    std::string part = param.first + "=" + param.second;
    rc = curl_url_set(
      url.get(), CURLUPART_QUERY, part.c_str(), CURLU_APPENDQUERY | CURLU_URLENCODE);
    if (rc != CURLUE_OK) {
      error = std::string(curl_url_strerror(rc)) + ": query parameter " + param.first;
      return std::nullopt;
    }
  }

  char* full = nullptr;
  rc = curl_url_get(url.get(), CURLUPART_URL, &full, 0);
  if (rc != CURLUE_OK) {
    error = curl_url_strerror(rc);
    return std::nullopt;
  }
  std::string result(full);
  curl_free(full);
  return result;
}

DockerClient::DockerClient(uv_loop_t& loop, const Config& config)
  : _loop(loop),
    _config(config)
{
}

DockerClient::~DockerClient()
{
  std::vector<DockerCallback> orphaned;
  if (_multi_handle) {
    for (auto& pair : _active_requests) {
      LOG("Dropping in-flight request " + pair.second->url);
      curl_multi_remove_handle(_multi_handle, pair.first);
      orphaned.push_back(std::move(pair.second->callback));
      release_request(pair.second.release());
    }
    _active_requests.clear();
    curl_multi_cleanup(_multi_handle);
    _multi_handle = nullptr;
  }

  // Sockets curl didn't report as removed during cleanup.
  auto remaining = _socket_contexts;
  for (CurlSocketContext* ctx : remaining) {
    destroy_socket_context(ctx);
  }

  if (_timeout_timer) {
    uv_timer_stop(_timeout_timer);
    uv_close(reinterpret_cast<uv_handle_t*>(_timeout_timer),
             [](uv_handle_t* handle) { delete reinterpret_cast<uv_timer_t*>(handle); });
  }

  if (_curl_initialized) {
    curl_global_cleanup();
  }

  for (DockerCallback& callback : orphaned) {
    DockerResponse response =
      make_error(DockerResult::TRANSPORT_ERROR, "send post request: client destroyed");
    response.cancelled = true;
    callback(std::move(response));
  }
}

bool DockerClient::init()
{
  DaemonHostResult parsed = parse_daemon_host(_config.docker_host);
  if (!parsed.ok()) {
    LOG(parsed.message);
    return false;
  }
  _host = std::move(parsed.host);

  if (_host.is_unix()) {
    LOG("Docker daemon at Unix socket " + _host.addr);
  } else {
    LOG("Docker daemon at " + _host.addr + " (base path \"" + _host.base_path + "\")");
  }

  CURLcode result = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (result != CURLE_OK) {
    LOG("Failed to initialize curl: " + std::string(curl_easy_strerror(result)));
    return false;
  }
  _curl_initialized = true;

  _multi_handle = curl_multi_init();
  if (!_multi_handle) {
    LOG("Failed to initialize curl multi handle");
    return false;
  }

  curl_multi_setopt(_multi_handle, CURLMOPT_SOCKETFUNCTION, socket_callback);
  curl_multi_setopt(_multi_handle, CURLMOPT_SOCKETDATA, this);
  curl_multi_setopt(_multi_handle, CURLMOPT_TIMERFUNCTION, timer_callback);
  curl_multi_setopt(_multi_handle, CURLMOPT_TIMERDATA, this);
  curl_multi_setopt(_multi_handle, CURLMOPT_MAX_HOST_CONNECTIONS, 16L);
  curl_multi_setopt(_multi_handle, CURLMOPT_MAXCONNECTS, 16L);

  _timeout_timer = new uv_timer_t;
  int r = uv_timer_init(&_loop, _timeout_timer);
  if (r != 0) {
    LOG("Failed to initialize curl timer: " + std::string(uv_strerror(r)));
    delete _timeout_timer;
    _timeout_timer = nullptr;
    curl_multi_cleanup(_multi_handle);
    _multi_handle = nullptr;
    return false;
  }
  _timeout_timer->data = this;

  return true;
}

void DockerClient::image_pull(const Context& context,
                              const std::string& repository,
                              const std::string& tag,
                              DockerCallback&& callback)
{
  std::string from_image = _config.registry + "/" + repository;
  LOG("Pulling " + from_image + ":" + tag);

  QueryParams query;
  query["fromImage"] = from_image;
  query["tag"] = tag;

  // Credentials are not handled here, the daemon gets an empty auth header.
  HeaderList headers{{"X-Registry-Auth", ""}};

  post(context, IMAGE_CREATE_PATH, query, headers, {}, true, std::move(callback));
}

void DockerClient::post(const Context& context,
                        const std::string& path,
                        const QueryParams& query,
                        const HeaderList& headers,
                        std::vector<uint8_t>&& body,
                        bool drain_on_success,
                        DockerCallback&& callback)
{
  if (!_multi_handle) {
    callback(make_error(DockerResult::REQUEST_ERROR, "create request: client not initialized"));
    return;
  }

  if (context.done()) {
    LOG("Not posting to " + path + ": " + context.error());
    DockerResponse response =
      make_error(DockerResult::TRANSPORT_ERROR, "send post request: " + context.error());
    response.cancelled = true;
    callback(std::move(response));
    return;
  }

  std::string api_path = build_api_path(_host.base_path, _config.api_version, path);
  std::string url_error;
  auto url = build_request_url(_config.scheme, _host.url_authority(), api_path, query, url_error);
  if (!url) {
    LOG("Failed to create request for " + path + ": " + url_error);
    callback(make_error(DockerResult::REQUEST_ERROR, "create request: " + url_error));
    return;
  }

  auto request = std::make_unique<HttpRequest>();
  request->client = this;
  request->path = path;
  request->url = std::move(*url);
  request->request_data = std::move(body);
  request->drain_on_success = drain_on_success;
  request->context = context;
  request->callback = std::move(callback);

  LOG("POST " + request->url);

  CURL* handle = create_easy_handle(request.get(), headers);
  if (!handle) {
    request->callback(
      make_error(DockerResult::REQUEST_ERROR, "create request: failed to create curl handle"));
    return;
  }

  int r = uv_timer_init(&_loop, &request->timer);
  if (r != 0) {
    LOG("Failed to initialize request timer: " + std::string(uv_strerror(r)));
    curl_slist_free_all(request->headers);
    curl_easy_cleanup(handle);
    request->callback(make_error(DockerResult::REQUEST_ERROR,
                                 "create request: " + std::string(uv_strerror(r))));
    return;
  }
  request->timer.data = request.get();

  if (context.deadline()) {
    // One extra millisecond covers libuv's coarse loop clock.
    uv_update_time(&_loop);
    auto remaining = std::chrono::ceil<std::chrono::milliseconds>(*context.deadline()
                                                                  - Context::Clock::now());
    uv_timer_start(&request->timer,
                   on_request_timer,
                   static_cast<uint64_t>(std::max<int64_t>(remaining.count(), 0)) + 1,
                   0);
  }

  // Aborting from inside a curl callback is not allowed, so let the loop do it.
  HttpRequest* raw_request = request.get();
  request->cancellation = context.register_callback([raw_request] {
    raw_request->cancel_reason = "context canceled";
    uv_timer_start(&raw_request->timer, on_request_timer, 0, 0);
  });

  _active_requests[handle] = std::move(request);
  curl_multi_add_handle(_multi_handle, handle);
}

CURL* DockerClient::create_easy_handle(HttpRequest* request, const HeaderList& headers)
{
  CURL* handle = curl_easy_init();
  if (!handle) {
    return nullptr;
  }
  request->handle = handle;

  curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, request->error_buf);
  curl_easy_setopt(handle, CURLOPT_EXPECT_100_TIMEOUT_MS, 0L);
  curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(handle, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_PATH_AS_IS, 1L);
  curl_easy_setopt(handle, CURLOPT_PRIVATE, request);
  curl_easy_setopt(handle, CURLOPT_URL, request->url.c_str());
  curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(handle, CURLOPT_HEADERDATA, request);
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, request);

  // The daemon wants a framed body even when it is empty.
  curl_easy_setopt(handle, CURLOPT_POST, 1L);
  curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE,
                   static_cast<curl_off_t>(request->request_data.size()));
  curl_easy_setopt(handle, CURLOPT_READFUNCTION, read_callback);
  curl_easy_setopt(handle, CURLOPT_READDATA, request);

  std::visit(
    [handle](const auto& transport) {
      using T = std::decay_t<decltype(transport)>;
      if constexpr (std::is_same_v<T, TcpTransport>) {
        curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");
      } else if constexpr (std::is_same_v<T, UnixTransport>) {
        curl_easy_setopt(handle, CURLOPT_UNIX_SOCKET_PATH, transport.socket_path.c_str());
        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(transport.connect_timeout.count()));
        if (transport.disable_compression) {
          curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, static_cast<char*>(nullptr));
          curl_easy_setopt(handle, CURLOPT_HTTP_CONTENT_DECODING, 0L);
        }
      } else {
        static_assert(always_false<T>, "unhandled transport");
      }
    },
    _host.transport);

  curl_slist* header_list = nullptr;

  std::string host_header = std::string("Host: ") + DOCKER_HOST_HEADER;
  header_list = curl_slist_append(header_list, host_header.c_str());
  header_list = curl_slist_append(header_list, "Expect:");

  for (const auto& header : headers) {
    // "Name;" is curl's syntax for a header with an empty value, "Name:" would remove it.
    std::string header_line = header.second.empty() ? header.first + ";"
                                                    : header.first + ": " + header.second;
    header_list = curl_slist_append(header_list, header_line.c_str());
  }

  curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list);
  request->headers = header_list;

  return handle;
}

CurlSocketContext* DockerClient::create_socket_context(curl_socket_t sockfd)
{
  auto ctx = new CurlSocketContext;
  ctx->sockfd = sockfd;
  ctx->client = this;
  uv_poll_init_socket(&_loop, &ctx->poll_handle, sockfd);
  ctx->poll_handle.data = ctx;
  _socket_contexts.insert(ctx);
  return ctx;
}

void DockerClient::destroy_socket_context(CurlSocketContext* ctx)
{
  _socket_contexts.erase(ctx);
  uv_poll_stop(&ctx->poll_handle);
  uv_close(reinterpret_cast<uv_handle_t*>(&ctx->poll_handle),
           [](uv_handle_t* handle) { delete static_cast<CurlSocketContext*>(handle->data); });
}

void DockerClient::check_multi_info()
{
  CURLMsg* msg;
  int msgs_left;

  while ((msg = curl_multi_info_read(_multi_handle, &msgs_left))) {
    if (msg->msg != CURLMSG_DONE) {
      continue;
    }

    CURL* handle = msg->easy_handle;
    CURLcode result = msg->data.result;
    HttpRequest* request = nullptr;
    curl_easy_getinfo(handle, CURLINFO_PRIVATE, &request);

    long http_code = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &http_code);

    DockerResponse response;
    response.http_code = http_code;
    response.bytes_read = request->bytes_read;

    if (result != CURLE_OK && !(result == CURLE_WRITE_ERROR && request->acknowledged)) {
      std::string error = request->error_buf[0] ? request->error_buf : curl_easy_strerror(result);
      LOG("Curl error: " + error);
      if (!request->headers_done) {
        response.result = DockerResult::TRANSPORT_ERROR;
        response.error = "send post request: " + error;
      } else if (http_code != 200) {
        response.result = DockerResult::READ_ERROR;
        response.error = "read error resp: " + error;
      } else {
        response.result = DockerResult::READ_ERROR;
        response.error = "read resp body: " + error;
      }
    } else if (http_code != 200) {
      response.result = DockerResult::DAEMON_ERROR;
      response.error = "Error posting to " + request->path + ": code " + std::to_string(http_code)
                       + ", err: " + request->error_body;
    } else {
      response.result = DockerResult::OK;
    }

    LOG("Request completed: " + request->url + " HTTP " + std::to_string(http_code) + ", "
        + std::to_string(request->bytes_read) + " bytes");

    complete(handle, std::move(response));
  }
}

void DockerClient::complete(CURL* handle, DockerResponse&& response)
{
  auto it = _active_requests.find(handle);
  if (it == _active_requests.end()) {
    return;
  }

  std::unique_ptr<HttpRequest> request = std::move(it->second);
  _active_requests.erase(it);
  curl_multi_remove_handle(_multi_handle, handle);

  DockerCallback callback = std::move(request->callback);
  release_request(request.release());
  callback(std::move(response));
}

void DockerClient::abort_request(HttpRequest* request)
{
  std::string reason =
    request->cancel_reason.empty() ? "context deadline exceeded" : request->cancel_reason;
  LOG("Aborting " + request->url + ": " + reason);

  DockerResponse response =
    make_error(DockerResult::TRANSPORT_ERROR, "send post request: " + reason);
  response.cancelled = true;
  response.http_code = request->http_code;
  response.bytes_read = request->bytes_read;
  complete(request->handle, std::move(response));
}

void DockerClient::finish_acknowledged(HttpRequest* request)
{
  LOG("Request acknowledged: " + request->url + " HTTP " + std::to_string(request->http_code));

  DockerResponse response;
  response.result = DockerResult::OK;
  response.http_code = request->http_code;
  response.bytes_read = request->bytes_read;
  complete(request->handle, std::move(response));
}

int DockerClient::socket_callback(
  CURL* /*handle*/, curl_socket_t s, int what, void* userp, void* socketp)
{
  DockerClient* client = static_cast<DockerClient*>(userp);
  CurlSocketContext* ctx = static_cast<CurlSocketContext*>(socketp);

  if (what == CURL_POLL_REMOVE) {
    if (ctx) {
      client->destroy_socket_context(ctx);
      curl_multi_assign(client->_multi_handle, s, nullptr);
    }
    return 0;
  }

  if (!ctx) {
    ctx = client->create_socket_context(s);
    curl_multi_assign(client->_multi_handle, s, ctx);
  }

  int events = 0;
  if (what & CURL_POLL_IN) {
    events |= UV_READABLE;
  }
  if (what & CURL_POLL_OUT) {
    events |= UV_WRITABLE;
  }

  uv_poll_start(&ctx->poll_handle, events, on_poll);

  return 0;
}

int DockerClient::timer_callback(CURLM* /*handle*/, long timeout_ms, void* userp)
{
  DockerClient* client = static_cast<DockerClient*>(userp);

  if (timeout_ms < 0) {
    uv_timer_stop(client->_timeout_timer);
  } else {
    uv_timer_start(client->_timeout_timer, on_timeout, timeout_ms, 0);
  }

  return 0;
}

void DockerClient::on_timeout(uv_timer_t* handle)
{
  DockerClient* client = static_cast<DockerClient*>(handle->data);
  int running_handles;
  curl_multi_socket_action(client->_multi_handle, CURL_SOCKET_TIMEOUT, 0, &running_handles);
  client->check_multi_info();
}

void DockerClient::on_poll(uv_poll_t* handle, int status, int events)
{
  CurlSocketContext* ctx = static_cast<CurlSocketContext*>(handle->data);
  DockerClient* client = ctx->client;

  int flags = 0;
  if (status < 0) {
    flags = CURL_CSELECT_ERR;
  } else {
    if (events & UV_READABLE) {
      flags |= CURL_CSELECT_IN;
    }
    if (events & UV_WRITABLE) {
      flags |= CURL_CSELECT_OUT;
    }
  }

  int running_handles;
  curl_multi_socket_action(client->_multi_handle, ctx->sockfd, flags, &running_handles);
  client->check_multi_info();
}

void DockerClient::on_request_timer(uv_timer_t* handle)
{
  HttpRequest* request = static_cast<HttpRequest*>(handle->data);
  if (request->acknowledged) {
    request->client->finish_acknowledged(request);
  } else {
    request->client->abort_request(request);
  }
}

size_t DockerClient::header_callback(char* buffer, size_t size, size_t nitems, void* userdata)
{
  HttpRequest* request = static_cast<HttpRequest*>(userdata);
  size_t total = size * nitems;

  // An empty line ends a header block. Interim 1xx blocks are skipped.
  std::string_view line(buffer, total);
  if (line == "\r\n" || line == "\n") {
    long http_code = 0;
    curl_easy_getinfo(request->handle, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code >= 200) {
      request->headers_done = true;
      request->http_code = http_code;
      if (http_code == 200 && !request->drain_on_success) {
        // Complete from the loop, the handle can't be removed inside a curl callback.
        request->acknowledged = true;
        uv_timer_start(&request->timer, on_request_timer, 0, 0);
      }
    }
  }

  return total;
}

size_t DockerClient::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata)
{
  HttpRequest* request = static_cast<HttpRequest*>(userdata);
  size_t total = size * nmemb;

  if (request->acknowledged) {
    // Success is already known and the rest of the stream isn't wanted.
    return 0;
  }

  request->bytes_read += total;
  if (request->http_code != 200) {
    request->error_body.append(ptr, total);
  }
  return total;
}

size_t DockerClient::read_callback(char* ptr, size_t size, size_t nmemb, void* userdata)
{
  HttpRequest* request = static_cast<HttpRequest*>(userdata);

  size_t max_bytes = size * nmemb;
  const std::vector<uint8_t>& data = request->request_data;
  size_t remaining = (request->upload_pos < data.size()) ? (data.size() - request->upload_pos) : 0;
  size_t to_copy = std::min(remaining, max_bytes);
  if (to_copy > 0) {
    std::memcpy(ptr, data.data() + request->upload_pos, to_copy);
    request->upload_pos += to_copy;
  }

  return to_copy;
}
