// SPDX-License-Identifier: BSD-3-Clause
// Copyright 2026 Joel Rosdahl

#include "docker_client.hpp"
#include "mock_daemon.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;

TEST(api_path_test, version_segment)
{
  EXPECT_EQ(build_api_path("", "1.24", "/images/create"), "/v1.24/images/create");
  EXPECT_EQ(build_api_path("", "v1.41", "/images/create"), "/v1.41/images/create");
  EXPECT_EQ(build_api_path("", "", "/images/create"), "/images/create");
  EXPECT_EQ(build_api_path("/proxy", "1.24", "/images/create"), "/proxy/v1.24/images/create");
  EXPECT_EQ(build_api_path("/proxy", "", "/images/create"), "/proxy/images/create");
}

TEST(request_url_test, empty_query_has_no_query_string)
{
  std::string error;
  auto url = build_request_url("http", "docker", "/v1.24/images/create", {}, error);
  ASSERT_TRUE(url) << error;
  EXPECT_EQ(*url, "http://docker/v1.24/images/create");
}

TEST(request_url_test, query_is_encoded_in_key_order)
{
  std::string error;
  QueryParams query{{"tag", "1.25"}, {"fromImage", "registry.example.com/library/nginx"}};
  auto url = build_request_url("https", "127.0.0.1:2375", "/images/create", query, error);
  ASSERT_TRUE(url) << error;
  EXPECT_EQ(url->rfind("https://127.0.0.1:2375/images/create?fromImage=", 0), 0u) << *url;
  EXPECT_LT(url->find("fromImage="), url->find("&tag=1.25"));
  EXPECT_EQ(url->find("library/nginx"), std::string::npos) << "slash not encoded: " << *url;
}

TEST(request_url_test, dot_segments_in_base_path_are_kept)
{
  std::string error;
  auto url = build_request_url("http", "docker", "/a/../b/v1.24/images/create", {}, error);
  ASSERT_TRUE(url) << error;
  EXPECT_EQ(*url, "http://docker/a/../b/v1.24/images/create");
}

TEST(request_url_test, malformed_authority_is_reported)
{
  std::string error;
  auto url = build_request_url("http", "docker host", "/images/create", {}, error);
  EXPECT_FALSE(url);
  EXPECT_FALSE(error.empty());
}

class docker_client_test : public ::testing::Test
{
protected:
  void SetUp() override
  {
    ASSERT_EQ(uv_loop_init(&loop), 0);
    config.registry = "registry.example.com";
    config.api_version = "1.24";
  }

  void TearDown() override
  {
    client.reset();
    daemon.reset();
    uv_walk(
      &loop,
      [](uv_handle_t* handle, void* /*arg*/) {
        if (!uv_is_closing(handle)) {
          uv_close(handle, nullptr);
        }
      },
      nullptr);
    uv_run(&loop, UV_RUN_DEFAULT);
    uv_loop_close(&loop);
  }

  void start_unix_daemon()
  {
    daemon = std::make_unique<MockDaemon>(loop);
    std::string path = temp_socket_path("client");
    ASSERT_TRUE(daemon->listen_unix(path));
    config.docker_host = "unix://" + path;
  }

  void start_tcp_daemon(const std::string& base_path = "")
  {
    daemon = std::make_unique<MockDaemon>(loop);
    ASSERT_TRUE(daemon->listen_tcp());
    config.docker_host = "tcp://127.0.0.1:" + std::to_string(daemon->port()) + base_path;
  }

  void create_client()
  {
    client = std::make_unique<DockerClient>(loop, config);
    ASSERT_TRUE(client->init());
  }

  void start_pull(const Context& context = Context::background())
  {
    client->image_pull(context, "library/nginx", "1.25", [this](DockerResponse&& response) {
      results.push_back(std::move(response));
    });
  }

  std::optional<DockerResponse> pull(const Context& context = Context::background())
  {
    start_pull(context);
    if (!run_loop_until(loop, [this] { return !results.empty(); })) {
      return std::nullopt;
    }
    return results.front();
  }

  uv_loop_t loop;
  Config config;
  std::unique_ptr<MockDaemon> daemon;
  std::unique_ptr<DockerClient> client;
  std::vector<DockerResponse> results;
};

TEST_F(docker_client_test, pull_over_unix_socket_posts_image_create)
{
  start_unix_daemon();
  daemon->set_response(MockResponse{200, {"{\"status\":\"Pulling from library/nginx\"}\n"}});
  create_client();

  auto response = pull();
  ASSERT_TRUE(response);
  EXPECT_TRUE(response->ok()) << response->error;
  EXPECT_EQ(response->http_code, 200);

  ASSERT_EQ(daemon->requests().size(), 1u);
  const ReceivedRequest& request = daemon->requests().front();
  EXPECT_EQ(request.method, "POST");
  EXPECT_EQ(request.path, "/v1.24/images/create");
  EXPECT_EQ(request.query_param("fromImage"), "registry.example.com/library/nginx");
  EXPECT_EQ(request.query_param("tag"), "1.25");
  EXPECT_EQ(request.headers.at("host"), "docker");
  ASSERT_TRUE(request.has_header("x-registry-auth"));
  EXPECT_EQ(request.headers.at("x-registry-auth"), "");
  EXPECT_EQ(request.headers.at("content-length"), "0");
}

TEST_F(docker_client_test, leading_v_in_version_is_not_doubled)
{
  config.api_version = "v1.41";
  start_unix_daemon();
  create_client();

  auto response = pull();
  ASSERT_TRUE(response);
  EXPECT_TRUE(response->ok()) << response->error;
  ASSERT_EQ(daemon->requests().size(), 1u);
  EXPECT_EQ(daemon->requests().front().path, "/v1.41/images/create");
}

TEST_F(docker_client_test, empty_version_has_no_version_segment)
{
  config.api_version = "";
  start_unix_daemon();
  create_client();

  auto response = pull();
  ASSERT_TRUE(response);
  EXPECT_TRUE(response->ok()) << response->error;
  ASSERT_EQ(daemon->requests().size(), 1u);
  EXPECT_EQ(daemon->requests().front().path, "/images/create");
}

TEST_F(docker_client_test, pull_over_tcp_uses_base_path_and_docker_host_header)
{
  start_tcp_daemon("/proxy");
  create_client();
  EXPECT_EQ(client->host().base_path, "/proxy");

  auto response = pull();
  ASSERT_TRUE(response);
  EXPECT_TRUE(response->ok()) << response->error;
  ASSERT_EQ(daemon->requests().size(), 1u);
  EXPECT_EQ(daemon->requests().front().path, "/proxy/v1.24/images/create");
  EXPECT_EQ(daemon->requests().front().headers.at("host"), "docker");
}

TEST_F(docker_client_test, pull_completes_only_after_stream_is_drained)
{
  start_unix_daemon();
  MockResponse stream;
  stream.chunks = {"{\"status\":\"Pulling fs layer\"}\n",
                   "{\"status\":\"Downloading\"}\n",
                   "{\"status\":\"Download complete\"}\n"};
  stream.chunk_interval = 100ms;
  daemon->set_response(stream);

  std::vector<bool> completed_before_chunk;
  daemon->before_chunk = [this, &completed_before_chunk](size_t) {
    completed_before_chunk.push_back(!results.empty());
  };
  create_client();

  auto response = pull();
  ASSERT_TRUE(response);
  EXPECT_TRUE(response->ok()) << response->error;
  EXPECT_EQ(completed_before_chunk, (std::vector<bool>{false, false}));
  EXPECT_EQ(daemon->responses_finished(), 1u);

  size_t total = 0;
  for (const auto& chunk : stream.chunks) {
    total += chunk.size();
  }
  EXPECT_EQ(response->bytes_read, total);
}

TEST_F(docker_client_test, daemon_error_carries_status_and_message)
{
  start_unix_daemon();
  daemon->set_response(MockResponse{500, {"no such image"}});
  create_client();

  auto response = pull();
  ASSERT_TRUE(response);
  EXPECT_EQ(response->result, DockerResult::DAEMON_ERROR);
  EXPECT_EQ(response->http_code, 500);
  EXPECT_FALSE(response->cancelled);
  EXPECT_NE(response->error.find("500"), std::string::npos) << response->error;
  EXPECT_NE(response->error.find("no such image"), std::string::npos) << response->error;
  EXPECT_NE(response->error.find("/images/create"), std::string::npos) << response->error;
}

TEST_F(docker_client_test, streamed_error_body_is_collected)
{
  start_tcp_daemon();
  MockResponse error;
  error.status = 404;
  error.chunks = {"{\"message\":\"repository ", "does not exist\"}"};
  error.chunk_interval = 20ms;
  daemon->set_response(error);
  create_client();

  auto response = pull();
  ASSERT_TRUE(response);
  EXPECT_EQ(response->result, DockerResult::DAEMON_ERROR);
  EXPECT_EQ(response->error,
            "Error posting to /images/create: code 404, err: "
            "{\"message\":\"repository does not exist\"}");
}

TEST_F(docker_client_test, cancel_before_response_aborts_promptly)
{
  start_unix_daemon();
  MockResponse silent;
  silent.respond = false;
  daemon->set_response(silent);
  create_client();

  CancellationSource source;
  start_pull(source.context());
  ASSERT_TRUE(run_loop_until(loop, [this] { return daemon->requests().size() == 1; }));
  EXPECT_TRUE(results.empty());

  auto start = std::chrono::steady_clock::now();
  source.cancel();
  ASSERT_TRUE(run_loop_until(loop, [this] { return !results.empty(); }, 2s));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

  const DockerResponse& response = results.front();
  EXPECT_EQ(response.result, DockerResult::TRANSPORT_ERROR);
  EXPECT_TRUE(response.cancelled);
  EXPECT_EQ(response.error, "send post request: context canceled");

  // The aborted connection is released.
  EXPECT_TRUE(
    run_loop_until(loop, [this] { return daemon->connections_dropped_by_client() == 1; }));
}

TEST_F(docker_client_test, deadline_aborts_pull)
{
  start_tcp_daemon();
  MockResponse silent;
  silent.respond = false;
  daemon->set_response(silent);
  create_client();

  auto start = std::chrono::steady_clock::now();
  auto response = pull(Context::background().with_timeout(100ms));
  ASSERT_TRUE(response);
  EXPECT_GE(std::chrono::steady_clock::now() - start, 90ms);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
  EXPECT_EQ(response->result, DockerResult::TRANSPORT_ERROR);
  EXPECT_TRUE(response->cancelled);
  EXPECT_EQ(response->error, "send post request: context deadline exceeded");
}

TEST_F(docker_client_test, cancel_while_draining_aborts)
{
  start_unix_daemon();
  MockResponse stream;
  stream.chunks = {"{\"status\":\"a\"}\n", "{\"status\":\"b\"}\n", "{\"status\":\"c\"}\n"};
  stream.chunk_interval = 200ms;
  daemon->set_response(stream);

  CancellationSource source;
  daemon->before_chunk = [&source](size_t index) {
    if (index == 1) {
      source.cancel();
    }
  };
  create_client();

  auto response = pull(source.context());
  ASSERT_TRUE(response);
  EXPECT_EQ(response->result, DockerResult::TRANSPORT_ERROR);
  EXPECT_TRUE(response->cancelled);
  EXPECT_EQ(response->http_code, 200);
  EXPECT_EQ(daemon->responses_finished(), 0u);
}

TEST_F(docker_client_test, already_cancelled_context_sends_nothing)
{
  start_unix_daemon();
  create_client();

  CancellationSource source;
  source.cancel();
  start_pull(source.context());

  // Completed synchronously.
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results.front().result, DockerResult::TRANSPORT_ERROR);
  EXPECT_TRUE(results.front().cancelled);
  run_loop_for(loop, 50ms);
  EXPECT_EQ(daemon->connections_accepted(), 0u);
}

TEST_F(docker_client_test, truncated_stream_is_read_error)
{
  start_unix_daemon();
  MockResponse stream;
  stream.chunks = {"{\"status\":\"Downloading\"}\n"};
  stream.truncated = true;
  daemon->set_response(stream);
  create_client();

  auto response = pull();
  ASSERT_TRUE(response);
  EXPECT_EQ(response->result, DockerResult::READ_ERROR);
  EXPECT_FALSE(response->cancelled);
  EXPECT_EQ(response->error.rfind("read resp body: ", 0), 0u) << response->error;
}

TEST_F(docker_client_test, truncated_error_body_is_read_error)
{
  start_unix_daemon();
  MockResponse error;
  error.status = 500;
  error.chunks = {"no such"};
  error.truncated = true;
  daemon->set_response(error);
  create_client();

  auto response = pull();
  ASSERT_TRUE(response);
  EXPECT_EQ(response->result, DockerResult::READ_ERROR);
  EXPECT_EQ(response->error.rfind("read error resp: ", 0), 0u) << response->error;
}

TEST_F(docker_client_test, missing_socket_is_transport_error)
{
  config.docker_host = "unix://" + temp_socket_path("missing");
  create_client();

  auto response = pull();
  ASSERT_TRUE(response);
  EXPECT_EQ(response->result, DockerResult::TRANSPORT_ERROR);
  EXPECT_FALSE(response->cancelled);
  EXPECT_EQ(response->error.rfind("send post request: ", 0), 0u) << response->error;
}

TEST_F(docker_client_test, concurrent_pulls_share_client)
{
  start_unix_daemon();
  MockResponse stream;
  stream.chunks = {"{\"status\":\"a\"}\n", "{\"status\":\"b\"}\n"};
  stream.chunk_interval = 50ms;
  daemon->set_response(stream);
  create_client();

  start_pull();
  start_pull();
  start_pull();
  ASSERT_TRUE(run_loop_until(loop, [this] { return results.size() == 3; }));
  for (const auto& response : results) {
    EXPECT_TRUE(response.ok()) << response.error;
  }
  EXPECT_EQ(daemon->requests().size(), 3u);
}

TEST_F(docker_client_test, post_without_drain_completes_on_status)
{
  start_unix_daemon();
  MockResponse stream;
  stream.chunks = {"{\"status\":\"a\"}\n", "{\"status\":\"b\"}\n", "{\"status\":\"c\"}\n"};
  stream.chunk_interval = 300ms;
  daemon->set_response(stream);
  create_client();

  size_t finished_at_completion = 1;
  client->post(Context::background(),
               "/images/create",
               {{"fromImage", "registry.example.com/busybox"}},
               {},
               {},
               false,
               [this, &finished_at_completion](DockerResponse&& response) {
                 finished_at_completion = daemon->responses_finished();
                 results.push_back(std::move(response));
               });

  ASSERT_TRUE(run_loop_until(loop, [this] { return !results.empty(); }));
  EXPECT_TRUE(results.front().ok()) << results.front().error;
  EXPECT_EQ(finished_at_completion, 0u);
}

TEST_F(docker_client_test, post_without_drain_does_not_wait_for_first_body_bytes)
{
  start_unix_daemon();
  MockResponse stream;
  stream.chunks = {"", "{\"status\":\"a\"}\n", "{\"status\":\"b\"}\n"};
  stream.chunk_interval = 1000ms;
  daemon->set_response(stream);
  create_client();

  auto start = std::chrono::steady_clock::now();
  client->post(Context::background(),
               "/images/create",
               {{"fromImage", "registry.example.com/busybox"}},
               {},
               {},
               false,
               [this](DockerResponse&& response) { results.push_back(std::move(response)); });

  ASSERT_TRUE(run_loop_until(loop, [this] { return !results.empty(); }));
  auto took = std::chrono::steady_clock::now() - start;
  EXPECT_TRUE(results.front().ok()) << results.front().error;
  EXPECT_FALSE(results.front().cancelled);
  EXPECT_EQ(results.front().http_code, 200);
  EXPECT_EQ(results.front().bytes_read, 0u);
  EXPECT_LT(took, 500ms);

  // The connection is dropped, no second completion arrives.
  EXPECT_TRUE(
    run_loop_until(loop, [this] { return daemon->connections_dropped_by_client() == 1; }));
  EXPECT_EQ(results.size(), 1u);
}

TEST_F(docker_client_test, post_sends_body)
{
  start_tcp_daemon();
  create_client();

  std::string payload = "{\"Image\":\"busybox\"}";
  client->post(Context::background(),
               "/images/create",
               {},
               {{"Content-Type", "application/json"}},
               std::vector<uint8_t>(payload.begin(), payload.end()),
               true,
               [this](DockerResponse&& response) { results.push_back(std::move(response)); });

  ASSERT_TRUE(run_loop_until(loop, [this] { return !results.empty(); }));
  EXPECT_TRUE(results.front().ok()) << results.front().error;
  ASSERT_EQ(daemon->requests().size(), 1u);
  const ReceivedRequest& request = daemon->requests().front();
  EXPECT_EQ(request.query, "");
  EXPECT_EQ(request.headers.at("content-length"), std::to_string(payload.size()));
  EXPECT_EQ(request.headers.at("content-type"), "application/json");
}

TEST_F(docker_client_test, destroying_client_releases_in_flight_requests)
{
  start_unix_daemon();
  MockResponse silent;
  silent.respond = false;
  daemon->set_response(silent);
  create_client();

  start_pull();
  ASSERT_TRUE(run_loop_until(loop, [this] { return daemon->requests().size() == 1; }));
  client.reset();

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results.front().result, DockerResult::TRANSPORT_ERROR);
  EXPECT_TRUE(results.front().cancelled);
  EXPECT_EQ(results.front().error, "send post request: client destroyed");

  EXPECT_TRUE(
    run_loop_until(loop, [this] { return daemon->connections_dropped_by_client() == 1; }));
  EXPECT_EQ(results.size(), 1u);
}

TEST_F(docker_client_test, bad_docker_host_fails_init)
{
  config.docker_host = "ftp://localhost";
  DockerClient bad(loop, config);
  EXPECT_FALSE(bad.init());

  bad.image_pull(Context::background(),
                 "library/nginx",
                 "latest",
                 [this](DockerResponse&& response) { results.push_back(std::move(response)); });
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results.front().result, DockerResult::REQUEST_ERROR);
}

} // namespace
