#include <gtest/gtest.h>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "core/recorder/Recorder.hpp"
#include "core/reporter/Reporter.hpp"
#include "core/store/PullStore.hpp"
#include "services/api/HttpServer.hpp"
#include "utils/test_utils.hpp"

using nlohmann::json;

namespace {

constexpr int64_t kNow = 1700000000;

// Full service on an ephemeral localhost port.
class ApiHarness {
public:
  explicit ApiHarness(bool initialize,
                      const std::function<void(httplib::Server&)>& extraRoutes = {})
    : store_(testStoreOptions(dir_)),
      recorder_(store_, [] { return kNow; }),
      reporter_(store_) {
    if (initialize) store_.initialize();
    ipe::ServerOptions opts;
    opts.workers = 4;
    opts.timeoutSec = 5;
    opts.maxBodyBytes = 1024;
    ipe::configure_server(svr_, opts);
    ipe::register_routes(svr_, store_, recorder_, reporter_, opts);
    if (extraRoutes) extraRoutes(svr_);
    port_ = svr_.bind_to_any_port("127.0.0.1");
    thread_ = std::thread([this] { svr_.listen_after_bind(); });
    svr_.wait_until_ready();
  }

  ~ApiHarness() {
    svr_.stop();
    if (thread_.joinable()) thread_.join();
  }

  int port() const { return port_; }
  ipe::PullStore& store() { return store_; }
  httplib::Client client() const { return httplib::Client("127.0.0.1", port_); }

private:
  TempDir         dir_;
  ipe::PullStore  store_;
  ipe::Recorder   recorder_;
  ipe::Reporter   reporter_;
  httplib::Server svr_;
  std::thread     thread_;
  int             port_ = -1;
};

json body_of(const httplib::Result& res) {
  return json::parse(res->body);
}

} // namespace

class HttpApiTest : public ::testing::Test {
protected:
  void SetUp() override {
    api = std::make_unique<ApiHarness>(true);
    ASSERT_GT(api->port(), 0);
  }

  httplib::Result postEvent(const std::string& body) {
    auto cli = api->client();
    return cli.Post("/events", body, "application/json");
  }

  httplib::Result get(const std::string& path) {
    auto cli = api->client();
    return cli.Get(path);
  }

  std::unique_ptr<ApiHarness> api;
};

TEST_F(HttpApiTest, HealthOk) {
  auto res = get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(body_of(res), json({{"status", "ok"}}));
  EXPECT_EQ(res->get_header_value("Content-Type"), "application/json");
}

TEST_F(HttpApiTest, HealthUnavailableWhenDatabaseGone) {
  removeDatabase(api->store().dbPath());
  auto res = get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 503);
  EXPECT_EQ(body_of(res), json({{"status", "unavailable"}}));
}

TEST_F(HttpApiTest, PullCountsForOneImage) {
  for (const char* outcome : {"success", "success", "failure"}) {
    auto res = postEvent(std::string(R"({"image":"nginx:latest","outcome":")") + outcome + "\"}");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
  }

  auto res = get("/metrics?image=nginx:latest");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  json j = body_of(res);
  ASSERT_EQ(j.size(), 1u);
  EXPECT_EQ(j["nginx:latest"]["total"], 3);
  EXPECT_EQ(j["nginx:latest"]["success"], 2);
  EXPECT_EQ(j["nginx:latest"]["failure"], 1);
  EXPECT_EQ(j["nginx:latest"]["lastSeen"], kNow);
}

TEST_F(HttpApiTest, MetricsWithoutFilterListsEveryImage) {
  ASSERT_EQ(postEvent(R"({"image":"nginx","outcome":"success"})")->status, 202);
  ASSERT_EQ(postEvent(R"({"image":"ghcr.io/org/app:1","outcome":"failure","detail":"denied"})")->status, 202);

  auto res = get("/metrics");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  json j = body_of(res);
  EXPECT_EQ(j.size(), 2u);
  EXPECT_TRUE(j.contains("nginx"));
  EXPECT_TRUE(j.contains("ghcr.io/org/app:1"));

  auto empty = get("/metrics?image=never-pulled");
  ASSERT_TRUE(empty);
  EXPECT_EQ(empty->status, 200);
  EXPECT_TRUE(body_of(empty).empty());
}

TEST_F(HttpApiTest, AcceptedEventIsEchoed) {
  auto res = postEvent(R"({"image":"quay.io/prom/prometheus:v2","outcome":"success","durationMs":420})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 202);
  json j = body_of(res);
  EXPECT_GT(j["id"].get<int64_t>(), 0);
  EXPECT_EQ(j["registry"], "quay.io");
  EXPECT_EQ(j["outcome"], "success");
  EXPECT_EQ(j["durationMs"], 420);
}

TEST_F(HttpApiTest, ValidationErrorsNameTheField) {
  auto res = postEvent(R"({"outcome":"success"})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(body_of(res)["error"], "image");

  res = postEvent(R"({"image":"nginx","outcome":"partial"})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(body_of(res)["error"], "outcome");

  res = postEvent("not json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(body_of(res)["error"], "body");

  EXPECT_TRUE(body_of(get("/metrics")).empty());
}

TEST_F(HttpApiTest, OversizedBodyIsRejected) {
  const std::string body = R"({"image":"nginx","outcome":"success","detail":")" +
                           std::string(2000, 'x') + "\"}";
  auto res = postEvent(body);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(body_of(res)["error"], "body");
}

TEST_F(HttpApiTest, StorageFailureOnWriteIs500) {
  removeDatabase(api->store().dbPath());
  auto res = postEvent(R"({"image":"nginx","outcome":"success"})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 500);
  EXPECT_TRUE(body_of(res).contains("error"));

  res = get("/metrics");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 500);
}

TEST_F(HttpApiTest, RecentEventsAndLookupById) {
  ASSERT_EQ(postEvent(R"({"image":"alpine","outcome":"success"})")->status, 202);
  auto created = postEvent(R"({"image":"busybox","outcome":"failure","detail":"EOF"})");
  ASSERT_TRUE(created);
  const int64_t id = body_of(created)["id"].get<int64_t>();

  auto recent = get("/events/recent?limit=1");
  ASSERT_TRUE(recent);
  EXPECT_EQ(recent->status, 200);
  json list = body_of(recent);
  ASSERT_EQ(list.size(), 1u);
  EXPECT_EQ(list[0]["image"], "busybox");

  auto one = get("/events/" + std::to_string(id));
  ASSERT_TRUE(one);
  EXPECT_EQ(one->status, 200);
  EXPECT_EQ(body_of(one)["detail"], "EOF");

  auto missing = get("/events/999999");
  ASSERT_TRUE(missing);
  EXPECT_EQ(missing->status, 404);
  EXPECT_EQ(body_of(missing)["error"], "not found");

  auto bad = get("/events/recent?limit=lots");
  ASSERT_TRUE(bad);
  EXPECT_EQ(bad->status, 400);
  EXPECT_EQ(body_of(bad)["error"], "limit");
}

TEST_F(HttpApiTest, RecentLimitIsClampedToValidRange) {
  for (const char* img : {"alpine", "busybox", "redis"}) {
    ASSERT_EQ(postEvent(std::string(R"({"image":")") + img + R"(","outcome":"success"})")->status, 202);
  }

  for (const char* limit : {"0", "-3"}) {
    auto res = get(std::string("/events/recent?limit=") + limit);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200) << limit;
    json list = body_of(res);
    ASSERT_EQ(list.size(), 1u) << limit;
    EXPECT_EQ(list[0]["image"], "redis");
  }

  auto many = get("/events/recent?limit=5000");
  ASSERT_TRUE(many);
  EXPECT_EQ(many->status, 200);
  EXPECT_EQ(body_of(many).size(), 3u);
}

TEST_F(HttpApiTest, RecentLimitMustBeWholeNumber) {
  for (const char* limit : {"5abc", "", "2.5", "99999999999"}) {
    auto res = get(std::string("/events/recent?limit=") + limit);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400) << "limit=" << limit;
    EXPECT_EQ(body_of(res)["error"], "limit");
  }
}

TEST_F(HttpApiTest, MetricsFilterIgnoresSurroundingWhitespace) {
  ASSERT_EQ(postEvent(R"({"image":"nginx:latest","outcome":"success"})")->status, 202);

  auto res = get("/metrics?image=%20nginx:latest%20");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  json j = body_of(res);
  ASSERT_EQ(j.size(), 1u);
  EXPECT_EQ(j["nginx:latest"]["total"], 1);

  auto blank = get("/metrics?image=%20%20");
  ASSERT_TRUE(blank);
  EXPECT_EQ(body_of(blank).size(), 1u);
}

TEST_F(HttpApiTest, PayloadOverHardLimitIs413Json) {
  auto cli = api->client();
  auto res = cli.Post("/events", std::string((1u << 20) + 1, 'x'), "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 413);
  EXPECT_EQ(body_of(res)["error"], "body");
}

TEST_F(HttpApiTest, OversizedDigestIsRejectedNotFatal) {
  auto res = postEvent(R"({"image":"nginx@sha256:)" + std::string(900, 'a') + R"(","outcome":"success"})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(body_of(res)["error"], "image");
  EXPECT_EQ(get("/health")->status, 200);
}

TEST_F(HttpApiTest, UnknownRouteIsJson404) {
  auto res = get("/nope");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
  EXPECT_EQ(body_of(res), json({{"error", "not found"}}));
}

TEST_F(HttpApiTest, ConcurrentPostsAreAllCounted) {
  constexpr int kClients = 6;
  constexpr int kPerClient = 10;

  std::vector<std::thread> clients;
  std::vector<int> accepted(kClients, 0);
  for (int c = 0; c < kClients; ++c) {
    clients.emplace_back([this, c, &accepted] {
      auto cli = api->client();
      for (int i = 0; i < kPerClient; ++i) {
        auto res = cli.Post("/events", R"({"image":"nginx:latest","outcome":"success"})",
                            "application/json");
        if (res && res->status == 202) ++accepted[c];
      }
    });
  }
  for (auto& t : clients) t.join();

  int total = 0;
  for (int n : accepted) total += n;
  EXPECT_EQ(total, kClients * kPerClient);

  json j = body_of(get("/metrics?image=nginx:latest"));
  EXPECT_EQ(j["nginx:latest"]["total"], kClients * kPerClient);
}

TEST(HttpApiUninitialized, RequestsGet5xxInsteadOfCrashing) {
  ApiHarness api(false);
  ASSERT_GT(api.port(), 0);
  auto cli = api.client();

  auto health = cli.Get("/health");
  ASSERT_TRUE(health);
  EXPECT_EQ(health->status, 503);

  auto metrics = cli.Get("/metrics");
  ASSERT_TRUE(metrics);
  EXPECT_EQ(metrics->status, 503);
  EXPECT_EQ(json::parse(metrics->body)["error"], "store not initialized");

  auto post = cli.Post("/events", R"({"image":"nginx","outcome":"success"})", "application/json");
  ASSERT_TRUE(post);
  EXPECT_EQ(post->status, 503);
}

TEST(HttpApiHandlers, UncaughtHandlerExceptionIsJson500) {
  ApiHarness api(true, [](httplib::Server& svr) {
    svr.Get("/boom", [](const httplib::Request&, httplib::Response&) {
      throw std::logic_error("handler bug");
    });
  });
  ASSERT_GT(api.port(), 0);
  auto cli = api.client();

  auto res = cli.Get("/boom");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 500);
  EXPECT_EQ(json::parse(res->body), json({{"error", "internal error"}}));

  auto health = cli.Get("/health");
  ASSERT_TRUE(health);
  EXPECT_EQ(health->status, 200);
}
