#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "../support/fake_transport.hpp"
#include "iothub/device.hpp"
#include "iothub/errors.hpp"
#include "iothub/topic_codec.hpp"

namespace {

using iothub::test_support::FakeTransport;
using iothub::test_support::PublishedMessage;

iothub::DeviceConfig TestConfig() {
  iothub::DeviceConfig cfg;
  cfg.hub_id = "my-hub";
  cfg.device_id = "dev1";
  cfg.device_key = "ZhmdoNjyBccLrTnku0JxxVTTg8e94kleWTz9M+FJ9dk=";
  return cfg;
}

// 수신 루프를 별도 스레드에서 돌리고, 허브 역할은 발행 훅에서 수신함에 응답을 넣는 방식으로 흉내 낸다.
class DeviceSessionFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    transport_ = std::make_shared<FakeTransport>();
    device_ = std::make_unique<iothub::Device>(
        TestConfig(), transport_,
        [this]() -> std::int64_t {
          ++time_queries_;
          return 1509001724;
        },
        iothub::MonotonicClock{}, std::make_shared<iothub::Observability>(iothub::LogLevel::kError, log_sink_));
    device_->Connect();
    loop_ = std::thread([this]() { device_->Mqtt().Loop(); });
  }

  void TearDown() override {
    transport_->Stop();
    loop_.join();
    EXPECT_TRUE(transport_->errors().empty());
  }

  std::ostringstream log_sink_;
  std::shared_ptr<FakeTransport> transport_;
  std::unique_ptr<iothub::Device> device_;
  std::thread loop_;
  std::atomic<int> time_queries_{0};
};

TEST_F(DeviceSessionFixture, GetTwinSurvivesPatchAutoReportOnLoopThread) {
  device_->OnTwinUpdate([](const nlohmann::json& desired, int) -> std::optional<nlohmann::json> {
    return nlohmann::json{{"publish_period", desired["publish_period"]}};
  });
  transport_->SetPublishHook([this](const PublishedMessage& m) {
    if (!iothub::HasPrefix(m.topic, iothub::kTwinGetPrefix)) {
      return;
    }
    auto rid = iothub::DecodeTopicQuery(m.topic).at("$rid");
    // 응답보다 desired 패치가 먼저 도착하면 수신 루프에서 reported 보고가 먼저 발행된다.
    transport_->Enqueue({"$iothub/twin/PATCH/properties/desired/?$version=5", R"({"publish_period":1000})"});
    transport_->Enqueue({"$iothub/twin/res/200/?$rid=" + rid,
                         R"({"desired":{"publish_period":1000,"$version":5},"reported":{}})"});
  });

  auto result = device_->GetTwin(std::chrono::milliseconds(2000));
  EXPECT_EQ(result.status, 200);
  ASSERT_TRUE(result.twin.has_value());
  EXPECT_EQ((*result.twin)["desired"]["$version"], 5);

  auto published = transport_->published();
  ASSERT_EQ(published.size(), 2u);
  EXPECT_EQ(published[0].topic, "$iothub/twin/GET/?$rid=0");
  EXPECT_EQ(published[1].topic, "$iothub/twin/PATCH/properties/reported/?$rid=1");
  EXPECT_EQ(*published[1].payload, R"({"publish_period":1000})");
}

TEST_F(DeviceSessionFixture, DelayedResponseTimesOutThenNextRequestSucceeds) {
  std::atomic<int> requests{0};
  std::vector<std::thread> hub;
  transport_->SetPublishHook([&, this](const PublishedMessage& m) {
    auto rid = iothub::DecodeTopicQuery(m.topic).at("$rid");
    auto delay = requests.fetch_add(1) == 0 ? std::chrono::milliseconds(1300) : std::chrono::milliseconds(50);
    hub.emplace_back([this, rid, delay]() {
      std::this_thread::sleep_for(delay);
      transport_->Enqueue({"$iothub/twin/res/204/?$rid=" + rid, ""});
    });
  });

  EXPECT_THROW(device_->ReportTwin({{"temp", 21}}, true, std::chrono::milliseconds(1000)), iothub::TimeoutError);
  auto status = device_->ReportTwin({{"temp", 22}}, true, std::chrono::milliseconds(1000));
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(*status, 204);

  for (auto& t : hub) {
    t.join();
  }
}

TEST_F(DeviceSessionFixture, MethodCallOverLoopAndReconnectRefresh) {
  device_->OnMethod("get", [](const nlohmann::json&) { return iothub::MethodResult{0, {{"value", 5}}}; });
  std::promise<PublishedMessage> response;
  transport_->SetPublishHook([&response](const PublishedMessage& m) {
    if (iothub::HasPrefix(m.topic, iothub::kMethodResponsePrefix)) {
      response.set_value(m);
    }
  });
  transport_->Enqueue({"$iothub/methods/POST/get/?$rid=3", "null"});

  auto future = response.get_future();
  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  auto published = future.get();
  EXPECT_EQ(published.topic, "$iothub/methods/res/0/3");
  EXPECT_EQ(*published.payload, R"({"value":5})");

  transport_->SimulateReconnect();
  EXPECT_EQ(time_queries_.load(), 1);
  EXPECT_EQ(transport_->passwords().size(), 2u);
  EXPECT_EQ(device_->GetObservability()->Snapshot().reconnects, 1u);
}

}  // namespace
