/*
 * 설명: IoT Hub MQTT 토픽 이름과 쿼리 문자열/프로퍼티 백 인코딩 규칙을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/unit/topic_codec_test.cpp
 */
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace iothub {

using PropertyBag = std::map<std::string, std::string>;

constexpr const char* kMethodPostPrefix = "$iothub/methods/POST/";
constexpr const char* kMethodResponsePrefix = "$iothub/methods/res/";
constexpr const char* kTwinDesiredPrefix = "$iothub/twin/PATCH/properties/desired/";
constexpr const char* kTwinReportedPrefix = "$iothub/twin/PATCH/properties/reported/";
constexpr const char* kTwinResponsePrefix = "$iothub/twin/res/";
constexpr const char* kTwinGetPrefix = "$iothub/twin/GET/";

struct MethodInvocation {
  std::string method_name;
  std::string request_id;
};

struct HubResponse {
  int status;
  std::int64_t request_id;
};

std::string UrlEncode(std::string_view value);
std::string UrlDecode(std::string_view value);

std::string EncodePropertyBag(const PropertyBag& properties);
PropertyBag DecodePropertyBag(std::string_view query);

// "/?" 뒤의 쿼리 문자열을 해석한다.
PropertyBag DecodeTopicQuery(const std::string& topic);
// 마지막 "/" 뒤 세그먼트를 "?" 없이 프로퍼티 백으로 해석한다.
PropertyBag DecodeTrailingSegment(const std::string& topic);

std::string BoundTopicPrefix(const std::string& device_id);
std::string BoundTopicFilter(const std::string& device_id);
std::string MethodTopicFilter();
std::string TwinDesiredTopicFilter();
std::string TwinResponseTopicFilter();

std::string EventTopic(const std::string& device_id, const PropertyBag& properties);
std::string MethodResponseTopic(int status, const std::string& request_id);
std::string TwinReportedTopic(std::int64_t request_id);
std::string TwinGetTopic(std::int64_t request_id);

bool HasPrefix(const std::string& topic, const std::string& prefix);

MethodInvocation ParseMethodTopic(const std::string& topic);
HubResponse ParseTwinResponseTopic(const std::string& topic);
int ParseDesiredVersion(const std::string& topic);

}  // namespace iothub
