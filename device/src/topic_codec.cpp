/*
 * 설명: 토픽 이름 생성/해석과 퍼센트 인코딩, 쿼리 문자열 파싱을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/unit/topic_codec_test.cpp
 */
#include "iothub/topic_codec.hpp"

#include <cctype>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>

#include "iothub/errors.hpp"

namespace iothub {

namespace {
bool IsUnreserved(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::optional<std::int64_t> ParseInteger(const std::string& value) {
  try {
    std::size_t idx = 0;
    auto parsed = std::stoll(value, &idx);
    if (idx != value.size()) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::string RequireQueryValue(const PropertyBag& query, const std::string& key, const std::string& topic) {
  auto it = query.find(key);
  if (it == query.end()) {
    throw ProtocolError("토픽에 " + key + " 값이 없습니다", topic);
  }
  return it->second;
}

std::int64_t RequireInteger(const std::string& value, const std::string& what, const std::string& topic) {
  auto parsed = ParseInteger(value);
  if (!parsed) {
    throw ProtocolError(what + " 값이 정수가 아닙니다: " + value, topic);
  }
  return *parsed;
}

int RequireInt(const std::string& value, const std::string& what, const std::string& topic) {
  auto parsed = RequireInteger(value, what, topic);
  if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
    throw ProtocolError(what + " 값이 범위를 벗어났습니다: " + value, topic);
  }
  return static_cast<int>(parsed);
}
}  // namespace

std::string UrlEncode(std::string_view value) {
  std::ostringstream oss;
  oss << std::uppercase << std::hex << std::setfill('0');
  for (char ch : value) {
    auto c = static_cast<unsigned char>(ch);
    if (IsUnreserved(c)) {
      oss << ch;
    } else {
      oss << '%' << std::setw(2) << static_cast<int>(c);
    }
  }
  return oss.str();
}

std::string UrlDecode(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%') {
      if (i + 2 >= value.size()) {
        throw ProtocolError("잘못된 퍼센트 인코딩입니다", std::string(value));
      }
      int hi = HexValue(value[i + 1]);
      int lo = HexValue(value[i + 2]);
      if (hi < 0 || lo < 0) {
        throw ProtocolError("잘못된 퍼센트 인코딩입니다", std::string(value));
      }
      out.push_back(static_cast<char>(hi * 16 + lo));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string EncodePropertyBag(const PropertyBag& properties) {
  std::string out;
  for (const auto& [key, value] : properties) {
    if (!out.empty()) {
      out.push_back('&');
    }
    out += UrlEncode(key);
    out.push_back('=');
    out += UrlEncode(value);
  }
  return out;
}

PropertyBag DecodePropertyBag(std::string_view query) {
  PropertyBag bag;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    auto pair = query.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      if (eq == std::string_view::npos) {
        bag[UrlDecode(pair)] = std::string{};
      } else {
        bag[UrlDecode(pair.substr(0, eq))] = UrlDecode(pair.substr(eq + 1));
      }
    }
    if (amp == std::string_view::npos) {
      break;
    }
    pos = amp + 1;
  }
  return bag;
}

PropertyBag DecodeTopicQuery(const std::string& topic) {
  auto pos = topic.rfind("/?");
  if (pos == std::string::npos) {
    throw ProtocolError("토픽에 쿼리 문자열이 없습니다", topic);
  }
  return DecodePropertyBag(std::string_view(topic).substr(pos + 2));
}

PropertyBag DecodeTrailingSegment(const std::string& topic) {
  auto pos = topic.rfind('/');
  if (pos == std::string::npos) {
    return DecodePropertyBag(topic);
  }
  return DecodePropertyBag(std::string_view(topic).substr(pos + 1));
}

std::string BoundTopicPrefix(const std::string& device_id) {
  return "devices/" + device_id + "/messages/devicebound/";
}

std::string BoundTopicFilter(const std::string& device_id) { return BoundTopicPrefix(device_id) + "#"; }

std::string MethodTopicFilter() { return std::string(kMethodPostPrefix) + "#"; }

std::string TwinDesiredTopicFilter() { return std::string(kTwinDesiredPrefix) + "#"; }

std::string TwinResponseTopicFilter() { return std::string(kTwinResponsePrefix) + "#"; }

std::string EventTopic(const std::string& device_id, const PropertyBag& properties) {
  return "devices/" + device_id + "/messages/events/" + EncodePropertyBag(properties);
}

std::string MethodResponseTopic(int status, const std::string& request_id) {
  return std::string(kMethodResponsePrefix) + std::to_string(status) + "/" + request_id;
}

std::string TwinReportedTopic(std::int64_t request_id) {
  return std::string(kTwinReportedPrefix) + "?$rid=" + std::to_string(request_id);
}

std::string TwinGetTopic(std::int64_t request_id) {
  return std::string(kTwinGetPrefix) + "?$rid=" + std::to_string(request_id);
}

bool HasPrefix(const std::string& topic, const std::string& prefix) {
  return topic.size() >= prefix.size() && topic.compare(0, prefix.size(), prefix) == 0;
}

MethodInvocation ParseMethodTopic(const std::string& topic) {
  const std::string prefix = kMethodPostPrefix;
  if (!HasPrefix(topic, prefix)) {
    throw ProtocolError("다이렉트 메서드 토픽이 아닙니다", topic);
  }
  auto query_pos = topic.rfind("/?");
  if (query_pos == std::string::npos || query_pos < prefix.size()) {
    throw ProtocolError("다이렉트 메서드 토픽에 요청 ID가 없습니다", topic);
  }
  MethodInvocation invocation;
  invocation.method_name = topic.substr(prefix.size(), query_pos - prefix.size());
  if (invocation.method_name.empty()) {
    throw ProtocolError("다이렉트 메서드 이름이 비어 있습니다", topic);
  }
  invocation.request_id = RequireQueryValue(DecodeTopicQuery(topic), "$rid", topic);
  return invocation;
}

HubResponse ParseTwinResponseTopic(const std::string& topic) {
  const std::string prefix = kTwinResponsePrefix;
  if (!HasPrefix(topic, prefix)) {
    throw ProtocolError("트윈 응답 토픽이 아닙니다", topic);
  }
  auto slash = topic.find('/', prefix.size());
  if (slash == std::string::npos) {
    throw ProtocolError("트윈 응답 토픽에 상태 코드가 없습니다", topic);
  }
  HubResponse response;
  response.status = RequireInt(topic.substr(prefix.size(), slash - prefix.size()), "status", topic);
  response.request_id = RequireInteger(RequireQueryValue(DecodeTopicQuery(topic), "$rid", topic), "$rid", topic);
  return response;
}

int ParseDesiredVersion(const std::string& topic) {
  auto version = RequireQueryValue(DecodeTopicQuery(topic), "$version", topic);
  return RequireInt(version, "$version", topic);
}

}  // namespace iothub
