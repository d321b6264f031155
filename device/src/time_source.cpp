/*
 * 설명: 시스템 시계와 HTTP(JSON) 시각 서버에서 epoch 초를 얻는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/it/http_time_source_it_test.cpp
 */
#include "iothub/time_source.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>

#include "iothub/errors.hpp"

namespace iothub {

std::int64_t SystemClockTimestamp() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::chrono::milliseconds SteadyClockNow() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch());
}

HttpEndpoint ParseHttpUrl(const std::string& url) {
  const std::string scheme = "http://";
  if (url.compare(0, scheme.size(), scheme) != 0) {
    throw ConfigError("시각 서버 URL은 http:// 로 시작해야 합니다: " + url);
  }
  HttpEndpoint endpoint;
  auto rest = url.substr(scheme.size());
  auto slash = rest.find('/');
  auto authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    endpoint.target = rest.substr(slash);
  }
  auto colon = authority.find(':');
  if (colon != std::string::npos) {
    endpoint.port = authority.substr(colon + 1);
    authority = authority.substr(0, colon);
  }
  if (authority.empty() || endpoint.port.empty()) {
    throw ConfigError("시각 서버 URL 형식이 올바르지 않습니다: " + url);
  }
  endpoint.host = authority;
  return endpoint;
}

void ValidateJsonPointer(const std::string& json_pointer) {
  try {
    nlohmann::json::json_pointer pointer(json_pointer);
    static_cast<void>(pointer);
  } catch (const nlohmann::json::exception& ex) {
    throw ConfigError("JSON pointer 형식이 올바르지 않습니다: " + json_pointer + " (" + ex.what() + ")");
  }
}

HttpTimeSource::HttpTimeSource(HttpEndpoint endpoint, std::string json_pointer, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), json_pointer_(std::move(json_pointer)), timeout_(timeout) {
  ValidateJsonPointer(json_pointer_);
}

std::int64_t HttpTimeSource::operator()() const {
  namespace http = boost::beast::http;
  using boost::asio::ip::tcp;

  boost::asio::io_context ioc;
  tcp::resolver resolver{ioc};
  boost::asio::steady_timer resolve_deadline{ioc};
  boost::beast::tcp_stream stream{ioc};
  boost::beast::flat_buffer buffer;
  http::response<http::string_body> res;
  boost::beast::error_code failure;

  http::request<http::string_body> req{http::verb::get, endpoint_.target, 11};
  req.set(http::field::host, endpoint_.host);
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  req.set(http::field::accept, "application/json");

  // tcp_stream 만료는 비동기 연산에만 적용된다.
  resolve_deadline.expires_after(timeout_);
  resolve_deadline.async_wait([&](boost::beast::error_code ec) {
    if (!ec) {
      resolver.cancel();
    }
  });
  resolver.async_resolve(endpoint_.host, endpoint_.port, [&](boost::beast::error_code resolve_ec,
                                                             tcp::resolver::results_type results) {
    resolve_deadline.cancel();
    if (resolve_ec) {
      failure = resolve_ec;
      return;
    }
    stream.expires_after(timeout_);
    stream.async_connect(results, [&](boost::beast::error_code connect_ec, const tcp::endpoint&) {
      if (connect_ec) {
        failure = connect_ec;
        return;
      }
      stream.expires_after(timeout_);
      http::async_write(stream, req, [&](boost::beast::error_code write_ec, std::size_t) {
        if (write_ec) {
          failure = write_ec;
          return;
        }
        stream.expires_after(timeout_);
        http::async_read(stream, buffer, res, [&](boost::beast::error_code read_ec, std::size_t) {
          failure = read_ec;
        });
      });
    });
  });
  ioc.run();

  if (failure) {
    throw TimeSourceError("시각 서버 요청 실패: " + failure.message());
  }
  boost::beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);

  if (res.result() != http::status::ok) {
    throw TimeSourceError("시각 서버 응답 상태가 200이 아닙니다: " + std::to_string(res.result_int()));
  }
  auto body = nlohmann::json::parse(res.body(), nullptr, false);
  if (body.is_discarded()) {
    throw TimeSourceError("시각 서버 응답이 JSON이 아닙니다");
  }
  nlohmann::json::json_pointer pointer(json_pointer_);
  if (!body.contains(pointer) || !body.at(pointer).is_number_integer()) {
    throw TimeSourceError("시각 서버 응답에 정수 타임스탬프가 없습니다: " + json_pointer_);
  }
  return body.at(pointer).get<std::int64_t>();
}

TimestampFn MakeTimestampFn(const std::string& time_url, const std::string& json_pointer) {
  if (time_url.empty()) {
    return &SystemClockTimestamp;
  }
  return HttpTimeSource(ParseHttpUrl(time_url), json_pointer);
}

}  // namespace iothub
