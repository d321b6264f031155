/*
 * 설명: OpenSSL HMAC-SHA256으로 SAS 토큰 서명을 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/unit/sas_token_test.cpp
 */
#include "iothub/sas_token.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "iothub/errors.hpp"
#include "iothub/topic_codec.hpp"

namespace iothub {

std::vector<unsigned char> DecodeBase64Key(const std::string& key_base64) {
  if (key_base64.empty() || key_base64.size() % 4 != 0) {
    throw ConfigError("디바이스 키가 올바른 base64 길이가 아닙니다");
  }
  std::vector<unsigned char> out(key_base64.size() / 4 * 3);
  int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(key_base64.data()),
                            static_cast<int>(key_base64.size()));
  if (len < 0) {
    throw ConfigError("디바이스 키를 base64로 해석할 수 없습니다");
  }
  // EVP_DecodeBlock은 패딩 바이트까지 0으로 채워 길이에 포함한다.
  std::size_t padding = 0;
  if (key_base64[key_base64.size() - 1] == '=') {
    ++padding;
    if (key_base64[key_base64.size() - 2] == '=') {
      ++padding;
    }
  }
  out.resize(static_cast<std::size_t>(len) - padding);
  return out;
}

std::string EncodeBase64(const unsigned char* data, std::size_t len) {
  std::string out(4 * ((len + 2) / 3), '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data, static_cast<int>(len));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::string GenerateSasToken(const std::string& resource_uri, const std::string& key_base64,
                             std::int64_t expiry_epoch_seconds) {
  auto key = DecodeBase64Key(key_base64);
  const std::string encoded_uri = UrlEncode(resource_uri);
  const std::string expiry = std::to_string(expiry_epoch_seconds);
  const std::string to_sign = encoded_uri + "\n" + expiry;

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(to_sign.data()), to_sign.size(), digest, &digest_len)) {
    throw ConfigError("SAS 서명 계산에 실패했습니다");
  }
  const std::string signature = EncodeBase64(digest, digest_len);
  return "SharedAccessSignature sr=" + encoded_uri + "&sig=" + UrlEncode(signature) + "&se=" + expiry;
}

}  // namespace iothub
