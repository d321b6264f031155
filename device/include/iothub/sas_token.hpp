/*
 * 설명: 리소스 URI, base64 공유 키, 만료 시각으로 SAS 토큰을 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: device/tests/unit/sas_token_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace iothub {

// 형식: SharedAccessSignature sr=<enc(uri)>&sig=<enc(base64(hmac))>&se=<expiry>
std::string GenerateSasToken(const std::string& resource_uri, const std::string& key_base64,
                             std::int64_t expiry_epoch_seconds);

std::vector<unsigned char> DecodeBase64Key(const std::string& key_base64);
std::string EncodeBase64(const unsigned char* data, std::size_t len);

}  // namespace iothub
