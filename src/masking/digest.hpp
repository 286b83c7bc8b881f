#pragma once

// ---------------------------------------------------------------------------
// digest.hpp
//
// OpenSSL EVP 기반 SHA-256 헬퍼.
// - hash 마스킹 전략의 결정적 digest (같은 입력 → 같은 digest)
// - 감사 기록의 입력 fingerprint (원문 대신 기록)
//
// salt 는 설정(pipeline.fingerprint_salt)에서 주입한다. salt 없이도 동작하나,
// 짧은 PII(전화번호 등)는 사전 공격으로 역산될 수 있으므로 운영 환경에서는
// salt 설정을 권장한다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>

// sha256_hex
//   salt || data 의 SHA-256 을 소문자 hex 64자로 반환한다.
//   OpenSSL 내부 실패 시 빈 문자열 (호출자는 빈 값을 fail-close 로 처리).
[[nodiscard]] std::string sha256_hex(std::string_view data, std::string_view salt = {});

// short_digest
//   sha256_hex 의 앞 16자 (64bit). 마스킹 토큰용.
[[nodiscard]] std::string short_digest(std::string_view data, std::string_view salt = {});
