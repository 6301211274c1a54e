#pragma once

#include "ulidgen/random_source.h"

namespace ulidgen {

/**
 * OpenSSL RAND_bytes 기반 난수 소스
 * OpenSSL 1.1.0 이상에서 RAND_bytes는 스레드 안전하다.
 */
class OpenSSLRandomSource : public IRandomSource {
public:
    OpenSSLRandomSource() = default;
    ~OpenSSLRandomSource() override = default;

    // IRandomSource 인터페이스 구현
    void Fill(uint8_t* buffer, size_t length) override;
};

} // namespace ulidgen
