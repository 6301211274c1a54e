#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

namespace ulidgen {

/**
 * 난수 바이트 소스 인터페이스 (DIP 준수)
 * 생성기는 구체적인 암호화 라이브러리에 의존하지 않고, 테스트에서는
 * 결정적인 구현으로 교체할 수 있다.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * 버퍼를 암호학적으로 안전한 난수 바이트로 채움
     * @param buffer 출력 버퍼
     * @param length 바이트 수
     * @throws RandomSourceException 난수 생성 실패시
     */
    virtual void Fill(uint8_t* buffer, size_t length) = 0;
};

/**
 * 기본 난수 소스 생성 (OpenSSL)
 */
std::shared_ptr<IRandomSource> CreateRandomSource();

} // namespace ulidgen
