#include "ulidgen/openssl_random_source.h"
#include "ulidgen/errors.h"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <climits>
#include <string>

namespace ulidgen {

void OpenSSLRandomSource::Fill(uint8_t* buffer, size_t length) {
    while (length > 0) {
        // RAND_bytes는 int 길이만 받으므로 나눠서 요청
        int chunk = length > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(length);
        if (RAND_bytes(buffer, chunk) != 1) {
            char message[256];
            ERR_error_string_n(ERR_get_error(), message, sizeof(message));
            throw RandomSourceException(message);
        }
        buffer += chunk;
        length -= static_cast<size_t>(chunk);
    }
}

} // namespace ulidgen
