#include "ulidgen/random_source.h"
#include "ulidgen/openssl_random_source.h"

namespace ulidgen {

std::shared_ptr<IRandomSource> CreateRandomSource() {
    return std::make_shared<OpenSSLRandomSource>();
}

} // namespace ulidgen
