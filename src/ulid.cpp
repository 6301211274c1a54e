#include "ulidgen/ulid.h"
#include "ulidgen/base32.h"
#include "ulidgen/errors.h"
#include "ulidgen/generator.h"

namespace ulidgen {

namespace {

IGenerator& DefaultGenerator() {
    static const std::unique_ptr<IGenerator> generator = CreateGenerator(GeneratorOptions(false));
    return *generator;
}

} // namespace

std::string ULID::Generate() {
    return DefaultGenerator().Generate();
}

std::string ULID::Generate(int64_t timestamp) {
    return DefaultGenerator().Generate(timestamp);
}

int64_t ULID::DecodeTime(const std::string& id) {
    if (id.length() != ULID_LENGTH) {
        throw MalformedUlidException("expected " + std::to_string(ULID_LENGTH) +
                                     " characters, got " + std::to_string(id.length()));
    }

    uint64_t time = Base32::DecodeInteger(id.substr(0, TIMESTAMP_LENGTH));
    if (time > static_cast<uint64_t>(TIME_MAX)) {
        throw TimestampRangeException("Malformed ULID: timestamp too large: " + std::to_string(time));
    }

    return static_cast<int64_t>(time);
}

bool ULID::IsValid(const std::string& id) {
    if (id.length() != ULID_LENGTH || !Base32::IsValid(id)) {
        return false;
    }

    // 첫 글자가 '7'보다 크면 48비트를 넘음
    return Base32::DecodeInteger(id.substr(0, TIMESTAMP_LENGTH)) <= static_cast<uint64_t>(TIME_MAX);
}

} // namespace ulidgen
