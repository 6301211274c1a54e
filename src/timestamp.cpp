#include "ulidgen/timestamp.h"
#include "ulidgen/base32.h"
#include "ulidgen/errors.h"
#include <cctype>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

namespace ulidgen {

namespace {

std::string FormatNumber(double value) {
    std::ostringstream out;
    out << std::setprecision(17) << value;
    return out.str();
}

bool IsDecimal(const std::string& text) {
    size_t i = 0;
    if (i < text.length() && (text[i] == '+' || text[i] == '-')) {
        ++i;
    }

    size_t digits = 0;
    while (i < text.length() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        ++i;
        ++digits;
    }
    if (digits == 0) {
        return false;
    }
    if (i == text.length()) {
        return true;
    }

    if (text[i] != '.') {
        return false;
    }
    ++i;
    size_t fraction = 0;
    while (i < text.length() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        ++i;
        ++fraction;
    }
    return fraction > 0 && i == text.length();
}

} // namespace

void ValidateTimestamp(double timestamp) {
    if (std::isnan(timestamp)) {
        throw TimestampTypeException(FormatNumber(timestamp));
    }
    if (timestamp > static_cast<double>(TIME_MAX)) {
        throw TimestampRangeException("cannot encode a timestamp larger than " +
                                      std::to_string(TIME_MAX) + ": " +
                                      FormatNumber(timestamp));
    }
    if (timestamp < 0) {
        throw TimestampRangeException("timestamp must be positive: " + FormatNumber(timestamp));
    }
    if (std::floor(timestamp) != timestamp) {
        throw TimestampValueException(FormatNumber(timestamp));
    }
}

int64_t ParseTimestamp(const std::string& text) {
    size_t first = 0;
    size_t last = text.length();
    while (first < last && std::isspace(static_cast<unsigned char>(text[first]))) {
        ++first;
    }
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) {
        --last;
    }
    std::string trimmed = text.substr(first, last - first);

    // 10진수만 허용: [+-]?[0-9]+(\.[0-9]+)?
    if (!IsDecimal(trimmed)) {
        throw TimestampTypeException("\"" + text + "\"");
    }

    // 소수점 해석이 로케일에 영향받지 않도록 classic 로케일 사용
    std::istringstream in(trimmed);
    in.imbue(std::locale::classic());
    double value = 0;
    in >> value;
    if (in.fail()) {
        throw TimestampTypeException("\"" + text + "\"");
    }

    ValidateTimestamp(value);
    return static_cast<int64_t>(value);
}

std::string EncodeTime(int64_t timestamp, size_t width) {
    ValidateTimestamp(static_cast<double>(timestamp));
    return Base32::EncodeInteger(static_cast<uint64_t>(timestamp), width);
}

} // namespace ulidgen
