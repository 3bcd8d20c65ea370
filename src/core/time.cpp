#include "bulkup/core/time.hpp"

#include "bulkup/core/platform.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace bulkup {
namespace {

bool read_digits(std::string_view text, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(std::string_view text, std::size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

} // namespace

std::string format_timestamp(Timestamp value) {
    using namespace std::chrono;
    const auto since_epoch = duration_cast<microseconds>(value.time_since_epoch());
    auto secs = duration_cast<seconds>(since_epoch);
    auto micros = since_epoch - duration_cast<microseconds>(secs);
    if (micros.count() < 0) {
        secs -= seconds(1);
        micros += seconds(1);
    }

    const std::tm tm = platform::utc_tm(static_cast<std::time_t>(secs.count()));
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros.count() << 'Z';
    return oss.str();
}

std::optional<Timestamp> parse_timestamp(std::string_view text) {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    long long micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 6; ++i) {
            micros *= 10;
        }
    }

    int offset_minutes = 0;
    if (pos < text.size()) {
        const char sign = text[pos];
        if (sign == 'Z' || sign == 'z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            ++pos;
            int off_h = 0, off_m = 0;
            if (!read_digits(text, pos, 2, off_h) || !expect(text, pos, ':') ||
                !read_digits(text, pos, 2, off_m)) {
                return std::nullopt;
            }
            offset_minutes = off_h * 60 + off_m;
            if (sign == '-') {
                offset_minutes = -offset_minutes;
            }
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const std::time_t utc = platform::utc_time_t(tm);

    using namespace std::chrono;
    Timestamp result = Clock::from_time_t(utc);
    result += duration_cast<Clock::duration>(microseconds(micros));
    result -= duration_cast<Clock::duration>(minutes(offset_minutes));
    return result;
}

} // namespace bulkup
