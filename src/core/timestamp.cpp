#include "core/timestamp.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace flowguard::timestamp {

namespace {

constexpr double kMaxEpochSeconds = 1e11;

/// Forward-only cursor over the input text
class Cursor {
public:
    explicit Cursor(std::string_view text) : text_(text) {}

    [[nodiscard]] bool done() const noexcept { return pos_ >= text_.size(); }

    [[nodiscard]] char peek() const noexcept { return done() ? '\0' : text_[pos_]; }

    bool consume(char c) {
        if (peek() == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    /// Read exactly `count` decimal digits
    std::optional<int> digits(std::size_t count) {
        if (pos_ + count > text_.size()) {
            return std::nullopt;
        }
        int value = 0;
        for (std::size_t i = 0; i < count; ++i) {
            char c = text_[pos_ + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            value = value * 10 + (c - '0');
        }
        pos_ += count;
        return value;
    }

    /// Read a run of one or more digits as milliseconds (extra precision truncated)
    std::optional<int> fraction_millis() {
        std::size_t start = pos_;
        int millis = 0;
        int scale = 100;
        while (!done() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            millis += (text_[pos_] - '0') * scale;
            scale /= 10;
            ++pos_;
        }
        if (pos_ == start) {
            return std::nullopt;
        }
        return millis;
    }

private:
    std::string_view text_;
    std::size_t pos_{0};
};

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

/// Parse "Z", "+HH:MM", "+HHMM" or "+HH"; returns offset east of UTC in minutes
std::optional<int> parse_offset(Cursor& cur) {
    if (cur.consume('Z') || cur.consume('z')) {
        return 0;
    }
    int sign = 0;
    if (cur.consume('+')) {
        sign = 1;
    } else if (cur.consume('-')) {
        sign = -1;
    } else {
        return std::nullopt;
    }

    auto hours = cur.digits(2);
    if (!hours || *hours > 23) {
        return std::nullopt;
    }
    int minutes = 0;
    if (!cur.done()) {
        cur.consume(':');
        auto mm = cur.digits(2);
        if (!mm || *mm > 59) {
            return std::nullopt;
        }
        minutes = *mm;
    }
    return sign * (*hours * 60 + minutes);
}

}  // namespace

std::optional<UtcTime> parse(std::string_view text) {
    using namespace std::chrono;

    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }

    Cursor cur(text);

    auto y = cur.digits(4);
    if (!y || !cur.consume('-')) return std::nullopt;
    auto mo = cur.digits(2);
    if (!mo || !cur.consume('-')) return std::nullopt;
    auto d = cur.digits(2);
    if (!d) return std::nullopt;

    year_month_day ymd{year{*y}, month{static_cast<unsigned>(*mo)},
                       day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    int hh = 0;
    int mi = 0;
    int ss = 0;
    int ms = 0;
    int offset_minutes = 0;

    if (!cur.done()) {
        if (!(cur.consume('T') || cur.consume('t') || cur.consume(' '))) {
            return std::nullopt;
        }
        auto h = cur.digits(2);
        if (!h || *h > 23 || !cur.consume(':')) return std::nullopt;
        auto m = cur.digits(2);
        if (!m || *m > 59) return std::nullopt;
        hh = *h;
        mi = *m;

        if (cur.consume(':')) {
            auto s = cur.digits(2);
            if (!s || *s > 59) return std::nullopt;
            ss = *s;
            if (cur.consume('.') || cur.consume(',')) {
                auto frac = cur.fraction_millis();
                if (!frac) return std::nullopt;
                ms = *frac;
            }
        }

        if (!cur.done()) {
            auto offset = parse_offset(cur);
            if (!offset) return std::nullopt;
            offset_minutes = *offset;
        }
    }

    if (!cur.done()) {
        return std::nullopt;
    }

    UtcTime result = sys_days{ymd} + hours{hh} + minutes{mi} + seconds{ss} +
                     milliseconds{ms};
    return result - minutes{offset_minutes};
}

std::optional<UtcTime> from_epoch_seconds(double seconds) {
    if (!std::isfinite(seconds) || std::fabs(seconds) > kMaxEpochSeconds) {
        return std::nullopt;
    }
    auto millis = static_cast<std::int64_t>(std::floor(seconds * 1000.0));
    return UtcTime{std::chrono::milliseconds{millis}};
}

std::string format_iso8601(UtcTime time) {
    using namespace std::chrono;

    auto day_point = floor<days>(time);
    year_month_day ymd{day_point};
    hh_mm_ss tod{floor<seconds>(time - day_point)};

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
        << std::setw(2) << tod.hours().count() << ':'
        << std::setw(2) << tod.minutes().count() << ':'
        << std::setw(2) << tod.seconds().count() << 'Z';
    return oss.str();
}

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace flowguard::timestamp
