#include <wirebind/protocol/encoding.h>

#include <array>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstring>
#include <limits>

#include <fmt/format.h>

namespace wirebind::encoding {

namespace {

constexpr char kBase64Chars[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<const char*, 7> kWeekdays = {"Sun", "Mon", "Tue", "Wed",
                                                  "Thu", "Fri", "Sat"};
constexpr std::array<const char*, 12> kMonths = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                 "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

int base64Value(char c) {
    if (c >= 'A' && c <= 'Z')
        return c - 'A';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 26;
    if (c >= '0' && c <= '9')
        return c - '0' + 52;
    if (c == '+')
        return 62;
    if (c == '/')
        return 63;
    return -1;
}

bool isUnreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

Error badTimestamp(std::string_view text, TimestampFormat format, std::string_view why) {
    return Error{ErrorCode::DecodeError, "Invalid " + std::string(wirebind::toString(format)) +
                                             " timestamp '" + std::string(text) +
                                             "': " + std::string(why)};
}

// Minimal cursor over timestamp text
class Cursor {
public:
    explicit Cursor(std::string_view text) : text_(text) {}

    bool digits(size_t count, int& out) {
        if (pos_ + count > text_.size())
            return false;
        int v = 0;
        for (size_t i = 0; i < count; ++i) {
            char c = text_[pos_ + i];
            if (c < '0' || c > '9')
                return false;
            v = v * 10 + (c - '0');
        }
        out = v;
        pos_ += count;
        return true;
    }

    bool literal(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool word(std::string_view w) {
        if (text_.substr(pos_, w.size()) == w) {
            pos_ += w.size();
            return true;
        }
        return false;
    }

    char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }
    bool done() const { return pos_ >= text_.size(); }
    void advance() { ++pos_; }

private:
    std::string_view text_;
    size_t pos_ = 0;
};

// TimePoint counts nanoseconds on common platforms; reject what it cannot hold
Result<TimePoint> fromEpochMillis(int64_t millis, std::string_view text, TimestampFormat format) {
    using namespace std::chrono;
    constexpr int64_t kMaxMillis = duration_cast<milliseconds>(TimePoint::duration::max()).count();
    constexpr int64_t kMinMillis = duration_cast<milliseconds>(TimePoint::duration::min()).count();
    if (millis > kMaxMillis || millis < kMinMillis) {
        return badTimestamp(text, format, "timestamp out of range");
    }
    return TimePoint{duration_cast<TimePoint::duration>(milliseconds{millis})};
}

Result<TimePoint> makeTimePoint(int y, int mo, int d, int h, int mi, int s, int millis,
                                std::string_view text, TimestampFormat format,
                                int offsetMinutes = 0) {
    using namespace std::chrono;
    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        return badTimestamp(text, format, "calendar date out of range");
    }
    if (h > 23 || mi > 59 || s > 59) {
        return badTimestamp(text, format, "time of day out of range");
    }
    auto since = sys_days{ymd}.time_since_epoch() + hours{h} + minutes{mi - offsetMinutes} +
                 seconds{s} + milliseconds{millis};
    return fromEpochMillis(duration_cast<milliseconds>(since).count(), text, format);
}

Result<TimePoint> parseIso8601(std::string_view text) {
    constexpr auto fmt = TimestampFormat::Iso8601;
    Cursor c(text);
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!(c.digits(4, y) && c.literal('-') && c.digits(2, mo) && c.literal('-') &&
          c.digits(2, d) && (c.literal('T') || c.literal('t')) && c.digits(2, h) &&
          c.literal(':') && c.digits(2, mi) && c.literal(':') && c.digits(2, s))) {
        return badTimestamp(text, fmt, "expected YYYY-MM-DDTHH:MM:SS");
    }

    int millis = 0;
    if (c.literal('.')) {
        int scale = 100;
        int count = 0;
        while (c.peek() >= '0' && c.peek() <= '9') {
            if (scale > 0) {
                millis += (c.peek() - '0') * scale;
                scale /= 10;
            }
            c.advance();
            ++count;
        }
        if (count == 0) {
            return badTimestamp(text, fmt, "empty fractional seconds");
        }
    }

    int offsetMinutes = 0;
    if (c.literal('Z') || c.literal('z')) {
        // UTC
    } else if (c.peek() == '+' || c.peek() == '-') {
        int sign = c.peek() == '-' ? -1 : 1;
        c.advance();
        int oh = 0, om = 0;
        if (!c.digits(2, oh)) {
            return badTimestamp(text, fmt, "malformed UTC offset");
        }
        c.literal(':');
        if (!c.digits(2, om) || oh > 23 || om > 59) {
            return badTimestamp(text, fmt, "malformed UTC offset");
        }
        offsetMinutes = sign * (oh * 60 + om);
    } else {
        return badTimestamp(text, fmt, "missing zone designator");
    }
    if (!c.done()) {
        return badTimestamp(text, fmt, "trailing characters");
    }

    return makeTimePoint(y, mo, d, h, mi, s, millis, text, fmt, offsetMinutes);
}

Result<TimePoint> parseRfc822(std::string_view text) {
    constexpr auto fmt = TimestampFormat::Rfc822;
    Cursor c(text);

    // Optional "Wed, " prefix
    for (const char* wd : kWeekdays) {
        if (c.word(wd)) {
            if (!(c.literal(',') && c.literal(' '))) {
                return badTimestamp(text, fmt, "malformed weekday");
            }
            break;
        }
    }

    int d = 0;
    if (!c.digits(2, d) && !c.digits(1, d)) {
        return badTimestamp(text, fmt, "expected day of month");
    }
    if (!c.literal(' ')) {
        return badTimestamp(text, fmt, "expected ' ' after day");
    }
    int mo = 0;
    for (size_t i = 0; i < kMonths.size(); ++i) {
        if (c.word(kMonths[i])) {
            mo = static_cast<int>(i) + 1;
            break;
        }
    }
    int y = 0, h = 0, mi = 0, s = 0;
    if (mo == 0 || !(c.literal(' ') && c.digits(4, y) && c.literal(' ') && c.digits(2, h) &&
                     c.literal(':') && c.digits(2, mi) && c.literal(':') && c.digits(2, s) &&
                     c.literal(' '))) {
        return badTimestamp(text, fmt, "expected 'DD Mon YYYY HH:MM:SS'");
    }
    if (!(c.word("GMT") || c.word("UTC") || c.word("+0000")) || !c.done()) {
        return badTimestamp(text, fmt, "zone must be GMT");
    }
    return makeTimePoint(y, mo, d, h, mi, s, 0, text, fmt);
}

Result<TimePoint> parseUnixSeconds(std::string_view text) {
    constexpr auto fmt = TimestampFormat::UnixSeconds;
    if (text.find_first_of("eE") != std::string_view::npos) {
        double v = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
        if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(v)) {
            return badTimestamp(text, fmt, "not a number");
        }
        // llround is undefined past the int64 range
        if (std::fabs(v) > 9.0e15) {
            return badTimestamp(text, fmt, "timestamp out of range");
        }
        return fromEpochMillis(std::llround(v * 1000.0), text, fmt);
    }

    auto dot = text.find('.');
    std::string_view whole = text.substr(0, dot);
    int64_t secs = 0;
    auto [ptr, ec] = std::from_chars(whole.data(), whole.data() + whole.size(), secs);
    if (whole.empty() || ec != std::errc{} || ptr != whole.data() + whole.size()) {
        return badTimestamp(text, fmt, "not a number");
    }
    int64_t millis = 0;
    if (dot != std::string_view::npos) {
        std::string_view frac = text.substr(dot + 1);
        if (frac.empty()) {
            return badTimestamp(text, fmt, "empty fraction");
        }
        int64_t scale = 100;
        for (char ch : frac) {
            if (ch < '0' || ch > '9') {
                return badTimestamp(text, fmt, "not a number");
            }
            millis += (ch - '0') * scale;
            scale /= 10;
        }
        if (!whole.empty() && whole.front() == '-') {
            millis = -millis;
        }
    }
    if (secs > std::numeric_limits<int64_t>::max() / 1000 ||
        secs < std::numeric_limits<int64_t>::min() / 1000) {
        return badTimestamp(text, fmt, "timestamp out of range");
    }
    return fromEpochMillis(secs * 1000 + millis, text, fmt);
}

Result<TimePoint> parseUnixMillis(std::string_view text) {
    int64_t millis = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), millis);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return badTimestamp(text, TimestampFormat::UnixMillis, "not an integer");
    }
    return fromEpochMillis(millis, text, TimestampFormat::UnixMillis);
}

} // namespace

//-----------------------------------------------------------------------------
// base64
//-----------------------------------------------------------------------------

std::string base64Encode(ByteSpan bytes) {
    std::string base64;
    base64.reserve(((bytes.size() + 2) / 3) * 4);

    const auto* data = reinterpret_cast<const uint8_t*>(bytes.data());
    size_t len = bytes.size();

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len)
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len)
            n |= static_cast<uint32_t>(data[i + 2]);

        base64 += kBase64Chars[(n >> 18) & 0x3F];
        base64 += kBase64Chars[(n >> 12) & 0x3F];
        base64 += (i + 1 < len) ? kBase64Chars[(n >> 6) & 0x3F] : '=';
        base64 += (i + 2 < len) ? kBase64Chars[n & 0x3F] : '=';
    }
    return base64;
}

Result<ByteVector> base64Decode(std::string_view text) {
    if (text.size() % 4 != 0) {
        return Error{ErrorCode::DecodeError, "Invalid base64: length " +
                                                 std::to_string(text.size()) +
                                                 " is not a multiple of 4"};
    }

    size_t padding = 0;
    if (!text.empty() && text.back() == '=') {
        padding = (text.size() >= 2 && text[text.size() - 2] == '=') ? 2 : 1;
    }

    ByteVector out;
    out.reserve(text.size() / 4 * 3);
    for (size_t i = 0; i < text.size(); i += 4) {
        uint32_t n = 0;
        for (size_t j = 0; j < 4; ++j) {
            size_t pos = i + j;
            char c = text[pos];
            if (c == '=') {
                if (pos < text.size() - padding) {
                    return Error{ErrorCode::DecodeError,
                                 "Invalid base64: padding at offset " + std::to_string(pos)};
                }
                n <<= 6;
                continue;
            }
            int v = base64Value(c);
            if (v < 0) {
                return Error{ErrorCode::DecodeError, "Invalid base64: character '" +
                                                         std::string(1, c) + "' at offset " +
                                                         std::to_string(pos)};
            }
            n = (n << 6) | static_cast<uint32_t>(v);
        }
        bool last = i + 4 == text.size();
        out.push_back(static_cast<std::byte>((n >> 16) & 0xFF));
        if (!last || padding < 2)
            out.push_back(static_cast<std::byte>((n >> 8) & 0xFF));
        if (!last || padding < 1)
            out.push_back(static_cast<std::byte>(n & 0xFF));
    }
    return out;
}

//-----------------------------------------------------------------------------
// URL escaping
//-----------------------------------------------------------------------------

std::string urlEncode(std::string_view text, bool keepSlash) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (isUnreserved(c) || (keepSlash && c == '/')) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

//-----------------------------------------------------------------------------
// Timestamps
//-----------------------------------------------------------------------------

Result<std::string> formatTimestamp(TimePoint tp, TimestampFormat format) {
    using namespace std::chrono;
    auto ms = floor<milliseconds>(tp);

    if (format == TimestampFormat::UnixMillis) {
        return std::to_string(ms.time_since_epoch().count());
    }
    if (format == TimestampFormat::UnixSeconds) {
        int64_t count = ms.time_since_epoch().count();
        bool negative = count < 0;
        int64_t magnitude = negative ? -count : count;
        std::string out = (negative ? "-" : "") + std::to_string(magnitude / 1000);
        if (auto frac = magnitude % 1000; frac != 0) {
            std::string f = fmt::format(".{:03}", frac);
            while (f.back() == '0')
                f.pop_back();
            out += f;
        }
        return out;
    }

    auto dp = floor<days>(ms);
    year_month_day ymd{dp};
    hh_mm_ss hms{ms - dp};
    int y = static_cast<int>(ymd.year());
    if (y < 0 || y > 9999) {
        return Error{ErrorCode::EncodeError,
                     "Timestamp year " + std::to_string(y) + " cannot be formatted"};
    }
    unsigned mo = static_cast<unsigned>(ymd.month());
    unsigned d = static_cast<unsigned>(ymd.day());
    auto h = static_cast<int>(hms.hours().count());
    auto mi = static_cast<int>(hms.minutes().count());
    auto s = static_cast<int>(hms.seconds().count());
    auto millis = static_cast<int>(hms.subseconds().count());

    switch (format) {
        case TimestampFormat::Iso8601:
            if (millis != 0) {
                return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", y, mo, d, h, mi,
                                   s, millis);
            }
            return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z", y, mo, d, h, mi, s);
        case TimestampFormat::Rfc822: {
            weekday wd{dp};
            return fmt::format("{}, {:02} {} {:04} {:02}:{:02}:{:02} GMT",
                               kWeekdays[wd.c_encoding()], d, kMonths[mo - 1], y, h, mi, s);
        }
        default:
            break;
    }
    return Error{ErrorCode::EncodeError,
                 std::string("No timestamp format given (") + wirebind::toString(format) + ")"};
}

Result<TimePoint> parseTimestamp(std::string_view text, TimestampFormat format) {
    switch (format) {
        case TimestampFormat::Iso8601:
            return parseIso8601(text);
        case TimestampFormat::Rfc822:
            return parseRfc822(text);
        case TimestampFormat::UnixSeconds:
            return parseUnixSeconds(text);
        case TimestampFormat::UnixMillis:
            return parseUnixMillis(text);
        case TimestampFormat::None:
            break;
    }
    return Error{ErrorCode::DecodeError, "No timestamp format given for '" + std::string(text) +
                                             "'"};
}

//-----------------------------------------------------------------------------
// Misc
//-----------------------------------------------------------------------------

Result<std::string> formatDouble(double value) {
    if (!std::isfinite(value)) {
        return Error{ErrorCode::EncodeError, "Non-finite double cannot be encoded"};
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        return Error{ErrorCode::EncodeError, "Failed to format double"};
    }
    return std::string(buf, ptr);
}

ByteVector toBytes(std::string_view text) {
    ByteVector out(text.size());
    if (!text.empty()) {
        std::memcpy(out.data(), text.data(), text.size());
    }
    return out;
}

std::string toString(ByteSpan bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

} // namespace wirebind::encoding
