#include <mkrpki/core/time.hpp>

#include <cstdio>

namespace mkrpki {

    namespace {

        bool read_number(std::string_view text, size_t &pos, size_t digits, int &out) {
            if (pos + digits > text.size()) {
                return false;
            }
            out = 0;
            for (size_t i = 0; i < digits; ++i) {
                const char c = text[pos + i];
                if (c < '0' || c > '9') {
                    return false;
                }
                out = (out * 10) + (c - '0');
            }
            pos += digits;
            return true;
        }

        bool expect_char(std::string_view text, size_t &pos, char expected) {
            if (pos >= text.size() || text[pos] != expected) {
                return false;
            }
            ++pos;
            return true;
        }

    } // namespace

    Result<Time> parse_time(std::string_view text) {
        auto invalid = [&]() {
            return Result<Time>::failure(ErrorKind::Parse, "Invalid time '" + std::string(text) + "'");
        };

        size_t pos = 0;
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (!read_number(text, pos, 4, year) || !expect_char(text, pos, '-') || !read_number(text, pos, 2, month) ||
            !expect_char(text, pos, '-') || !read_number(text, pos, 2, day)) {
            return invalid();
        }
        if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
            return invalid();
        }
        ++pos;
        if (!read_number(text, pos, 2, hour) || !expect_char(text, pos, ':') || !read_number(text, pos, 2, minute) ||
            !expect_char(text, pos, ':') || !read_number(text, pos, 2, second)) {
            return invalid();
        }
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            const size_t start = pos;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                ++pos;
            }
            if (pos == start) {
                return invalid();
            }
        }

        int offset_minutes = 0;
        if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
            ++pos;
        } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            const int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int off_hour = 0, off_minute = 0;
            if (!read_number(text, pos, 2, off_hour) || !expect_char(text, pos, ':') ||
                !read_number(text, pos, 2, off_minute) || off_hour > 23 || off_minute > 59) {
                return invalid();
            }
            offset_minutes = sign * ((off_hour * 60) + off_minute);
        } else {
            return invalid();
        }
        if (pos != text.size()) {
            return invalid();
        }

        using namespace std::chrono;
        const year_month_day ymd{std::chrono::year{year} / std::chrono::month{static_cast<unsigned>(month)} /
                                 std::chrono::day{static_cast<unsigned>(day)}};
        if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) {
            return invalid();
        }
        const auto local = sys_days{ymd} + hours{hour} + minutes{minute} + seconds{second};
        const Time tp = local - minutes{offset_minutes};
        if (tp < earliest_time() || tp > latest_time()) {
            return invalid();
        }
        return Result<Time>::ok(tp);
    }

    std::string format_time(Time tp) {
        using namespace std::chrono;
        const auto midnight = floor<days>(tp);
        const year_month_day ymd{midnight};
        const hh_mm_ss hms{tp - midnight};
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02dZ", static_cast<int>(ymd.year()),
                      static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                      static_cast<int>(hms.hours().count()), static_cast<int>(hms.minutes().count()),
                      static_cast<int>(hms.seconds().count()));
        return buffer;
    }

} // namespace mkrpki
