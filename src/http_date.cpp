#include "s3_cpp/http_date.hpp"

#include <array>
#include <charconv>
#include <cstdio>

namespace s3_cpp {

    namespace {
        constexpr std::array<std::string_view, 7> kDays{
            "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
        constexpr std::array<std::string_view, 12> kMonths{
            "Jan", "Feb", "Mar", "Apr", "May", "Jun",
            "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

        bool parse_uint(std::string_view s, unsigned& out) {
            if (s.empty()) return false;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            return ec == std::errc{} && ptr == s.data() + s.size();
        }
    }  // namespace

    std::string format_http_date(Timestamp t) {
        using namespace std::chrono;
        const auto day = floor<days>(t);
        const year_month_day ymd{day};
        const hh_mm_ss<seconds> tod{t - day};
        const weekday wd{day};

        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.3s, %02u %.3s %04d %02d:%02d:%02d GMT",
                      kDays[wd.c_encoding()].data(),
                      static_cast<unsigned>(ymd.day()),
                      kMonths[static_cast<unsigned>(ymd.month()) - 1].data(),
                      static_cast<int>(ymd.year()),
                      static_cast<int>(tod.hours().count()),
                      static_cast<int>(tod.minutes().count()),
                      static_cast<int>(tod.seconds().count()));
        return buf;
    }

    std::optional<Timestamp> parse_http_date(std::string_view text) {
        using namespace std::chrono;
        // "Sun, 06 Nov 1994 08:49:37 GMT"
        //  0123456789012345678901234567890
        if (text.size() != 29 || text.substr(3, 2) != ", " || text[7] != ' ' ||
            text[11] != ' ' || text[16] != ' ' || text[19] != ':' ||
            text[22] != ':' || text.substr(25) != " GMT") {
            return std::nullopt;
        }

        bool weekday_ok = false;
        for (auto d : kDays) weekday_ok = weekday_ok || d == text.substr(0, 3);
        if (!weekday_ok) return std::nullopt;

        unsigned month_index = 0;
        while (month_index < kMonths.size() &&
               kMonths[month_index] != text.substr(8, 3)) {
            ++month_index;
        }
        if (month_index == kMonths.size()) return std::nullopt;

        unsigned d = 0, y = 0, hh = 0, mm = 0, ss = 0;
        if (!parse_uint(text.substr(5, 2), d) ||
            !parse_uint(text.substr(12, 4), y) ||
            !parse_uint(text.substr(17, 2), hh) ||
            !parse_uint(text.substr(20, 2), mm) ||
            !parse_uint(text.substr(23, 2), ss)) {
            return std::nullopt;
        }
        if (hh > 23 || mm > 59 || ss > 60) return std::nullopt;

        const year_month_day ymd{year{static_cast<int>(y)},
                                 month{month_index + 1}, day{d}};
        if (!ymd.ok()) return std::nullopt;

        return sys_days{ymd} + hours{hh} + minutes{mm} + seconds{ss};
    }

}  // namespace s3_cpp
