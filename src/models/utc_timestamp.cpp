#include "regtoken/models/utc_timestamp.hpp"
#include "regtoken/core/constants.hpp"
#include "regtoken/core/format.hpp"

#include <charconv>

namespace regtoken::models {
    namespace {
        bool ParseField(const std::string_view text, const size_t offset, const size_t width, int& out) {
            const char* first = text.data() + offset;
            const char* last = first + width;
            for (const char* it = first; it != last; ++it) {
                if (*it < '0' || *it > '9') {
                    return false;
                }
            }
            const auto [ptr, ec] = std::from_chars(first, last, out);
            return ec == std::errc() && ptr == last;
        }
    }

    Option<UtcSeconds> ParseUtcTimestamp(const std::string_view text) {
        using namespace std::chrono;

        if (text.size() != PayloadConstants::UTC_TIMESTAMP_LENGTH ||
            text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
            text[13] != ':' || text[16] != ':' || text[19] != 'Z') {
            return None<UtcSeconds>();
        }

        int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
        if (!ParseField(text, 0, 4, y) || !ParseField(text, 5, 2, mo) || !ParseField(text, 8, 2, d) ||
            !ParseField(text, 11, 2, h) || !ParseField(text, 14, 2, mi) || !ParseField(text, 17, 2, s)) {
            return None<UtcSeconds>();
        }

        const year_month_day date{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
        if (!date.ok() || h > 23 || mi > 59 || s > 59) {
            return None<UtcSeconds>();
        }

        return Some(UtcSeconds{sys_days{date}} + hours{h} + minutes{mi} + seconds{s});
    }

    std::string FormatUtcTimestamp(const UtcSeconds instant) {
        using namespace std::chrono;

        const auto day_start = floor<days>(instant);
        const year_month_day date{day_start};
        const hh_mm_ss time{instant - day_start};

        return compat::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z",
            static_cast<int>(date.year()),
            static_cast<unsigned>(date.month()),
            static_cast<unsigned>(date.day()),
            time.hours().count(),
            time.minutes().count(),
            time.seconds().count());
    }
}
