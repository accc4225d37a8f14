#include <utils/time.hpp>
#include <cstdio>

namespace Databrain {

namespace {

constexpr int64_t k_micros_per_day = 86400LL * 1000000LL;

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (m <= 2));
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // namespace

int64_t to_epoch_micros(SystemTimePoint t) {
    return std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
}

SystemTimePoint from_epoch_micros(int64_t micros) {
    return SystemTimePoint(std::chrono::duration_cast<SystemTimePoint::duration>(
        std::chrono::microseconds(micros)));
}

int64_t utc_day_number(SystemTimePoint t) {
    return floor_div(to_epoch_micros(t), k_micros_per_day);
}

double days_between(SystemTimePoint a, SystemTimePoint b) {
    return static_cast<double>(to_epoch_micros(b) - to_epoch_micros(a)) /
           static_cast<double>(k_micros_per_day);
}

SystemTimePoint make_utc_time(int year, unsigned month, unsigned day,
                              unsigned hour, unsigned minute, unsigned second) {
    int64_t days = days_from_civil(year, month, day);
    int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second;
    return from_epoch_micros(secs * 1000000LL);
}

std::string format_iso8601(SystemTimePoint t) {
    int64_t micros = to_epoch_micros(t);
    int64_t days = floor_div(micros, k_micros_per_day);
    int64_t rem = micros - days * k_micros_per_day;

    int y;
    unsigned m, d;
    civil_from_days(days, y, m, d);

    int64_t secs = rem / 1000000;
    int64_t frac = rem % 1000000;

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%06dZ",
                  y, m, d,
                  static_cast<int>(secs / 3600),
                  static_cast<int>((secs / 60) % 60),
                  static_cast<int>(secs % 60),
                  static_cast<int>(frac));
    return buf;
}

} // namespace Databrain
