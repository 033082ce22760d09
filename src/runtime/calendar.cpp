//! # Calendar Types Implementation
//!
//! Parsing and formatting of the wire strings, and the calendar classes.

#include "runtime/calendar.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <limits>

namespace unijson {

namespace {

/// Reads exactly `width` digits at `pos`.
auto read_digits(std::string_view text, size_t pos, size_t width) -> std::optional<unsigned> {
    if (pos + width > text.size()) {
        return std::nullopt;
    }
    unsigned out = 0;
    auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + width, out);
    if (ec != std::errc{} || ptr != text.data() + pos + width) {
        return std::nullopt;
    }
    return out;
}

struct ClockFields {
    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
    unsigned microsecond = 0;
};

/// Parses `HH:MM:SS[.f{1,6}]` spanning all of `text`.
auto parse_clock(std::string_view text) -> std::optional<ClockFields> {
    ClockFields f;
    auto h = read_digits(text, 0, 2);
    auto m = read_digits(text, 3, 2);
    auto s = read_digits(text, 6, 2);
    if (!h || !m || !s || text[2] != ':' || text[5] != ':') {
        return std::nullopt;
    }
    f.hour = *h;
    f.minute = *m;
    f.second = *s;

    if (text.size() > 8) {
        size_t digits = text.size() - 9;
        if (text[8] != '.' || digits == 0 || digits > 6) {
            return std::nullopt;
        }
        auto frac = read_digits(text, 9, digits);
        if (!frac) {
            return std::nullopt;
        }
        f.microsecond = *frac;
        for (size_t i = digits; i < 6; ++i) {
            f.microsecond *= 10;
        }
    }

    if (f.hour > 23 || f.minute > 59 || f.second > 59) {
        return std::nullopt;
    }
    return f;
}

auto parse_ymd(std::string_view text) -> std::optional<std::chrono::year_month_day> {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    auto y = read_digits(text, 0, 4);
    auto m = read_digits(text, 5, 2);
    auto d = read_digits(text, 8, 2);
    if (!y || !m || !d) {
        return std::nullopt;
    }
    std::chrono::year_month_day ymd{std::chrono::year(static_cast<int>(*y)), std::chrono::month(*m),
                                    std::chrono::day(*d)};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return ymd;
}

auto same_zone(const Rc<TimeZone>& a, const Rc<TimeZone>& b) -> bool {
    if (!a || !b) {
        return !a && !b;
    }
    return a->name() == b->name();
}

auto number_kwarg(const Map& kwargs, const char* key, double& out) -> Result<bool, std::string> {
    auto it = kwargs.find(key);
    if (it == kwargs.end() || it->second.is_null()) {
        return true;
    }
    if (!it->second.is_number()) {
        return std::string("unsupported type for timedelta ") + key +
               " component: " + it->second.type_name();
    }
    out = it->second.as_float();
    return true;
}

} // anonymous namespace

// ============================================================================
// Classes
// ============================================================================

auto date_class() -> const ClassRef& {
    static const ClassRef cls = ClassBuilder("date", "datetime").build();
    return cls;
}

auto time_class() -> const ClassRef& {
    static const ClassRef cls = ClassBuilder("time", "datetime").build();
    return cls;
}

auto datetime_class() -> const ClassRef& {
    static const ClassRef cls = ClassBuilder("datetime", "datetime").base(date_class()).build();
    return cls;
}

auto timedelta_class() -> const ClassRef& {
    static const ClassRef cls =
        ClassBuilder("timedelta", "datetime")
            .constructor([](const ClassRef&, const Map& kwargs) -> Result<ObjectRef, std::string> {
                auto d = Duration::from_kwargs(kwargs);
                if (is_err(d)) {
                    return unwrap_err(d);
                }
                return ObjectRef(unwrap(d));
            })
            .build();
    return cls;
}

auto zoneinfo_class() -> const ClassRef& {
    static const ClassRef cls =
        ClassBuilder("ZoneInfo", "zoneinfo")
            .constructor([](const ClassRef&, const Map& kwargs) -> Result<ObjectRef, std::string> {
                auto it = kwargs.find("zone");
                if (it == kwargs.end()) {
                    it = kwargs.find("key");
                }
                if (it == kwargs.end() || !it->second.is_string()) {
                    return std::string("ZoneInfo() missing required argument 'key'");
                }
                auto tz = TimeZone::create(it->second.as_string());
                if (is_err(tz)) {
                    return unwrap_err(tz);
                }
                return ObjectRef(unwrap(tz));
            })
            .build();
    return cls;
}

// ============================================================================
// TimeZone
// ============================================================================

auto TimeZone::is_known(std::string_view name) -> bool {
    if (name == "UTC") {
        return true;
    }
    if (name.empty() || name.front() == '/' || name.find("..") != std::string_view::npos) {
        return false;
    }
    const char* env = std::getenv("TZDIR");
    std::filesystem::path root = (env && *env) ? env : "/usr/share/zoneinfo";
    std::error_code ec;
    return std::filesystem::is_regular_file(root / std::string(name), ec);
}

auto TimeZone::create(std::string_view name) -> Result<Rc<TimeZone>, std::string> {
    if (!is_known(name)) {
        return "No time zone found with key " + std::string(name);
    }
    return make_rc<TimeZone>(std::string(name));
}

auto TimeZone::equals(const Object& other) const -> bool {
    auto* rhs = dynamic_cast<const TimeZone*>(&other);
    return rhs && rhs->name_ == name_;
}

auto TimeZone::repr() const -> std::string {
    return "zoneinfo.ZoneInfo(key='" + name_ + "')";
}

// ============================================================================
// Date
// ============================================================================

Date::Date(int year, unsigned month, unsigned day)
    : ymd_(std::chrono::year(year), std::chrono::month(month), std::chrono::day(day)) {}

auto Date::parse(std::string_view text) -> Result<Rc<Date>, std::string> {
    auto ymd = parse_ymd(text);
    if (!ymd) {
        return "Invalid isoformat string: '" + std::string(text) + "'";
    }
    return make_rc<Date>(*ymd);
}

auto Date::iso() const -> std::string {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year(), month(), day());
    return buf;
}

auto Date::equals(const Object& other) const -> bool {
    auto* rhs = dynamic_cast<const Date*>(&other);
    return rhs && rhs->ymd_ == ymd_;
}

auto Date::repr() const -> std::string {
    return "date(" + iso() + ")";
}

// ============================================================================
// Time
// ============================================================================

Time::Time(unsigned hour, unsigned minute, unsigned second, unsigned microsecond, Rc<TimeZone> tz)
    : hour_(hour), minute_(minute), second_(second), microsecond_(microsecond), tz_(std::move(tz)) {}

auto Time::parse(std::string_view text, Rc<TimeZone> tz) -> Result<Rc<Time>, std::string> {
    auto f = parse_clock(text);
    if (!f) {
        return "Invalid isoformat string: '" + std::string(text) + "'";
    }
    return make_rc<Time>(f->hour, f->minute, f->second, f->microsecond, std::move(tz));
}

auto Time::iso() const -> std::string {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%02u:%02u:%02u.%06u", hour_, minute_, second_, microsecond_);
    return buf;
}

auto Time::equals(const Object& other) const -> bool {
    auto* rhs = dynamic_cast<const Time*>(&other);
    return rhs && rhs->hour_ == hour_ && rhs->minute_ == minute_ && rhs->second_ == second_ &&
           rhs->microsecond_ == microsecond_ && same_zone(rhs->tz_, tz_);
}

auto Time::repr() const -> std::string {
    return "time(" + iso() + (tz_ ? ", tz=" + tz_->name() : "") + ")";
}

// ============================================================================
// DateTime
// ============================================================================

DateTime::DateTime(int year, unsigned month, unsigned day, unsigned hour, unsigned minute,
                   unsigned second, unsigned microsecond, Rc<TimeZone> tz)
    : date_(year, month, day), time_(hour, minute, second, microsecond, std::move(tz)) {}

auto DateTime::parse(std::string_view text, Rc<TimeZone> tz) -> Result<Rc<DateTime>, std::string> {
    auto invalid = [&]() { return "Invalid isoformat string: '" + std::string(text) + "'"; };
    if (text.size() < 19 || (text[10] != ' ' && text[10] != 'T')) {
        return invalid();
    }
    auto ymd = parse_ymd(text.substr(0, 10));
    auto clock = parse_clock(text.substr(11));
    if (!ymd || !clock) {
        return invalid();
    }
    return make_rc<DateTime>(static_cast<int>(ymd->year()), static_cast<unsigned>(ymd->month()),
                             static_cast<unsigned>(ymd->day()), clock->hour, clock->minute,
                             clock->second, clock->microsecond, std::move(tz));
}

auto DateTime::iso() const -> std::string {
    return date_.iso() + " " + time_.iso();
}

auto DateTime::equals(const Object& other) const -> bool {
    auto* rhs = dynamic_cast<const DateTime*>(&other);
    return rhs && rhs->date_.equals(date_) && rhs->time_.equals(time_);
}

auto DateTime::repr() const -> std::string {
    return "datetime(" + iso() + (tz() ? ", tz=" + tz()->name() : "") + ")";
}

// ============================================================================
// Duration
// ============================================================================

auto Duration::from_kwargs(const Map& kwargs) -> Result<Rc<Duration>, std::string> {
    static constexpr std::pair<const char*, double> units[] = {
        {"weeks", 604800e6}, {"days", 86400e6},     {"hours", 3600e6},     {"minutes", 60e6},
        {"seconds", 1e6},    {"milliseconds", 1e3}, {"microseconds", 1.0},
    };

    double total = 0.0;
    for (const auto& [key, scale] : units) {
        double amount = 0.0;
        auto r = number_kwarg(kwargs, key, amount);
        if (is_err(r)) {
            return unwrap_err(r);
        }
        total += amount * scale;
    }
    if (!std::isfinite(total)) {
        return std::string("timedelta components must be finite");
    }
    // 2^63 microseconds; llround is unspecified beyond int64
    if (std::fabs(total) >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return std::string("timedelta value out of range");
    }
    return make_rc<Duration>(std::chrono::microseconds(static_cast<int64_t>(std::llround(total))));
}

auto Duration::equals(const Object& other) const -> bool {
    auto* rhs = dynamic_cast<const Duration*>(&other);
    return rhs && rhs->value_ == value_;
}

auto Duration::repr() const -> std::string {
    return "timedelta(seconds=" + Value(total_seconds()).repr() + ")";
}

} // namespace unijson
