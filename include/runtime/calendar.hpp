//! # Calendar Types
//!
//! Date and time objects with built-in codecs. Their classes use the wire
//! names other encoders of this format use:
//!
//! | C++ type | `__class__` | `__module__` |
//! |----------|-------------|--------------|
//! | `Date` | `date` | `datetime` |
//! | `Time` | `time` | `datetime` |
//! | `DateTime` | `datetime` | `datetime` |
//! | `Duration` | `timedelta` | `datetime` |
//! | `TimeZone` | `ZoneInfo` | `zoneinfo` |
//!
//! Zones are identified by IANA name. A name is known if it is `UTC` or a
//! file of that name exists under `$TZDIR` or `/usr/share/zoneinfo`.

#pragma once

#include "common.hpp"
#include "runtime/class.hpp"
#include "runtime/object.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace unijson {

[[nodiscard]] auto date_class() -> const ClassRef&;
[[nodiscard]] auto time_class() -> const ClassRef&;
[[nodiscard]] auto datetime_class() -> const ClassRef&;
[[nodiscard]] auto timedelta_class() -> const ClassRef&;
[[nodiscard]] auto zoneinfo_class() -> const ClassRef&;

// ============================================================================
// TimeZone
// ============================================================================

class TimeZone : public Object {
public:
    explicit TimeZone(std::string name) : name_(std::move(name)) {}

    /// A zone for a known IANA name.
    static auto create(std::string_view name) -> Result<Rc<TimeZone>, std::string>;

    [[nodiscard]] static auto is_known(std::string_view name) -> bool;

    [[nodiscard]] auto name() const -> const std::string& {
        return name_;
    }

    [[nodiscard]] auto klass() const -> const ClassRef& override {
        return zoneinfo_class();
    }

    [[nodiscard]] auto equals(const Object& other) const -> bool override;
    [[nodiscard]] auto repr() const -> std::string override;

private:
    std::string name_;
};

// ============================================================================
// Date
// ============================================================================

class Date : public Object {
public:
    explicit Date(std::chrono::year_month_day ymd) : ymd_(ymd) {}
    Date(int year, unsigned month, unsigned day);

    /// Parses `YYYY-MM-DD`.
    static auto parse(std::string_view text) -> Result<Rc<Date>, std::string>;

    [[nodiscard]] auto year() const -> int {
        return static_cast<int>(ymd_.year());
    }
    [[nodiscard]] auto month() const -> unsigned {
        return static_cast<unsigned>(ymd_.month());
    }
    [[nodiscard]] auto day() const -> unsigned {
        return static_cast<unsigned>(ymd_.day());
    }

    /// `YYYY-MM-DD`
    [[nodiscard]] auto iso() const -> std::string;

    [[nodiscard]] auto klass() const -> const ClassRef& override {
        return date_class();
    }

    [[nodiscard]] auto equals(const Object& other) const -> bool override;
    [[nodiscard]] auto repr() const -> std::string override;

private:
    std::chrono::year_month_day ymd_;
};

// ============================================================================
// Time
// ============================================================================

class Time : public Object {
public:
    Time(unsigned hour, unsigned minute, unsigned second, unsigned microsecond = 0,
         Rc<TimeZone> tz = nullptr);

    /// Parses `HH:MM:SS` with an optional `.ffffff` fraction.
    static auto parse(std::string_view text, Rc<TimeZone> tz = nullptr)
        -> Result<Rc<Time>, std::string>;

    [[nodiscard]] auto hour() const -> unsigned {
        return hour_;
    }
    [[nodiscard]] auto minute() const -> unsigned {
        return minute_;
    }
    [[nodiscard]] auto second() const -> unsigned {
        return second_;
    }
    [[nodiscard]] auto microsecond() const -> unsigned {
        return microsecond_;
    }
    [[nodiscard]] auto tz() const -> const Rc<TimeZone>& {
        return tz_;
    }

    /// `HH:MM:SS.ffffff`
    [[nodiscard]] auto iso() const -> std::string;

    [[nodiscard]] auto klass() const -> const ClassRef& override {
        return time_class();
    }

    [[nodiscard]] auto equals(const Object& other) const -> bool override;
    [[nodiscard]] auto repr() const -> std::string override;

private:
    unsigned hour_;
    unsigned minute_;
    unsigned second_;
    unsigned microsecond_;
    Rc<TimeZone> tz_;
};

// ============================================================================
// DateTime
// ============================================================================

class DateTime : public Object {
public:
    DateTime(int year, unsigned month, unsigned day, unsigned hour = 0, unsigned minute = 0,
             unsigned second = 0, unsigned microsecond = 0, Rc<TimeZone> tz = nullptr);

    /// Parses `YYYY-MM-DD HH:MM:SS[.ffffff]`; a `T` separator is accepted too.
    static auto parse(std::string_view text, Rc<TimeZone> tz = nullptr)
        -> Result<Rc<DateTime>, std::string>;

    [[nodiscard]] auto date() const -> const Date& {
        return date_;
    }
    [[nodiscard]] auto time() const -> const Time& {
        return time_;
    }
    [[nodiscard]] auto tz() const -> const Rc<TimeZone>& {
        return time_.tz();
    }

    /// `YYYY-MM-DD HH:MM:SS.ffffff`
    [[nodiscard]] auto iso() const -> std::string;

    [[nodiscard]] auto klass() const -> const ClassRef& override {
        return datetime_class();
    }

    /// Same fields and same zone name; naive and aware values differ.
    [[nodiscard]] auto equals(const Object& other) const -> bool override;
    [[nodiscard]] auto repr() const -> std::string override;

private:
    Date date_;
    Time time_;
};

// ============================================================================
// Duration
// ============================================================================

class Duration : public Object {
public:
    explicit Duration(std::chrono::microseconds value) : value_(value) {}

    /// Builds a duration from `weeks`, `days`, `hours`, `minutes`,
    /// `seconds`, `milliseconds` and `microseconds` keywords, all optional.
    static auto from_kwargs(const Map& kwargs) -> Result<Rc<Duration>, std::string>;

    [[nodiscard]] auto value() const -> std::chrono::microseconds {
        return value_;
    }

    [[nodiscard]] auto total_seconds() const -> double {
        return static_cast<double>(value_.count()) / 1e6;
    }

    [[nodiscard]] auto klass() const -> const ClassRef& override {
        return timedelta_class();
    }

    [[nodiscard]] auto equals(const Object& other) const -> bool override;
    [[nodiscard]] auto repr() const -> std::string override;

private:
    std::chrono::microseconds value_;
};

} // namespace unijson
