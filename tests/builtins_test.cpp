//! # Built-in Codec Tests
//!
//! Wire shapes and round trips of the calendar codecs: date, time,
//! datetime, timedelta and ZoneInfo.

#include "codec/api.hpp"
#include "codec/builtin_codecs.hpp"
#include "runtime/calendar.hpp"

#include <gtest/gtest.h>

using namespace unijson;

class BuiltinCodecsTest : public ::testing::Test {
protected:
    CodecContext context;

    void SetUp() override {
        context.set_registry(make_rc<DefaultClassRegistry>());
        auto registered = register_builtin_codecs(context);
        ASSERT_TRUE(is_ok(registered)) << unwrap_err(registered);
    }

    auto dump(const Value& value) -> std::string {
        auto text = dumps(value, {}, context);
        EXPECT_TRUE(is_ok(text)) << (is_err(text) ? unwrap_err(text).to_string() : "");
        return is_ok(text) ? unwrap(text) : std::string();
    }

    auto load(std::string_view text) -> Value {
        auto value = loads(text, {}, context);
        EXPECT_TRUE(is_ok(value)) << (is_err(value) ? unwrap_err(value).to_string() : "");
        return is_ok(value) ? unwrap(value) : Value();
    }
};

TEST_F(BuiltinCodecsTest, RegistersCalendarCodecs) {
    EXPECT_TRUE(context.has_encoder(date_class()));
    EXPECT_TRUE(context.has_encoder(zoneinfo_class()));
    EXPECT_TRUE(context.has_decoder(datetime_class()));
    EXPECT_FALSE(context.has_decoder(timedelta_class()));
    EXPECT_EQ(context.encoders().find_exact(*date_class())->name, "json_encode_date");
    EXPECT_EQ(context.type_modules().find("datetime", "timedelta"), timedelta_class());
}

TEST_F(BuiltinCodecsTest, DateWireShape) {
    Value date(make_rc<Date>(2024, 1, 15));
    EXPECT_EQ(dump(date), R"({"date":"2024-01-15","__class__":"date","__module__":"datetime"})");
    EXPECT_EQ(load(dump(date)), date);
}

TEST_F(BuiltinCodecsTest, NaiveDateTimeKeepsMicroseconds) {
    Value stamp(make_rc<DateTime>(2024, 1, 15, 14, 30, 45, 123456));
    EXPECT_EQ(dump(stamp),
              R"({"datetime":"2024-01-15 14:30:45.123456","tzinfo":null,)"
              R"("__class__":"datetime","__module__":"datetime"})");

    Value decoded = load(dump(stamp));
    ASSERT_NE(decoded.as<DateTime>(), nullptr);
    EXPECT_EQ(decoded.as<DateTime>()->time().microsecond(), 123456u);
    EXPECT_EQ(decoded, stamp);
}

TEST_F(BuiltinCodecsTest, AwareDateTimeRoundTrips) {
    auto utc = unwrap(TimeZone::create("UTC"));
    Value stamp(make_rc<DateTime>(2024, 6, 1, 8, 0, 0, 0, utc));
    EXPECT_NE(dump(stamp).find(R"("tzinfo":"UTC")"), std::string::npos);

    Value decoded = load(dump(stamp));
    ASSERT_NE(decoded.as<DateTime>(), nullptr);
    ASSERT_NE(decoded.as<DateTime>()->tz(), nullptr);
    EXPECT_EQ(decoded.as<DateTime>()->tz()->name(), "UTC");
    EXPECT_EQ(decoded, stamp);
}

TEST_F(BuiltinCodecsTest, RegionalZoneRoundTrips) {
    if (!TimeZone::is_known("Europe/Paris")) {
        GTEST_SKIP() << "zoneinfo database not installed";
    }
    auto paris = unwrap(TimeZone::create("Europe/Paris"));
    Value stamp(make_rc<DateTime>(2024, 1, 15, 14, 30, 45, 123456, paris));
    EXPECT_EQ(load(dump(stamp)), stamp);
}

TEST_F(BuiltinCodecsTest, UnknownZoneDecodesNaive) {
    Value decoded = load(R"({"datetime": "2024-01-15 10:00:00", "tzinfo": "Mars/Base",)"
                         R"( "__class__": "datetime", "__module__": "datetime"})");
    ASSERT_NE(decoded.as<DateTime>(), nullptr);
    EXPECT_EQ(decoded.as<DateTime>()->tz(), nullptr);
}

TEST_F(BuiltinCodecsTest, TimeCarriesNestedZone) {
    auto utc = unwrap(TimeZone::create("UTC"));
    Value time(make_rc<Time>(14, 30, 45, 0, utc));
    EXPECT_EQ(dump(time),
              R"({"time":"14:30:45.000000","tzinfo":{"zone":"UTC","__class__":"ZoneInfo",)"
              R"("__module__":"zoneinfo"},"__class__":"time","__module__":"datetime"})");
    EXPECT_EQ(load(dump(time)), time);
}

TEST_F(BuiltinCodecsTest, TimedeltaAsSeconds) {
    Value span(make_rc<Duration>(std::chrono::minutes(90)));
    EXPECT_EQ(dump(span), R"({"seconds":5400.0,"__class__":"timedelta","__module__":"datetime"})");
    EXPECT_EQ(load(dump(span)), span);
}

TEST_F(BuiltinCodecsTest, OversizedTimedeltaIsNotWrapped) {
    auto direct = Duration::from_kwargs(Map{{"seconds", Value(1e300)}});
    ASSERT_TRUE(is_err(direct));
    EXPECT_EQ(unwrap_err(direct), "timedelta value out of range");

    Value decoded = load(R"({"seconds": 1e300, "__class__": "timedelta", "__module__": "datetime"})");
    EXPECT_EQ(decoded.as<Duration>(), nullptr);
    ASSERT_TRUE(decoded.is_map());
    EXPECT_EQ(*decoded.get("seconds"), Value(1e300));
    EXPECT_EQ(decoded.get("__class__"), nullptr);
}

TEST_F(BuiltinCodecsTest, ZoneInfoStandsAlone) {
    Value zone(unwrap(TimeZone::create("UTC")));
    EXPECT_EQ(dump(zone), R"({"zone":"UTC","__class__":"ZoneInfo","__module__":"zoneinfo"})");
    EXPECT_EQ(load(dump(zone)), zone);
}

TEST_F(BuiltinCodecsTest, BadDateTextFailsDecoding) {
    auto result =
        loads(R"({"date": "2024-13-01", "__class__": "date", "__module__": "datetime"})", {}, context);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, CodecErrorKind::DecodeFunctionFailed);
    EXPECT_NE(unwrap_err(result).message.find("json_decode_date"), std::string::npos);
}

TEST_F(BuiltinCodecsTest, EncoderRejectsForeignObjects) {
    auto other = make_rc<DynamicObject>(ClassBuilder("Fake", "x").build());
    auto result = json_encode_date(*other);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), "expected a date, got x.Fake");
}
