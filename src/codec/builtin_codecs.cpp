#include "codec/builtin_codecs.hpp"

#include "log/log.hpp"
#include "runtime/calendar.hpp"

#include <optional>

namespace unijson {

namespace {

auto required_string(const Map& content, const char* key) -> std::optional<std::string> {
    auto it = content.find(key);
    if (it == content.end() || !it->second.is_string()) {
        return std::nullopt;
    }
    return it->second.as_string();
}

/// Reads a `tzinfo` entry: null, a decoded zone, or a zone name. Unknown
/// names give a naive result.
auto zone_from(const Map& content) -> Result<Rc<TimeZone>, std::string> {
    auto it = content.find("tzinfo");
    if (it == content.end() || it->second.is_null()) {
        return Rc<TimeZone>();
    }
    if (auto tz = it->second.as<TimeZone>()) {
        return tz;
    }
    if (!it->second.is_string()) {
        return "tzinfo must be a zone or a zone name, got " + it->second.type_name();
    }
    auto tz = TimeZone::create(it->second.as_string());
    if (is_err(tz)) {
        UNIJSON_LOG_DEBUG("decoder", unwrap_err(tz) << ", decoding as naive");
        return Rc<TimeZone>();
    }
    return unwrap(tz);
}

template <typename T>
auto expect(const Object& object, const char* type) -> Result<const T*, std::string> {
    auto* typed = dynamic_cast<const T*>(&object);
    if (!typed) {
        return "expected a " + std::string(type) + ", got " + object.klass()->qualified_name();
    }
    return typed;
}

} // anonymous namespace

// ============================================================================
// date
// ============================================================================

auto json_encode_date(const Object& object) -> Result<Map, std::string> {
    auto date = expect<Date>(object, "date");
    if (is_err(date)) {
        return unwrap_err(date);
    }
    return Map{{"date", Value(unwrap(date)->iso())}};
}

auto json_decode_date(const Map& content) -> Result<Value, std::string> {
    auto text = required_string(content, "date");
    if (!text) {
        return std::string("missing 'date' string");
    }
    auto date = Date::parse(*text);
    if (is_err(date)) {
        return unwrap_err(date);
    }
    return Value(unwrap(date));
}

// ============================================================================
// time
// ============================================================================

auto json_encode_time(const Object& object) -> Result<Map, std::string> {
    auto time = expect<Time>(object, "time");
    if (is_err(time)) {
        return unwrap_err(time);
    }
    const Time* t = unwrap(time);
    return Map{{"time", Value(t->iso())}, {"tzinfo", Value(t->tz())}};
}

auto json_decode_time(const Map& content) -> Result<Value, std::string> {
    auto text = required_string(content, "time");
    if (!text) {
        return std::string("missing 'time' string");
    }
    auto tz = zone_from(content);
    if (is_err(tz)) {
        return unwrap_err(tz);
    }
    auto time = Time::parse(*text, unwrap(tz));
    if (is_err(time)) {
        return unwrap_err(time);
    }
    return Value(unwrap(time));
}

// ============================================================================
// datetime
// ============================================================================

auto json_encode_datetime(const Object& object) -> Result<Map, std::string> {
    auto datetime = expect<DateTime>(object, "datetime");
    if (is_err(datetime)) {
        return unwrap_err(datetime);
    }
    const DateTime* dt = unwrap(datetime);
    return Map{
        {"datetime", Value(dt->iso())},
        {"tzinfo", dt->tz() ? Value(dt->tz()->name()) : Value()},
        {"__class__", Value("datetime")},
        {"__module__", Value("datetime")},
    };
}

auto json_decode_datetime(const Map& content) -> Result<Value, std::string> {
    auto text = required_string(content, "datetime");
    if (!text) {
        return std::string("missing 'datetime' string");
    }
    auto tz = zone_from(content);
    if (is_err(tz)) {
        return unwrap_err(tz);
    }
    auto datetime = DateTime::parse(*text, unwrap(tz));
    if (is_err(datetime)) {
        return unwrap_err(datetime);
    }
    return Value(unwrap(datetime));
}

// ============================================================================
// timedelta and ZoneInfo
// ============================================================================

auto json_encode_timedelta(const Object& object) -> Result<Map, std::string> {
    auto duration = expect<Duration>(object, "timedelta");
    if (is_err(duration)) {
        return unwrap_err(duration);
    }
    return Map{{"seconds", Value(unwrap(duration)->total_seconds())}};
}

auto json_encode_zoneinfo(const Object& object) -> Result<Map, std::string> {
    auto zone = expect<TimeZone>(object, "ZoneInfo");
    if (is_err(zone)) {
        return unwrap_err(zone);
    }
    return Map{
        {"zone", Value(unwrap(zone)->name())},
        {"__class__", Value("ZoneInfo")},
        {"__module__", Value("zoneinfo")},
    };
}

// ============================================================================
// Registration
// ============================================================================

auto register_builtin_codecs(CodecContext& context) -> Result<bool, std::string> {
    for (const auto& cls :
         {date_class(), time_class(), datetime_class(), timedelta_class(), zoneinfo_class()}) {
        context.add_class(cls);
    }

    struct EncoderSpec {
        const ClassRef& cls;
        EncodeFn fn;
        const char* name;
    };
    struct DecoderSpec {
        const ClassRef& cls;
        DecodeFn fn;
        const char* name;
    };

    const EncoderSpec encoders[] = {
        {date_class(), json_encode_date, "json_encode_date"},
        {time_class(), json_encode_time, "json_encode_time"},
        {datetime_class(), json_encode_datetime, "json_encode_datetime"},
        {timedelta_class(), json_encode_timedelta, "json_encode_timedelta"},
        {zoneinfo_class(), json_encode_zoneinfo, "json_encode_zoneinfo"},
    };
    const DecoderSpec decoders[] = {
        {date_class(), json_decode_date, "json_decode_date"},
        {time_class(), json_decode_time, "json_decode_time"},
        {datetime_class(), json_decode_datetime, "json_decode_datetime"},
    };

    for (const auto& spec : encoders) {
        CodecRegisterOptions options;
        options.name = spec.name;
        auto r = context.register_encoder(spec.cls, spec.fn, options);
        if (is_err(r)) {
            return unwrap_err(r);
        }
    }
    for (const auto& spec : decoders) {
        CodecRegisterOptions options;
        options.name = spec.name;
        auto r = context.register_decoder(spec.cls, spec.fn, options);
        if (is_err(r)) {
            return unwrap_err(r);
        }
    }
    return true;
}

} // namespace unijson
