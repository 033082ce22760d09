#include "codec/api.hpp"

#include "codec/decoder.hpp"
#include "codec/encoder.hpp"
#include "log/log.hpp"

#include <iterator>
#include <sstream>

namespace unijson {

namespace {

auto write_options(const DumpOptions& options) -> json::WriteOptions {
    json::WriteOptions out;
    out.indent = options.indent;
    out.sort_keys = options.sort_keys;
    out.ensure_ascii = options.ensure_ascii;
    return out;
}

} // anonymous namespace

auto dumps(const Value& value, const DumpOptions& options, const CodecContext& context)
    -> Result<std::string, CodecError> {
    Encoder encoder(context);
    auto encoded = encoder.encode(value);
    if (is_err(encoded)) {
        return unwrap_err(encoded);
    }
    return unwrap(encoded).to_string(write_options(options));
}

auto dump(const Value& value, std::ostream& os, const DumpOptions& options,
          const CodecContext& context) -> Result<size_t, CodecError> {
    Encoder encoder(context);
    auto encoded = encoder.encode(value);
    if (is_err(encoded)) {
        return unwrap_err(encoded);
    }
    size_t written = unwrap(encoded).write_to(os, write_options(options));
    if (!os) {
        return CodecError::make(CodecErrorKind::Io, "Failed to write JSON to stream");
    }
    return written;
}

auto loads(std::string_view text, const LoadOptions& options, CodecContext& context)
    -> Result<Value, CodecError> {
    json::ParseOptions parse_options;
    parse_options.max_depth = options.max_depth;
    auto parsed = json::parse_json(text, parse_options);
    if (is_err(parsed)) {
        return CodecError::make(CodecErrorKind::Syntax, unwrap_err(parsed).to_string());
    }
    Decoder decoder(context);
    return decoder.decode(unwrap(parsed));
}

auto loads(std::span<const uint8_t> bytes, const LoadOptions& options, CodecContext& context)
    -> Result<Value, CodecError> {
    if (bytes.size() >= 3 && bytes[0] == 0xEF && bytes[1] == 0xBB && bytes[2] == 0xBF) {
        bytes = bytes.subspan(3);
    }
    std::string_view text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return loads(text, options, context);
}

auto load(std::istream& is, const LoadOptions& options, CodecContext& context)
    -> Result<Value, CodecError> {
    std::string text((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    if (is.bad()) {
        return CodecError::make(CodecErrorKind::Io, "Failed to read JSON from stream");
    }
    return loads(std::string_view(text), options, context);
}

auto register_encoder(const ClassRef& cls, EncodeFn fn, CodecRegisterOptions options,
                      CodecContext& context) -> Result<bool, std::string> {
    return context.register_encoder(cls, std::move(fn), std::move(options));
}

auto register_decoder(const ClassRef& cls, DecodeFn fn, CodecRegisterOptions options,
                      CodecContext& context) -> Result<bool, std::string> {
    return context.register_decoder(cls, std::move(fn), std::move(options));
}

auto require_class(std::string_view name, const CodecContext& context)
    -> Result<ClassRef, CodecError> {
    auto found = context.registry()->get_required_class(name);
    if (is_err(found)) {
        return CodecError::from(unwrap_err(found));
    }
    return unwrap(found);
}

} // namespace unijson
