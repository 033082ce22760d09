//! # unijson Demo
//!
//! Encodes a validated record holding a timestamp, prints the tagged JSON,
//! and decodes it back through the default codec context.
//!
//! ```bash
//! unijson_demo            # quiet
//! unijson_demo -vv        # debug logging for every channel
//! unijson_demo --log-filter=codec=trace
//! ```

#include "unijson.hpp"

#include <iostream>

using namespace unijson;

namespace {

auto order_class() -> ClassRef {
    FieldConstraints positive;
    positive.gt = 0;
    return ClassBuilder("Order", "shop")
        .kind(ClassKind::Model)
        .field("item", FieldType::string())
        .field("quantity", FieldType::integer(), positive)
        .field("placed", FieldType::instance_of(datetime_class()))
        .build();
}

} // namespace

int main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    auto& context = CodecContext::default_context();
    auto order_cls = order_class();
    context.add_class(order_cls);

    auto order = Model::validate(
        order_cls, Value(Map{{"item", Value("lamp")},
                             {"quantity", Value(3)},
                             {"placed", Value(make_rc<DateTime>(2024, 1, 15, 14, 30, 45, 0))}}));
    if (is_err(order)) {
        std::cerr << unwrap_err(order).to_string() << "\n";
        return 1;
    }

    DumpOptions pretty;
    pretty.indent = 2;
    auto text = dumps(Value(unwrap(order)), pretty);
    if (is_err(text)) {
        std::cerr << unwrap_err(text).to_string() << "\n";
        return 1;
    }
    std::cout << unwrap(text) << "\n";

    auto decoded = loads(std::string_view(unwrap(text)));
    if (is_err(decoded)) {
        std::cerr << unwrap_err(decoded).to_string() << "\n";
        return 1;
    }
    std::cout << unwrap(decoded).repr() << "\n";
    return 0;
}
