//! # Structured Record Tests
//!
//! Strict validation, lax construction, instance re-validation and the
//! rendered `ValidationError` text.

#include "runtime/class.hpp"
#include "runtime/enum_value.hpp"
#include "runtime/model.hpp"

#include <cctype>
#include <gtest/gtest.h>

using namespace unijson;

namespace {

auto positive() -> FieldConstraints {
    FieldConstraints c;
    c.gt = 0;
    return c;
}

auto product_class() -> ClassRef {
    return ClassBuilder("Product", "shop")
        .kind(ClassKind::Model)
        .field("name", FieldType::string())
        .field("price", FieldType::number(), positive())
        .field_with_default("tags", FieldType::list_of(FieldType::string()), Value(Array{}))
        .build();
}

} // namespace

class ModelTest : public ::testing::Test {
protected:
    ClassRef product = product_class();
};

// ============================================================================
// Strict validation
// ============================================================================

TEST_F(ModelTest, ValidatesAndAppliesDefaults) {
    auto result = Model::validate(product, Value(Map{{"name", Value("Pen")}, {"price", Value(2)}}));
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();

    const auto& model = unwrap(result);
    EXPECT_EQ(*model->get("price"), Value(2.0));
    EXPECT_EQ(*model->get("tags"), Value(Array{}));
    EXPECT_EQ(model->repr(), "Product(name='Pen', price=2.0, tags=[])");
}

TEST_F(ModelTest, ConstraintFailureIsRendered) {
    auto result =
        Model::validate(product, Value(Map{{"name", Value("Pen")}, {"price", Value(-10.0)}}));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).to_string(),
              "1 validation error for Product\n"
              "price\n"
              "  Input should be greater than 0 [type=greater_than, input_value=-10.0]");
}

TEST_F(ModelTest, CollectsEveryIssue) {
    auto result = Model::validate(
        product, Value(Map{{"price", Value("cheap")}, {"tags", Value(Array{Value(1)})}}));
    ASSERT_TRUE(is_err(result));

    const auto& issues = unwrap_err(result).issues;
    ASSERT_EQ(issues.size(), 3u);
    EXPECT_EQ(issues[0].type, "missing");
    EXPECT_EQ(issues[1].type, "float_type");
    EXPECT_EQ(issues[2].type, "string_type");
    ASSERT_EQ(issues[2].loc.size(), 2u);
    EXPECT_EQ(issues[2].loc[1], "0");
    EXPECT_EQ(unwrap_err(result).to_string().substr(0, 31), "3 validation errors for Product");
}

TEST_F(ModelTest, NonMappingInputIsRejected) {
    auto result = Model::validate(product, Value(5));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).issues[0].msg,
              "Input should be a valid dictionary or instance of Product");
}

TEST_F(ModelTest, CustomCheckReportsValueError) {
    FieldConstraints upper;
    upper.check = [](const Value& v) -> std::optional<std::string> {
        if (v.as_string().empty() || !std::isupper(static_cast<unsigned char>(v.as_string()[0]))) {
            return std::string("must start with a capital letter");
        }
        return std::nullopt;
    };
    auto city = ClassBuilder("City", "geo")
                    .kind(ClassKind::Model)
                    .field("name", FieldType::string(), upper)
                    .build();

    EXPECT_TRUE(is_ok(Model::validate(city, Value(Map{{"name", Value("Paris")}}))));

    auto bad = Model::validate(city, Value(Map{{"name", Value("paris")}}));
    ASSERT_TRUE(is_err(bad));
    EXPECT_EQ(unwrap_err(bad).issues[0].msg, "Value error, must start with a capital letter");
    EXPECT_EQ(unwrap_err(bad).issues[0].type, "value_error");
}

TEST_F(ModelTest, NestedModelsAreBuiltFromMappings) {
    auto order = ClassBuilder("Order", "shop")
                     .kind(ClassKind::Model)
                     .field("item", FieldType::instance_of(product))
                     .field("quantity", FieldType::integer())
                     .build();

    auto ok = Model::validate(order, Value(Map{{"item", Value(Map{{"name", Value("Pen")},
                                                                  {"price", Value(1.5)}})},
                                               {"quantity", Value(3)}}));
    ASSERT_TRUE(is_ok(ok));
    auto item = unwrap(ok)->get("item")->as<Model>();
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(item->klass(), product);

    auto bad = Model::validate(order, Value(Map{{"item", Value(Map{{"name", Value("Pen")},
                                                                   {"price", Value(0)}})},
                                                {"quantity", Value(3)}}));
    ASSERT_TRUE(is_err(bad));
    const auto& loc = unwrap_err(bad).issues[0].loc;
    ASSERT_EQ(loc.size(), 2u);
    EXPECT_EQ(loc[0], "item");
    EXPECT_EQ(loc[1], "price");
}

TEST_F(ModelTest, EnumFieldsAcceptValues) {
    auto size = ClassBuilder("Size", "shop")
                    .kind(ClassKind::Enum)
                    .enum_member("SMALL", Value("s"))
                    .enum_member("LARGE", Value("l"))
                    .build();
    auto shirt = ClassBuilder("Shirt", "shop")
                     .kind(ClassKind::Model)
                     .field("size", FieldType::enum_of(size))
                     .build();

    auto ok = Model::validate(shirt, Value(Map{{"size", Value("l")}}));
    ASSERT_TRUE(is_ok(ok));
    EXPECT_EQ(unwrap(ok)->get("size")->as<EnumValue>()->name(), "LARGE");

    auto bad = Model::validate(shirt, Value(Map{{"size", Value("xl")}}));
    ASSERT_TRUE(is_err(bad));
    EXPECT_EQ(unwrap_err(bad).issues[0].msg, "Input should be 's' or 'l'");
}

TEST_F(ModelTest, PlainClassIsNotAModel) {
    auto plain = ClassBuilder("Plain", "shop").build();
    auto result = Model::validate(plain, Value(Map{}));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).issues[0].type, "model_class");
}

// ============================================================================
// Lax construction
// ============================================================================

TEST_F(ModelTest, ConstructCoercesWithoutChecking) {
    auto result = Model::construct(product, Map{{"name", Value("Pen")}, {"price", Value("2.5")}});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(*unwrap(result)->get("price"), Value(2.5));

    // Constraints are not checked by construct
    auto negative = Model::construct(product, Map{{"name", Value("Pen")}, {"price", Value(-1)}});
    ASSERT_TRUE(is_ok(negative));
    EXPECT_EQ(*unwrap(negative)->get("price"), Value(-1.0));
}

TEST_F(ModelTest, ValidateInstanceChecksExistingFields) {
    auto built = unwrap(Model::construct(product, Map{{"name", Value("Pen")}, {"price", Value(-1)}}));
    auto result = Model::validate_instance(*built);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).issues[0].type, "greater_than");

    built->set("price", Value(1.0));
    EXPECT_TRUE(is_ok(Model::validate_instance(*built)));
}

// ============================================================================
// Root models
// ============================================================================

TEST(RootModelTest, WrapsSingleValue) {
    FieldConstraints non_empty;
    non_empty.min_length = 1;
    auto names = ClassBuilder("Names", "shop")
                     .kind(ClassKind::RootModel)
                     .field("root", FieldType::list_of(FieldType::string()), non_empty)
                     .build();

    auto ok = Model::validate(names, Value(Array{Value("a"), Value("b")}));
    ASSERT_TRUE(is_ok(ok));
    EXPECT_EQ(unwrap(ok)->root().size(), 2u);

    auto empty = Model::validate(names, Value(Array{}));
    ASSERT_TRUE(is_err(empty));
    EXPECT_EQ(unwrap_err(empty).issues[0].type, "too_short");
}
