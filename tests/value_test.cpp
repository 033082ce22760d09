//! # Runtime Type Tests
//!
//! Tests for values, class descriptors, dynamic objects, enum members,
//! type modules and the calendar types.

#include "runtime/calendar.hpp"
#include "runtime/class.hpp"
#include "runtime/enum_value.hpp"
#include "runtime/object.hpp"
#include "runtime/type_modules.hpp"
#include "runtime/value.hpp"

#include <gtest/gtest.h>

using namespace unijson;

// ============================================================================
// Value
// ============================================================================

TEST(ValueTest, KindsAndAccessors) {
    EXPECT_TRUE(Value().is_null());
    EXPECT_TRUE(Value(true).as_bool());
    EXPECT_EQ(Value(42).as_int(), 42);
    EXPECT_DOUBLE_EQ(Value(42).as_float(), 42.0);
    EXPECT_TRUE(Value(1.5).is_float());
    EXPECT_EQ(Value("text").as_string(), "text");
    EXPECT_TRUE(Value(Array{}).is_array());
    EXPECT_TRUE(Value(Map{}).is_map());
    EXPECT_FALSE(Value(true).is_number());
}

TEST(ValueTest, CopyIsDeep) {
    Value original(Map{{"items", Value(Array{Value(1), Value(2)})}});
    Value copy = original;
    copy.as_map_mut()["items"].as_array_mut().push_back(Value(3));

    EXPECT_EQ(original.get("items")->size(), 2u);
    EXPECT_EQ(copy.get("items")->size(), 3u);
    EXPECT_NE(original, copy);
}

TEST(ValueTest, EqualityIsKindStrict) {
    EXPECT_EQ(Value(1), Value(int64_t{1}));
    EXPECT_NE(Value(1), Value(1.0));
    EXPECT_NE(Value(false), Value(0));
    EXPECT_EQ(Value(Map{{"a", Value(1)}, {"b", Value(2)}}),
              Value(Map{{"b", Value(2)}, {"a", Value(1)}}));
}

TEST(ValueTest, Repr) {
    Map m{{"name", Value("Alice")}, {"scores", Value(Array{Value(1), Value(2.0)})},
          {"x", Value()}};
    EXPECT_EQ(Value(std::move(m)).repr(), "{'name': 'Alice', 'scores': [1, 2.0], 'x': None}");
    EXPECT_EQ(Value(true).repr(), "True");
    EXPECT_EQ(Value(-10.0).repr(), "-10.0");
}

TEST(ValueTest, TypeNames) {
    EXPECT_EQ(Value().type_name(), "None");
    EXPECT_EQ(Value(1).type_name(), "int");
    EXPECT_EQ(Value("s").type_name(), "str");
    EXPECT_EQ(Value(Array{}).type_name(), "list");
    EXPECT_EQ(Value(Map{}).type_name(), "dict");
}

TEST(ValueTest, NullObjectBecomesNull) {
    Rc<DynamicObject> none;
    EXPECT_TRUE(Value(none).is_null());
}

// ============================================================================
// Classes
// ============================================================================

TEST(ClassTest, InheritanceAndQualifiedName) {
    auto animal = ClassBuilder("Animal", "zoo").dynamic_attributes().build();
    auto dog = ClassBuilder("Dog", "zoo").base(animal).build();
    auto puppy = ClassBuilder("Puppy", "zoo.young").base(dog).build();

    EXPECT_EQ(dog->qualified_name(), "zoo.Dog");
    EXPECT_TRUE(puppy->is_subclass_of(*animal));
    EXPECT_TRUE(dog->is_subclass_of(*dog));
    EXPECT_FALSE(animal->is_subclass_of(*dog));

    // Factories are inherited
    EXPECT_NE(puppy->constructor(), nullptr);
    EXPECT_NE(puppy->default_constructor(), nullptr);
}

TEST(ClassTest, SchemaMergesBaseFields) {
    auto pet = ClassBuilder("Pet", "zoo")
                   .kind(ClassKind::Model)
                   .field("name", FieldType::string())
                   .field("age", FieldType::integer())
                   .build();
    auto cat = ClassBuilder("Cat", "zoo")
                   .base(pet)
                   .field("indoor", FieldType::boolean())
                   .field("age", FieldType::number())
                   .build();

    EXPECT_TRUE(cat->is_model());
    auto schema = cat->schema();
    ASSERT_EQ(schema.size(), 3u);
    EXPECT_EQ(schema[0].name, "name");
    EXPECT_EQ(schema[1].name, "age");
    EXPECT_EQ(schema[1].type.kind(), FieldType::Kind::Number);
    EXPECT_EQ(schema[2].name, "indoor");
}

TEST(DynamicObjectTest, AttributesAndEquality) {
    auto cls = ClassBuilder("Point", "geo").dynamic_attributes().build();
    auto a = make_rc<DynamicObject>(cls, Map{{"x", Value(1)}, {"y", Value(2)}});
    auto b = make_rc<DynamicObject>(cls, Map{{"x", Value(1)}, {"y", Value(2)}});

    EXPECT_TRUE(a->equals(*b));
    EXPECT_EQ(Value(a), Value(b));
    EXPECT_EQ(a->repr(), "Point(x=1, y=2)");

    b->set("x", Value(5));
    EXPECT_FALSE(a->equals(*b));
    EXPECT_EQ(b->get("x")->as_int(), 5);
    EXPECT_EQ(b->get("z"), nullptr);
}

// ============================================================================
// Enums
// ============================================================================

class EnumTest : public ::testing::Test {
protected:
    ClassRef color = ClassBuilder("Color", "paint")
                         .kind(ClassKind::Enum)
                         .enum_member("RED", Value(1))
                         .enum_member("GREEN", Value(2))
                         .build();
};

TEST_F(EnumTest, MemberLookup) {
    auto red = EnumValue::member(color, "RED");
    ASSERT_TRUE(is_ok(red));
    EXPECT_EQ(unwrap(red)->value(), Value(1));
    EXPECT_EQ(unwrap(red)->repr(), "<Color.RED: 1>");

    auto attrs = unwrap(red)->attributes();
    EXPECT_EQ(attrs.at("_name_"), Value("RED"));
    EXPECT_EQ(attrs.at("_value_"), Value(1));
}

TEST_F(EnumTest, UnknownMemberFails) {
    auto purple = EnumValue::member(color, "PURPLE");
    ASSERT_TRUE(is_err(purple));
    EXPECT_EQ(unwrap_err(purple), "'PURPLE' is not a valid Color member");
}

TEST_F(EnumTest, FromValueAndEquality) {
    auto green = EnumValue::from_value(color, Value(2));
    ASSERT_TRUE(is_ok(green));
    EXPECT_EQ(unwrap(green)->name(), "GREEN");
    EXPECT_TRUE(unwrap(green)->equals(*unwrap(EnumValue::member(color, "GREEN"))));
    EXPECT_TRUE(is_err(EnumValue::from_value(color, Value(9))));
}

TEST_F(EnumTest, MembersAreImmutable) {
    auto red = unwrap(EnumValue::member(color, "RED"));
    EXPECT_TRUE(is_err(red->replace_attributes(Map{})));
}

// ============================================================================
// Type Modules
// ============================================================================

TEST(TypeModulesTest, AddFindRemove) {
    TypeModules modules;
    auto a = ClassBuilder("A", "pkg.mod").build();
    auto b = ClassBuilder("B", "pkg.mod").build();
    modules.add(a);
    modules.add(b);
    modules.add("alias", "Renamed", a);

    EXPECT_TRUE(modules.has_module("pkg.mod"));
    EXPECT_EQ(modules.find("pkg.mod", "A"), a);
    EXPECT_EQ(modules.find("alias", "Renamed"), a);
    EXPECT_EQ(modules.find("pkg.mod", "Missing"), nullptr);
    EXPECT_EQ(modules.find("other", "A"), nullptr);
    EXPECT_EQ(modules.classes("pkg.mod").size(), 2u);

    EXPECT_TRUE(modules.remove_module("pkg.mod"));
    EXPECT_FALSE(modules.remove_module("pkg.mod"));
    EXPECT_EQ(modules.module_names().size(), 1u);
}

// ============================================================================
// Calendar Types
// ============================================================================

TEST(CalendarTest, DateParseAndFormat) {
    auto date = Date::parse("2024-01-15");
    ASSERT_TRUE(is_ok(date));
    EXPECT_EQ(unwrap(date)->iso(), "2024-01-15");
    EXPECT_EQ(unwrap(date)->klass(), date_class());

    EXPECT_TRUE(is_err(Date::parse("2024-02-30")));
    EXPECT_TRUE(is_err(Date::parse("15/01/2024")));
}

TEST(CalendarTest, TimeKeepsMicroseconds) {
    auto time = Time::parse("14:30:45.5");
    ASSERT_TRUE(is_ok(time));
    EXPECT_EQ(unwrap(time)->microsecond(), 500000u);
    EXPECT_EQ(unwrap(time)->iso(), "14:30:45.500000");
    EXPECT_TRUE(is_err(Time::parse("25:00:00")));
}

TEST(CalendarTest, DateTimeParseAcceptsBothSeparators) {
    auto spaced = DateTime::parse("2024-01-15 14:30:45.123456");
    auto iso = DateTime::parse("2024-01-15T14:30:45.123456");
    ASSERT_TRUE(is_ok(spaced));
    ASSERT_TRUE(is_ok(iso));
    EXPECT_TRUE(unwrap(spaced)->equals(*unwrap(iso)));
    EXPECT_EQ(unwrap(spaced)->iso(), "2024-01-15 14:30:45.123456");
}

TEST(CalendarTest, DateTimeIsADate) {
    EXPECT_TRUE(datetime_class()->is_subclass_of(*date_class()));
}

TEST(CalendarTest, ZoneAffectsEquality) {
    auto utc = unwrap(TimeZone::create("UTC"));
    DateTime naive(2024, 1, 15, 12, 0);
    DateTime aware(2024, 1, 15, 12, 0, 0, 0, utc);
    EXPECT_FALSE(naive.equals(aware));
    EXPECT_TRUE(aware.equals(DateTime(2024, 1, 15, 12, 0, 0, 0, make_rc<TimeZone>("UTC"))));
}

TEST(CalendarTest, UnknownZoneIsRejected) {
    auto zone = TimeZone::create("Mars/Olympus_Mons");
    ASSERT_TRUE(is_err(zone));
    EXPECT_EQ(unwrap_err(zone), "No time zone found with key Mars/Olympus_Mons");
    EXPECT_FALSE(TimeZone::is_known("../etc/passwd"));
}

TEST(CalendarTest, DurationFromKeywords) {
    auto duration = Duration::from_kwargs(Map{{"hours", Value(1)}, {"minutes", Value(30)}});
    ASSERT_TRUE(is_ok(duration));
    EXPECT_DOUBLE_EQ(unwrap(duration)->total_seconds(), 5400.0);

    auto bad = Duration::from_kwargs(Map{{"seconds", Value("ten")}});
    EXPECT_TRUE(is_err(bad));
}

TEST(CalendarTest, ClassesUseWireNames) {
    EXPECT_EQ(datetime_class()->name(), "datetime");
    EXPECT_EQ(datetime_class()->module(), "datetime");
    EXPECT_EQ(timedelta_class()->name(), "timedelta");
    EXPECT_EQ(zoneinfo_class()->qualified_name(), "zoneinfo.ZoneInfo");
}
