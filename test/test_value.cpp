// test_value.cpp - Tests for the Value model
// Module 1: Value construction, variant queries, builders, equality

#include <catch2/catch_all.hpp>
#include <faunadb/builders.h>
#include <faunadb/value.h>

#include <cstdint>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

using namespace faunadb;

// ============================================================
// Construction
// ============================================================

TEST_CASE("Value construction selects the matching variant", "[value][construction]") {
    SECTION("default is Null") {
        Value v;
        REQUIRE(v.is_null());
        REQUIRE(v.type() == ValueType::Null);
        REQUIRE(Value{nullptr}.is_null());
    }

    SECTION("strings") {
        REQUIRE(Value{"Bob"}.type() == ValueType::String);
        REQUIRE(Value{std::string{"Bob"}}.type() == ValueType::String);
        REQUIRE(Value{std::string_view{"Bob"}}.type() == ValueType::String);
        REQUIRE(*Value{"Bob"}.get_if<std::string>() == "Bob");
    }

    SECTION("integers widen to Long") {
        REQUIRE(Value{30}.type() == ValueType::Long);
        REQUIRE(Value{std::int8_t{-3}}.type() == ValueType::Long);
        REQUIRE(*Value{-42}.get_if<std::int64_t>() == -42);
    }

    SECTION("unsigned integers that fit widen to Long") {
        REQUIRE(Value{42u} == Value{42});
        REQUIRE(Value{std::uint8_t{200}}.type() == ValueType::Long);
        REQUIRE(*Value{std::uint8_t{200}}.get_if<std::int64_t>() == 200);
        REQUIRE(*Value{std::uint32_t{4294967295u}}.get_if<std::int64_t>() == 4294967295);
    }

    SECTION("64-bit unsigned and character types do not convert") {
        STATIC_REQUIRE(std::is_constructible_v<Value, unsigned>);
        STATIC_REQUIRE(std::is_constructible_v<Value, std::int64_t>);
        STATIC_REQUIRE_FALSE(std::is_constructible_v<Value, std::uint64_t>);
        STATIC_REQUIRE_FALSE(std::is_constructible_v<Value, std::size_t>);
        STATIC_REQUIRE_FALSE(std::is_constructible_v<Value, char>);
        STATIC_REQUIRE_FALSE(std::is_constructible_v<Value, char32_t>);
        STATIC_REQUIRE_FALSE(std::is_constructible_v<Value, wchar_t>);
    }

    SECTION("double and bool") {
        REQUIRE(Value{1.5}.type() == ValueType::Double);
        REQUIRE(Value{true}.type() == ValueType::Boolean);
        REQUIRE(*Value{false}.get_if<bool>() == false);
    }

    SECTION("temporal") {
        auto d = Value::date(2020, 6, 15);
        REQUIRE(d.type() == ValueType::Date);
        REQUIRE(d.get_if<Date>()->ymd == std::chrono::year_month_day{
            std::chrono::year{2020}, std::chrono::June, std::chrono::day{15}});

        auto t = Value::time(TimePoint{std::chrono::nanoseconds{1}});
        REQUIRE(t.type() == ValueType::Time);
    }

    SECTION("database types") {
        auto r = Value::ref("classes/spells/181388642046968320");
        REQUIRE(r.type() == ValueType::Ref);
        REQUIRE(r.get_if<Ref>()->id == "classes/spells/181388642046968320");

        auto s = Value::set_ref({{"match", Value::ref("indexes/spells_by_element")}, {"terms", "fire"}});
        REQUIRE(s.type() == ValueType::SetRef);
        REQUIRE(s.get_if<SetRef>()->parameters.size() == 2);
    }

    SECTION("containers") {
        auto obj = Value::object({{"name", "Bob"}, {"age", 30}});
        REQUIRE(obj.type() == ValueType::Object);
        REQUIRE(obj.is_container());
        REQUIRE(obj.size() == 2);

        auto arr = Value::array({"a", Value{}});
        REQUIRE(arr.type() == ValueType::Array);
        REQUIRE(arr.is_container());
        REQUIRE(arr.size() == 2);
    }

    SECTION("leaves report size 0") {
        REQUIRE(Value{"abc"}.size() == 0);
        REQUIRE(Value{}.size() == 0);
        REQUIRE_FALSE(Value{"abc"}.is_container());
    }
}

// ============================================================
// Equality
// ============================================================

TEST_CASE("Value equality is structural", "[value][equality]") {
    SECTION("same variant, same payload") {
        REQUIRE(Value{30} == Value{30});
        REQUIRE(Value{"a"} == Value{"a"});
        REQUIRE(Value::date(2020, 1, 1) == Value::date(2020, 1, 1));
        REQUIRE(Value{} == Value{nullptr});
    }

    SECTION("Long and Double are different variants") {
        REQUIRE_FALSE(Value{30} == Value{30.0});
    }

    SECTION("objects compare by entries, independent of insertion order") {
        auto a = Value::object({{"name", "Bob"}, {"age", 30}});
        auto b = Value::object({{"age", 30}, {"name", "Bob"}});
        REQUIRE(a == b);
        REQUIRE_FALSE(a == Value::object({{"name", "Bob"}}));
    }

    SECTION("arrays compare element-wise in order") {
        REQUIRE(Value::array({1, 2}) == Value::array({1, 2}));
        REQUIRE_FALSE(Value::array({1, 2}) == Value::array({2, 1}));
    }

    SECTION("set refs compare by parameters") {
        REQUIRE(Value::set_ref({{"match", "x"}}) == Value::set_ref({{"match", "x"}}));
        REQUIRE_FALSE(Value::set_ref({{"match", "x"}}) == Value::object({{"match", "x"}}));
    }
}

// ============================================================
// Builders
// ============================================================

TEST_CASE("ObjectBuilder and ArrayBuilder", "[value][builders]") {
    SECTION("ObjectBuilder collects entries") {
        ObjectBuilder builder;
        builder.set("name", "Fire").set("cost", 10);
        REQUIRE(builder.contains("name"));
        REQUIRE_FALSE(builder.contains("owner"));
        REQUIRE(builder.size() == 2);

        Value v = builder.finish();
        REQUIRE(v == Value::object({{"name", "Fire"}, {"cost", 10}}));
    }

    SECTION("repeated key replaces the earlier value") {
        Value v = ObjectBuilder().set("k", 1).set("k", 2).finish();
        REQUIRE(v == Value::object({{"k", 2}}));
    }

    SECTION("finish_set_ref produces a SetRef") {
        Value v = ObjectBuilder().set("match", "x").finish_set_ref();
        REQUIRE(v.type() == ValueType::SetRef);
    }

    SECTION("ArrayBuilder preserves order") {
        ArrayBuilder builder;
        for (int i = 0; i < 100; ++i) {
            builder.push_back(i);
        }
        REQUIRE(builder.size() == 100);

        Value v = builder.finish();
        const auto* vec = v.get_if<ValueVector>();
        REQUIRE(vec != nullptr);
        REQUIRE(vec->size() == 100);
        REQUIRE((*vec)[42].get() == Value{42});
    }

    SECTION("building from an existing map leaves the original intact") {
        auto original = Value::object({{"a", 1}});
        Value extended = ObjectBuilder(*original.get_if<ValueMap>()).set("b", 2).finish();
        REQUIRE(original.size() == 1);
        REQUIRE(extended.size() == 2);
    }
}

// ============================================================
// Display helpers
// ============================================================

TEST_CASE("type_name and value_to_string", "[value][display]") {
    SECTION("type names") {
        REQUIRE(type_name(ValueType::String) == "String");
        REQUIRE(type_name(ValueType::SetRef) == "SetRef");
        REQUIRE(type_name(Value{}) == "Null");
        REQUIRE(type_name(Value::array({})) == "Array");
    }

    SECTION("rendering") {
        REQUIRE(value_to_string(Value{"Bob"}) == "\"Bob\"");
        REQUIRE(value_to_string(Value{30}) == "30L");
        REQUIRE(value_to_string(Value{}) == "null");
        REQUIRE(value_to_string(Value::ref("classes/spells")) == "@ref(classes/spells)");
        REQUIRE(value_to_string(Value::date(2020, 6, 15)) == "@date(2020-06-15)");
        REQUIRE(value_to_string(Value::object({{"a", 1}, {"b", 2}})) == "{object:2}");
        REQUIRE(value_to_string(Value::array({1})) == "[array:1]");
    }
}

// ============================================================
// Sharing across threads
// ============================================================

TEST_CASE("Value trees can be read concurrently", "[value][threads]") {
    ArrayBuilder builder;
    for (int i = 0; i < 1000; ++i) {
        builder.push_back(Value::object({{"id", i}}));
    }
    const Value shared = builder.finish();

    std::vector<std::int64_t> sums(4, 0);
    std::vector<std::thread> readers;
    for (std::size_t t = 0; t < sums.size(); ++t) {
        readers.emplace_back([&shared, &sums, t] {
            Value local = shared;  // copies share structure
            for (const auto& box : *local.get_if<ValueVector>()) {
                const auto& entries = *box.get().get_if<ValueMap>();
                sums[t] += *entries.find("id")->get().get_if<std::int64_t>();
            }
        });
    }
    for (auto& r : readers) {
        r.join();
    }

    for (auto sum : sums) {
        REQUIRE(sum == 999 * 1000 / 2);
    }
}

// ============================================================
// Error taxonomy
// ============================================================

TEST_CASE("Error codes belong to one category", "[value][errors]") {
    REQUIRE(error_category(ErrorCode::Success) == ErrorCategory::None);
    REQUIRE(error_category(ErrorCode::InvalidTagPayload) == ErrorCategory::WireFormat);
    REQUIRE(error_category(ErrorCode::NotTraversable) == ErrorCategory::Traversal);
    REQUIRE(error_category(ErrorCode::PrecisionLoss) == ErrorCategory::Decode);
    REQUIRE(error_category(ErrorCode::UnknownStatus) == ErrorCategory::Transport);

    REQUIRE(error_code_name(ErrorCode::KeyNotFound) == "KeyNotFound");
    REQUIRE(error_category_name(ErrorCategory::WireFormat) == "WireFormatError");

    SECTION("Status") {
        REQUIRE(Status::ok());
        REQUIRE_NOTHROW(Status::ok().check());

        Status failed = Status::failure(ErrorCode::TypeMismatch, "cannot decode Array into string");
        REQUIRE_FALSE(failed);
        REQUIRE(failed.category() == ErrorCategory::Decode);
        REQUIRE_THROWS_WITH(failed.check(), "cannot decode Array into string");
    }

    SECTION("Error carries its code") {
        Error e(ErrorCode::OutOfRange, "too big");
        REQUIRE(e.code() == ErrorCode::OutOfRange);
        REQUIRE(e.category() == ErrorCategory::Decode);
    }
}
