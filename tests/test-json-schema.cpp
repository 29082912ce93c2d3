#include <gtest/gtest.h>
#include "../validation.h"
#include <qb/json.h>
#include <algorithm>
#include <regex>

using namespace qb::validation;
namespace js = qb::validation::jsonschema;

class JsonSchemaTest : public ::testing::Test {
protected:
    static qb::json schema_of(const char *text) {
        return qb::json::parse(text);
    }

    static bool has_error(const Result &result, const std::string &path, const std::string &code) {
        for (const auto &error : result.errors()) {
            if (error.field_path == path && error.rule_violated == code) return true;
        }
        return false;
    }

    static const js::DslRecord *record_at(const std::vector<js::DslRecord> &records, const std::string &path) {
        for (const auto &record : records) {
            if (record.path == path) return &record;
        }
        return nullptr;
    }
};

// --- conversion entry points ---

TEST_F(JsonSchemaTest, AllOfOnRootValue) {
    auto validator = js::from_json_schema(schema_of(R"({
        "allOf": [{"type": "string"}, {"minLength": 5}]
    })"));
    EXPECT_TRUE(validator.validate("hello").success());

    Result too_short = validator.validate("hi");
    ASSERT_FALSE(too_short.success());
    EXPECT_EQ(too_short.errors()[0].rule_violated, "allOf");
    EXPECT_EQ(too_short.errors()[0].message, "String too short. Minimum length is 5.");

    Result wrong_type = validator.validate(42);
    ASSERT_FALSE(wrong_type.success());
    EXPECT_EQ(wrong_type.errors()[0].message, "Invalid type. Expected string.");
}

TEST_F(JsonSchemaTest, RejectsSchemasThatAreNotObjects) {
    EXPECT_THROW(js::from_json_schema(qb::json(42)), js::SchemaError);
    EXPECT_THROW(js::from_json_schema(qb::json::array()), js::SchemaError);
    EXPECT_THROW(js::from_json_schema(schema_of(R"({"properties": {"a": 7}})")), js::SchemaError);
}

TEST_F(JsonSchemaTest, BooleanSchemas) {
    auto accept_all = js::from_json_schema(qb::json(true));
    EXPECT_EQ(accept_all.size(), 0u);
    EXPECT_TRUE(accept_all.validate({{"anything", 1}}).success());

    auto reject_all = js::from_json_schema(qb::json(false));
    EXPECT_FALSE(reject_all.validate(1).success());
    EXPECT_FALSE(reject_all.validate(qb::json::object()).success());

    auto never_b = js::from_json_schema(schema_of(R"({"properties": {"b": false}})"));
    EXPECT_TRUE(never_b.validate({{"a", 1}}).success());
    Result result = never_b.validate({{"b", 1}});
    ASSERT_EQ(result.errors().size(), 1u);
    EXPECT_EQ(result.errors()[0].field_path, "b");
    EXPECT_EQ(result.errors()[0].rule_violated, "not");
}

TEST_F(JsonSchemaTest, ReferenceErrorsSurfaceAtConstruction) {
    try {
        (void) js::from_json_schema(schema_of(R"({
            "properties": {"user": {"$ref": "http://example.com/user.json"}}
        })"));
        FAIL() << "external reference accepted";
    } catch (const js::ExternalRefError &e) {
        EXPECT_EQ(e.ref(), "http://example.com/user.json");
    }

    try {
        (void) js::from_json_schema(schema_of(R"({
            "properties": {"user": {"$ref": "#/definitions/missing"}}
        })"));
        FAIL() << "dangling reference accepted";
    } catch (const js::UnresolvedRefError &e) {
        EXPECT_EQ(e.ref(), "#/definitions/missing");
    }

    EXPECT_THROW(js::from_json_schema(schema_of(R"({
        "properties": {"code": {"type": "string", "pattern": "(["}}
    })")),
                 js::SchemaError);
}

TEST_F(JsonSchemaTest, DefinitionsReferencesAreFollowed) {
    auto validator = js::from_json_schema(schema_of(R"({
        "definitions": {
            "email": {"type": "string", "format": "email"},
            "a~b": {"type": "integer"}
        },
        "type": "object",
        "properties": {
            "contact": {"$ref": "#/definitions/email"},
            "weird": {"$ref": "#/definitions/a~0b"}
        },
        "required": ["contact"]
    })"));
    EXPECT_TRUE(validator.validate({{"contact", "a@b.io"}, {"weird", 3}}).success());

    Result result = validator.validate({{"contact", "nope"}, {"weird", 1.5}}, ValidationOptions::collect_all());
    EXPECT_TRUE(has_error(result, "contact", codes::FORMAT));
    EXPECT_TRUE(has_error(result, "weird", codes::INTEGER));
}

// --- object keywords ---

TEST_F(JsonSchemaTest, DependentRequired) {
    auto validator = js::from_json_schema(schema_of(R"({
        "type": "object",
        "properties": {
            "creditCard": {"type": "string"},
            "billingAddress": {"type": "string"}
        },
        "dependentRequired": {"creditCard": ["billingAddress"]}
    })"));

    EXPECT_TRUE(validator.validate(qb::json::object()).success());
    EXPECT_TRUE(validator.validate({{"creditCard", "4111"}, {"billingAddress", "1 Main St"}}).success());

    Result result = validator.validate({{"creditCard", "4111"}});
    ASSERT_EQ(result.errors().size(), 1u);
    EXPECT_EQ(result.errors()[0].field_path, "billingAddress");
    EXPECT_EQ(result.errors()[0].rule_violated, "dependentRequired");
    EXPECT_EQ(result.errors()[0].message, "Property 'billingAddress' is required when 'creditCard' is present.");
}

TEST_F(JsonSchemaTest, LegacyDependenciesKeyword) {
    auto validator = js::from_json_schema(schema_of(R"({
        "type": "object",
        "dependencies": {
            "name": ["email"],
            "discount": {"required": ["coupon"]}
        }
    })"));
    EXPECT_TRUE(validator.validate({{"name", "x"}, {"email", "x@y.io"}}).success());
    EXPECT_FALSE(validator.validate({{"name", "x"}}).success());

    Result result = validator.validate({{"discount", 10}});
    ASSERT_EQ(result.errors().size(), 1u);
    EXPECT_EQ(result.errors()[0].rule_violated, "dependentSchemas");
    EXPECT_TRUE(validator.validate({{"discount", 10}, {"coupon", "SAVE"}}).success());
}

TEST_F(JsonSchemaTest, StrictRequiredAcceptsNullAndEmpty) {
    const auto schema = schema_of(R"({
        "type": "object",
        "properties": {"name": {}},
        "required": ["name"]
    })");

    auto lenient = js::from_json_schema(schema);
    EXPECT_FALSE(lenient.validate({{"name", ""}}).success());
    EXPECT_FALSE(lenient.validate({{"name", nullptr}}).success());
    EXPECT_TRUE(lenient.validate({{"name", "x"}}).success());

    auto strict = js::from_json_schema(schema, js::Options().strict_required(true));
    EXPECT_TRUE(strict.validate({{"name", ""}}).success());
    EXPECT_TRUE(strict.validate({{"name", nullptr}}).success());

    Result missing = strict.validate(qb::json::object());
    ASSERT_EQ(missing.errors().size(), 1u);
    EXPECT_EQ(missing.errors()[0].field_path, "name");
    EXPECT_EQ(missing.errors()[0].rule_violated, codes::REQUIRED);
}

TEST_F(JsonSchemaTest, PropertyNamesWithPathSyntaxAreRejected) {
    EXPECT_THROW(js::to_dsl(schema_of(R"({"properties": {"a.b": {"type": "string"}}, "required": ["a.b"]})")),
                 js::SchemaError);
    EXPECT_THROW(js::from_json_schema(schema_of(R"({"properties": {"x[y]": {}}})")), js::SchemaError);
    EXPECT_THROW(js::from_json_schema(schema_of(R"({"required": ["list[0]"]})")), js::SchemaError);
    EXPECT_THROW(js::from_json_schema(schema_of(R"({"dependentRequired": {"a": ["b.c"]}})")), js::SchemaError);

    EXPECT_EQ(js::property_path("user", "first-name"), "user.first-name");
    EXPECT_EQ(js::property_path("", "id"), "id");
}

TEST_F(JsonSchemaTest, RequiredWithoutPropertiesEntry) {
    auto validator = js::from_json_schema(schema_of(R"({
        "type": "object",
        "properties": {"profile": {"type": "object", "required": ["id"]}}
    })"));
    EXPECT_TRUE(validator.validate(qb::json::object()).success());
    EXPECT_TRUE(validator.validate({{"profile", {{"id", 1}}}}).success());

    Result result = validator.validate({{"profile", qb::json::object()}});
    ASSERT_EQ(result.errors().size(), 1u);
    EXPECT_EQ(result.errors()[0].field_path, "profile.id");
    EXPECT_EQ(result.errors()[0].message, "Field is required.");
}

TEST_F(JsonSchemaTest, AdditionalPropertiesAndOverride) {
    const auto closed = schema_of(R"({
        "type": "object",
        "properties": {"a": {"type": "integer"}},
        "additionalProperties": false
    })");

    Result result = js::from_json_schema(closed).validate({{"a", 1}, {"b", 2}});
    ASSERT_EQ(result.errors().size(), 1u);
    EXPECT_EQ(result.errors()[0].rule_violated, codes::ADDITIONAL_PROPERTIES);
    EXPECT_EQ(result.errors()[0].message, "Additional property 'b' not allowed.");

    auto relaxed = js::from_json_schema(closed, js::Options().allow_additional_properties(true));
    EXPECT_TRUE(relaxed.validate({{"a", 1}, {"b", 2}}).success());

    const auto open = schema_of(R"({"type": "object", "properties": {"a": {}}})");
    EXPECT_TRUE(js::from_json_schema(open).validate({{"a", 1}, {"b", 2}}).success());
    auto tightened = js::from_json_schema(open, js::Options().allow_additional_properties(false));
    EXPECT_FALSE(tightened.validate({{"a", 1}, {"b", 2}}).success());
}

TEST_F(JsonSchemaTest, AdditionalPropertiesSchemaAndPatterns) {
    auto validator = js::from_json_schema(schema_of(R"({
        "type": "object",
        "properties": {"id": {"type": "integer"}},
        "patternProperties": {"^x-": {"type": "string"}},
        "additionalProperties": {"type": "number"},
        "propertyNames": {"maxLength": 8}
    })"));
    EXPECT_TRUE(validator.validate({{"id", 1}, {"x-note", "hi"}, {"score", 2.5}}).success());

    Result pattern = validator.validate({{"x-note", 3}});
    ASSERT_FALSE(pattern.success());
    EXPECT_EQ(pattern.errors()[0].rule_violated, "patternProperties");

    Result extra = validator.validate({{"score", "high"}});
    ASSERT_FALSE(extra.success());
    EXPECT_EQ(extra.errors()[0].rule_violated, codes::ADDITIONAL_PROPERTIES);
    EXPECT_EQ(extra.errors()[0].message, "score: Invalid type. Expected number.");

    Result name = validator.validate({{"averyverylongname", 1}});
    ASSERT_FALSE(name.success());
    EXPECT_EQ(name.errors()[0].rule_violated, "propertyNames");
}

TEST_F(JsonSchemaTest, PropertyPatternsCompileWithTheSchema) {
    EXPECT_THROW(js::from_json_schema(schema_of(R"({"patternProperties": {"([a-z": {"type": "string"}}})")),
                 js::SchemaError);
    EXPECT_THROW(js::from_json_schema(schema_of(R"({
        "patternProperties": {"[": {}},
        "additionalProperties": {"type": "number"}
    })")),
                 js::SchemaError);

    auto validator = js::from_json_schema(schema_of(R"({
        "patternProperties": {"^n_": {"type": "number"}, "^s_": {"type": "string"}},
        "additionalProperties": {"type": "boolean"}
    })"));
    for (int round = 0; round < 3; ++round) {
        EXPECT_TRUE(validator.validate({{"n_a", 1}, {"s_b", "x"}, {"flag", true}}).success());
    }
    Result mixed = validator.validate({{"n_a", "1"}, {"flag", 0}}, ValidationOptions::collect_all());
    EXPECT_TRUE(has_error(mixed, "", "patternProperties"));
    EXPECT_TRUE(has_error(mixed, "", codes::ADDITIONAL_PROPERTIES));
}

TEST_F(JsonSchemaTest, ReadOnlyHonorsContext) {
    auto validator = js::from_json_schema(schema_of(R"({
        "type": "object",
        "properties": {
            "id": {"type": "integer", "readOnly": true},
            "secret": {"type": "string", "writeOnly": true}
        }
    })"));
    qb::json data = {{"id", 5}, {"secret", "s3"}};

    EXPECT_TRUE(validator.validate(data).success());
    Result update = validator.validate(data, ValidationOptions().context({{"operation", "write"}, {"isUpdate", true}}));
    ASSERT_EQ(update.errors().size(), 1u);
    EXPECT_EQ(update.errors()[0].rule_violated, codes::READ_ONLY);
    EXPECT_EQ(update.errors()[0].message, "id is read-only and cannot be modified");

    Result read = validator.validate(data, ValidationOptions().context({{"operation", "read"}}));
    ASSERT_EQ(read.errors().size(), 1u);
    EXPECT_EQ(read.errors()[0].rule_violated, codes::WRITE_ONLY);
}

// --- scalar keywords ---

TEST_F(JsonSchemaTest, NumberBoundsAndExclusiveForms) {
    auto validator = js::from_json_schema(schema_of(R"({
        "type": "object",
        "properties": {
            "legacy": {"type": "number", "minimum": 0, "exclusiveMinimum": true},
            "modern": {"type": "number", "exclusiveMaximum": 10},
            "step": {"type": "number", "multipleOf": 0.5}
        }
    })"));
    EXPECT_TRUE(validator.validate({{"legacy", 0.1}, {"modern", 9.9}, {"step", 1.5}}).success());

    Result result = validator.validate({{"legacy", 0}, {"modern", 10}, {"step", 1.2}}, ValidationOptions::collect_all());
    EXPECT_TRUE(has_error(result, "legacy", codes::MINIMUM));
    EXPECT_TRUE(has_error(result, "modern", codes::MAXIMUM));
    EXPECT_TRUE(has_error(result, "step", codes::MULTIPLE_OF));
}

TEST_F(JsonSchemaTest, CountBoundsBeyondSizeRangeClamp) {
    auto long_text = js::from_json_schema(schema_of(R"({"type": "string", "maxLength": 1e300})"));
    EXPECT_TRUE(long_text.validate("abc").success());

    auto many_items = js::from_json_schema(schema_of(R"({"type": "array", "minItems": 1e300})"));
    Result short_array = many_items.validate(qb::json::array({1, 2}));
    ASSERT_EQ(short_array.errors().size(), 1u);
    EXPECT_EQ(short_array.errors()[0].rule_violated, codes::MIN_ITEMS);

    auto wide = js::from_json_schema(schema_of(R"({"type": "object", "maxProperties": 18446744073709551615})"));
    EXPECT_TRUE(wide.validate({{"a", 1}}).success());

    EXPECT_THROW(js::from_json_schema(schema_of(R"({"maxItems": -1})")), js::SchemaError);
}

TEST_F(JsonSchemaTest, TypeUnionsAndNullable) {
    auto validator = js::from_json_schema(schema_of(R"({
        "type": "object",
        "properties": {
            "nick": {"type": ["string", "null"], "minLength": 2},
            "id": {"type": ["string", "integer"]}
        }
    })"));
    EXPECT_TRUE(validator.validate({{"nick", nullptr}, {"id", 3}}).success());
    EXPECT_TRUE(validator.validate({{"nick", "bo"}, {"id", "abc"}}).success());

    Result result = validator.validate({{"nick", "b"}, {"id", true}}, ValidationOptions::collect_all());
    EXPECT_TRUE(has_error(result, "nick", codes::MIN_LENGTH));
    EXPECT_TRUE(has_error(result, "id", codes::TYPE));
}

TEST_F(JsonSchemaTest, EnumAndConst) {
    auto validator = js::from_json_schema(schema_of(R"({
        "type": "object",
        "properties": {
            "color": {"enum": ["red", "green", 3]},
            "version": {"const": 2}
        }
    })"));
    EXPECT_TRUE(validator.validate({{"color", 3}, {"version", 2}}).success());

    Result result = validator.validate({{"color", "blue"}, {"version", 1}}, ValidationOptions::collect_all());
    EXPECT_TRUE(has_error(result, "color", codes::ENUM));
    EXPECT_TRUE(has_error(result, "version", codes::CONST));
}

TEST_F(JsonSchemaTest, CustomFormats) {
    const auto schema = schema_of(R"({
        "type": "object",
        "properties": {"sku": {"type": "string", "format": "sku"}}
    })");

    // unknown formats are accepted
    EXPECT_TRUE(js::from_json_schema(schema).validate({{"sku", "whatever"}}).success());

    js::Options options;
    options.custom_format("sku", [](const std::string &value) {
        return std::regex_match(value, std::regex("^SKU-[0-9]+$"));
    });
    auto validator = js::from_json_schema(schema, options);
    EXPECT_TRUE(validator.validate({{"sku", "SKU-42"}}).success());

    Result result = validator.validate({{"sku", "42"}});
    ASSERT_EQ(result.errors().size(), 1u);
    EXPECT_EQ(result.errors()[0].rule_violated, codes::FORMAT);
}

TEST_F(JsonSchemaTest, ContentKeywords) {
    auto validator = js::from_json_schema(schema_of(R"({
        "type": "object",
        "properties": {
            "blob": {"type": "string", "contentEncoding": "base64"},
            "doc": {"type": "string", "contentMediaType": "application/json"}
        }
    })"));
    EXPECT_TRUE(validator.validate({{"blob", "aGVsbG8="}, {"doc", R"({"a": 1})"}}).success());

    Result result = validator.validate({{"blob", "not base64!"}, {"doc", "{oops"}}, ValidationOptions::collect_all());
    EXPECT_TRUE(has_error(result, "blob", codes::CONTENT_ENCODING));
    EXPECT_TRUE(has_error(result, "doc", codes::CONTENT_MEDIA_TYPE));
}

// --- arrays ---

TEST_F(JsonSchemaTest, ItemsSchemaFansOutPerElement) {
    auto validator = js::from_json_schema(schema_of(R"({
        "type": "object",
        "properties": {
            "tags": {
                "type": "array",
                "items": {"type": "string", "minLength": 2},
                "uniqueItems": true,
                "maxItems": 4,
                "contains": {"const": "core"}
            }
        }
    })"));
    EXPECT_TRUE(validator.validate({{"tags", {"core", "io"}}}).success());

    Result result = validator.validate({{"tags", {"core", "x", 3}}}, ValidationOptions::collect_all());
    EXPECT_TRUE(has_error(result, "tags[1]", codes::MIN_LENGTH));
    EXPECT_TRUE(has_error(result, "tags[2]", codes::TYPE));

    EXPECT_TRUE(has_error(validator.validate({{"tags", {"io", "io"}}}), "tags", codes::UNIQUE_ITEMS));
    EXPECT_TRUE(has_error(validator.validate({{"tags", {"io", "db"}}}), "tags", codes::CONTAINS));
}

TEST_F(JsonSchemaTest, TupleItemsAndAdditionalItems) {
    auto closed = js::from_json_schema(schema_of(R"({
        "type": "array",
        "items": [{"type": "string"}, {"type": "number"}],
        "additionalItems": false
    })"));
    EXPECT_TRUE(closed.validate({"a", 1}).success());
    EXPECT_TRUE(closed.validate(qb::json::array({"a"})).success());

    Result position = closed.validate({"a", "b"});
    ASSERT_EQ(position.errors().size(), 1u);
    EXPECT_EQ(position.errors()[0].rule_violated, "items");
    EXPECT_EQ(position.errors()[0].message, "[1]: Invalid type. Expected number.");

    Result extra = closed.validate({"a", 1, true});
    ASSERT_EQ(extra.errors().size(), 1u);
    EXPECT_EQ(extra.errors()[0].rule_violated, "additionalItems");

    auto typed_rest = js::from_json_schema(schema_of(R"({
        "type": "array",
        "items": [{"type": "string"}],
        "additionalItems": {"type": "boolean"}
    })"));
    EXPECT_TRUE(typed_rest.validate({"a", true, false}).success());
    EXPECT_FALSE(typed_rest.validate({"a", true, "x"}).success());

    auto nested = js::from_json_schema(schema_of(R"({
        "properties": {"point": {"items": [{"type": "number"}, {"type": "number"}]}}
    })"));
    EXPECT_TRUE(nested.validate({{"point", {1}}}).success());
    Result point = nested.validate({{"point", {1, "y"}}});
    ASSERT_EQ(point.errors().size(), 1u);
    EXPECT_EQ(point.errors()[0].field_path, "point");
    EXPECT_EQ(point.errors()[0].message, "point[1]: Invalid type. Expected number.");
}

// --- compositions ---

TEST_F(JsonSchemaTest, AnyOfOneOfNot) {
    auto any = js::from_json_schema(schema_of(R"({"anyOf": [{"type": "string"}, {"type": "number"}]})"));
    EXPECT_TRUE(any.validate("x").success());
    EXPECT_TRUE(any.validate(1).success());
    EXPECT_FALSE(any.validate(true).success());

    auto one = js::from_json_schema(schema_of(R"({"oneOf": [{"type": "integer"}, {"minimum": 2}]})"));
    EXPECT_TRUE(one.validate(1).success());
    EXPECT_TRUE(one.validate(2.5).success());
    Result both = one.validate(3);
    ASSERT_EQ(both.errors().size(), 1u);
    EXPECT_EQ(both.errors()[0].rule_violated, "oneOf");
    EXPECT_EQ(both.errors()[0].message,
              "Value must validate against exactly one of the specified schemas (matched 2).");
    EXPECT_NE(one.validate(1.5).errors()[0].message.find("matched 0"), std::string::npos);

    auto negated = js::from_json_schema(schema_of(R"({"not": {"type": "string"}})"));
    EXPECT_TRUE(negated.validate(1).success());
    Result result = negated.validate("x");
    ASSERT_EQ(result.errors().size(), 1u);
    EXPECT_EQ(result.errors()[0].rule_violated, "not");
}

TEST_F(JsonSchemaTest, IfThenElse) {
    auto validator = js::from_json_schema(schema_of(R"({
        "type": "object",
        "properties": {"country": {"type": "string"}, "postal": {"type": "string"}},
        "if": {"properties": {"country": {"const": "US"}}, "required": ["country"]},
        "then": {"properties": {"postal": {"pattern": "^[0-9]{5}$"}}},
        "else": {"properties": {"postal": {"pattern": "^[A-Z][0-9][A-Z] [0-9][A-Z][0-9]$"}}}
    })"));

    EXPECT_TRUE(validator.validate({{"country", "US"}, {"postal", "12345"}}).success());
    EXPECT_TRUE(validator.validate({{"country", "CA"}, {"postal", "K1A 0B1"}}).success());

    Result us = validator.validate({{"country", "US"}, {"postal", "K1A 0B1"}});
    ASSERT_EQ(us.errors().size(), 1u);
    EXPECT_EQ(us.errors()[0].rule_violated, "conditional");
    EXPECT_EQ(us.errors()[0].message, "postal: String does not match pattern: ^[0-9]{5}$");

    EXPECT_FALSE(validator.validate({{"country", "CA"}, {"postal", "12345"}}).success());
}

// --- recursion ---

TEST_F(JsonSchemaTest, RootReferenceBecomesRecursion) {
    const auto schema = schema_of(R"({
        "type": "object",
        "properties": {
            "name": {"type": "string"},
            "children": {"type": "array", "items": {"$ref": "#"}},
            "parent": {"$ref": "#"}
        },
        "required": ["name"]
    })");
    auto validator = js::from_json_schema(schema);

    qb::json tree = qb::json::parse(R"({
        "name": "root",
        "children": [
            {"name": "a", "children": [{"name": "b", "children": [{"name": "c"}]}]},
            {"name": "d"}
        ]
    })");
    EXPECT_TRUE(validator.validate(tree).success());

    tree["children"][0]["children"][0]["children"][0]["name"] = 5;
    Result deep = validator.validate(tree);
    ASSERT_EQ(deep.errors().size(), 1u);
    EXPECT_EQ(deep.errors()[0].field_path, "children[0].children[0].children[0].name");
    EXPECT_EQ(deep.errors()[0].rule_violated, codes::TYPE);

    Result parent = validator.validate({{"name", "leaf"}, {"parent", qb::json::object()}});
    ASSERT_EQ(parent.errors().size(), 1u);
    EXPECT_EQ(parent.errors()[0].field_path, "parent.name");
    EXPECT_EQ(parent.errors()[0].rule_violated, codes::REQUIRED);

    // the recursion cap bounds the walk
    auto shallow = js::from_json_schema(schema, js::Options().max_recursion_depth(1));
    tree["children"][0]["children"][0]["name"] = 7;
    EXPECT_TRUE(shallow.validate(tree).success());
}

TEST_F(JsonSchemaTest, RootReferenceEnforcesRootTypeOnNestedValues) {
    auto validator = js::from_json_schema(schema_of(R"({
        "type": "object",
        "properties": {
            "name": {"type": "string"},
            "child": {"$ref": "#"},
            "children": {"type": "array", "items": {"$ref": "#"}}
        }
    })"));

    Result scalar_child = validator.validate({{"name", "a"}, {"child", "oops"}});
    ASSERT_EQ(scalar_child.errors().size(), 1u);
    EXPECT_EQ(scalar_child.errors()[0].field_path, "child");
    EXPECT_EQ(scalar_child.errors()[0].rule_violated, codes::TYPE);
    EXPECT_EQ(scalar_child.errors()[0].message, "Invalid type. Expected object.");

    Result scalar_items = validator.validate(qb::json::parse(R"({"children": [1, "x", true]})"),
                                             ValidationOptions::collect_all());
    ASSERT_EQ(scalar_items.errors().size(), 3u);
    EXPECT_EQ(scalar_items.errors()[0].field_path, "children[0]");
    EXPECT_EQ(scalar_items.errors()[1].field_path, "children[1]");
    EXPECT_EQ(scalar_items.errors()[2].field_path, "children[2]");
}

TEST_F(JsonSchemaTest, ArrayRootReferenceChecksNestedElements) {
    auto validator = js::from_json_schema(schema_of(R"({"type": "array", "items": {"$ref": "#"}})"));
    EXPECT_TRUE(validator.validate(qb::json::parse("[[], [[]]]")).success());

    Result nested = validator.validate(qb::json::parse(R"([["x"]])"));
    ASSERT_EQ(nested.errors().size(), 1u);
    EXPECT_EQ(nested.errors()[0].field_path, "[0][0]");
    EXPECT_EQ(nested.errors()[0].message, "Invalid type. Expected array.");
}

TEST_F(JsonSchemaTest, NonRootCycleIsCheckedLazily) {
    auto validator = js::from_json_schema(schema_of(R"({
        "definitions": {
            "node": {
                "type": "object",
                "properties": {
                    "value": {"type": "number"},
                    "next": {"$ref": "#/definitions/node"}
                }
            }
        },
        "type": "object",
        "properties": {"head": {"$ref": "#/definitions/node"}}
    })"));

    EXPECT_TRUE(validator.validate(qb::json::parse(R"({
        "head": {"value": 1, "next": {"value": 2, "next": {"value": 3}}}
    })")).success());

    Result result = validator.validate(qb::json::parse(R"({
        "head": {"value": 1, "next": {"value": 2, "next": {"value": "three"}}}
    })"));
    ASSERT_EQ(result.errors().size(), 1u);
    EXPECT_EQ(result.errors()[0].field_path, "head.next");
    EXPECT_EQ(result.errors()[0].rule_violated, "$ref");
    EXPECT_EQ(result.errors()[0].message, "head.next.next.value: Invalid type. Expected number.");
}

// --- DSL records ---

TEST_F(JsonSchemaTest, DslRecordsDescribeTheSchema) {
    auto records = js::to_dsl(schema_of(R"({
        "type": "object",
        "properties": {
            "age": {"type": "integer", "minimum": 0, "maximum": 150, "exclusiveMaximum": true},
            "nick": {"type": ["string", "null"]},
            "tags": {"type": "array", "items": {"type": "string"}},
            "status": {"enum": ["on", "off", 1]}
        },
        "required": ["age"]
    })"));

    const auto *root = record_at(records, "");
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->type, js::DslType::Object);
    const auto &names = root->constraints.at("properties");
    ASSERT_EQ(names.size(), 4u);
    EXPECT_NE(std::find(names.begin(), names.end(), "nick"), names.end());

    const auto *age = record_at(records, "age");
    ASSERT_NE(age, nullptr);
    qb::json age_json = js::to_json(*age);
    EXPECT_EQ(age_json["type"], "number");
    EXPECT_EQ(age_json["constraints"]["integer"], true);
    EXPECT_EQ(age_json["constraints"]["required"], true);
    EXPECT_EQ(age_json["constraints"]["minimum"], 0);
    EXPECT_EQ(age_json["constraints"]["exclusiveMaximum"], 150);
    EXPECT_FALSE(age_json["constraints"].contains("maximum"));

    const auto *nick = record_at(records, "nick");
    ASSERT_NE(nick, nullptr);
    EXPECT_TRUE(nick->nullable);
    EXPECT_EQ(nick->type, js::DslType::String);
    EXPECT_EQ(js::to_json(*nick)["nullable"], true);

    ASSERT_NE(record_at(records, "tags"), nullptr);
    const auto *tag = record_at(records, "tags[*]");
    ASSERT_NE(tag, nullptr);
    EXPECT_EQ(tag->type, js::DslType::String);

    const auto *status = record_at(records, "status");
    ASSERT_NE(status, nullptr);
    EXPECT_FALSE(status->explicit_type);
    EXPECT_EQ(js::to_json(*status)["multipleTypes"], qb::json({"string", "number"}));
}

TEST_F(JsonSchemaTest, DslRecordsUnderParentPath) {
    const auto schema = schema_of(R"({"properties": {"city": {"type": "string"}}})");
    auto records = js::to_dsl(schema, "address");
    ASSERT_NE(record_at(records, "address"), nullptr);
    ASSERT_NE(record_at(records, "address.city"), nullptr);

    auto definitions = js::to_field_definitions(records, schema);
    auto validator = ValidatorBuilder()
                         .field("name", [](FieldBuilder &f) { f.required(); })
                         .add(definitions)
                         .build();
    EXPECT_TRUE(validator.validate({{"name", "x"}, {"address", {{"city", "Paris"}}}}).success());
    Result result = validator.validate({{"name", "x"}, {"address", {{"city", 75}}}});
    ASSERT_EQ(result.errors().size(), 1u);
    EXPECT_EQ(result.errors()[0].field_path, "address.city");
}

TEST_F(JsonSchemaTest, RecursionMarkersInDsl) {
    auto records = js::to_dsl(schema_of(R"({
        "type": "object",
        "properties": {
            "children": {"type": "array", "items": {"$ref": "#"}},
            "parent": {"$ref": "#"}
        }
    })"));
    const auto *children = record_at(records, "children");
    ASSERT_NE(children, nullptr);
    EXPECT_EQ(js::to_json(*children)["recursion"], "element");
    EXPECT_EQ(record_at(records, "children[*]"), nullptr);

    const auto *parent = record_at(records, "parent");
    ASSERT_NE(parent, nullptr);
    EXPECT_EQ(js::to_json(*parent)["recursion"], "self");
}

// --- direct document validation ---

TEST_F(JsonSchemaTest, SchemaValidatorReportsEveryViolation) {
    js::SchemaValidator validator(schema_of(R"({
        "type": "object",
        "properties": {
            "name": {"type": "string", "minLength": 2},
            "tags": {"type": "array", "items": {"type": "string"}, "uniqueItems": true}
        },
        "required": ["name", "id"]
    })"));

    Result ok;
    EXPECT_TRUE(validator.validate({{"name", "Al"}, {"id", 1}, {"tags", {"a", "b"}}}, ok));
    EXPECT_TRUE(ok.success());

    Result result;
    EXPECT_FALSE(validator.validate({{"name", "A"}, {"tags", {"x", "x", 3}}}, result));
    EXPECT_TRUE(has_error(result, "id", codes::REQUIRED));
    EXPECT_TRUE(has_error(result, "name", codes::MIN_LENGTH));
    EXPECT_TRUE(has_error(result, "tags[2]", codes::TYPE));
    EXPECT_TRUE(has_error(result, "tags", codes::UNIQUE_ITEMS));

    EXPECT_TRUE(validator.is_valid("abc", schema_of(R"({"maxLength": 3})")));
    EXPECT_FALSE(validator.is_valid("abcd", schema_of(R"({"maxLength": 3})")));
}

TEST_F(JsonSchemaTest, RefResolverPointers) {
    const auto document = schema_of(R"({
        "definitions": {"a/b": {"type": "string"}, "list": [{"type": "number"}]}
    })");
    js::RefResolver resolver(document);
    EXPECT_EQ(resolver.resolve("#"), document);
    EXPECT_EQ(resolver.resolve("#/definitions/a~1b")["type"], "string");
    EXPECT_EQ(resolver.resolve("#/definitions/list/0")["type"], "number");
    EXPECT_EQ(resolver.resolve("#/definitions/a%7E1b")["type"], "string");
    EXPECT_THROW((void) resolver.resolve("other.json#/x"), js::ExternalRefError);
    EXPECT_THROW((void) resolver.resolve("#/definitions/none"), js::UnresolvedRefError);

    EXPECT_EQ(js::RefResolver::split_pointer("/a~0b/c~1d"), (std::vector<std::string>{"a~b", "c/d"}));
}
