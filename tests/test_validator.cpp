// ═══════════════════════════════════════════════════════════════════
//  test_validator.cpp - Tests for payload validation and schemas
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <bizgraph/validator.h>
#include <bizgraph/schemas.h>

using namespace bizgraph;
using namespace bizgraph::validator;

TEST(ValidatorTest, RequiredFieldMissing) {
    Schema s;
    s.field("source").required().isString();

    auto errors = s.validate(nlohmann::json::object());

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].field, "source");
    EXPECT_EQ(errors[0].rule, "required");
}

TEST(ValidatorTest, NullCountsAsMissing) {
    Schema s;
    s.field("source").required().isString();
    auto errors = s.validate(nlohmann::json{{"source", nullptr}});
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].rule, "required");
}

TEST(ValidatorTest, TypeValidation) {
    Schema s;
    s.field("transaction_volume").required().isNumber();

    auto errors = s.validate(nlohmann::json{{"transaction_volume", "lots"}});

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].rule, "type");
}

TEST(ValidatorTest, IntegerRejectsFraction) {
    Schema s;
    s.field("maxDepth").required().isInt();
    EXPECT_FALSE(s.isValid(nlohmann::json{{"maxDepth", 2.5}}));
    EXPECT_TRUE(s.isValid(nlohmann::json{{"maxDepth", 2}}));
}

TEST(ValidatorTest, StringLength) {
    Schema s;
    s.field("id").required().isString().minLength(1).maxLength(8);

    auto tooShort = s.validate(nlohmann::json{{"id", ""}});
    ASSERT_EQ(tooShort.size(), 1u);
    EXPECT_EQ(tooShort[0].rule, "minLength");

    auto tooLong = s.validate(nlohmann::json{{"id", "abcdefghij"}});
    ASSERT_EQ(tooLong.size(), 1u);
    EXPECT_EQ(tooLong[0].rule, "maxLength");
}

TEST(ValidatorTest, MinMaxNumberValidation) {
    Schema s;
    s.field("depth").required().isNumber().min(1).max(6);

    EXPECT_FALSE(s.isValid(nlohmann::json{{"depth", 0}}));
    EXPECT_FALSE(s.isValid(nlohmann::json{{"depth", 7}}));
    EXPECT_TRUE(s.isValid(nlohmann::json{{"depth", 3}}));
}

TEST(ValidatorTest, EnumValidation) {
    Schema s;
    s.field("relationship_type").required().isString().oneOf({"vendor", "client", "partner"});

    auto errors = s.validate(nlohmann::json{{"relationship_type", "supplier"}});
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].rule, "oneOf");
    EXPECT_TRUE(s.isValid(nlohmann::json{{"relationship_type", "vendor"}}));
}

TEST(ValidatorTest, OptionalFieldNotRequired) {
    Schema s;
    s.field("frequency").optional().isString().maxLength(50);
    EXPECT_TRUE(s.isValid(nlohmann::json::object()));
}

TEST(ValidatorTest, MultipleFieldErrors) {
    Schema s;
    s.field("source").required().isString();
    s.field("target").required().isString();
    EXPECT_EQ(s.validate(nlohmann::json::object()).size(), 2u);
}

TEST(ValidatorTest, NonObjectDocument) {
    Schema s;
    s.field("source").required();
    auto errors = s.validate(nlohmann::json::array());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].rule, "type");
    EXPECT_TRUE(errors[0].field.empty());
}

TEST(ValidatorTest, CustomValidator) {
    Schema s;
    s.field("frequency").required().isString().custom(
        [](const nlohmann::json& val) -> std::optional<std::string> {
            auto str = val.get<std::string>();
            if (str != "daily" && str != "weekly" && str != "monthly") return "unknown frequency " + str;
            return std::nullopt;
        });

    auto errors = s.validate(nlohmann::json{{"frequency", "hourly"}});
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].rule, "custom");
    EXPECT_TRUE(s.isValid(nlohmann::json{{"frequency", "weekly"}}));
}

TEST(ValidatorTest, EnforceThrowsInvalidArgument) {
    Schema s;
    s.field("source").required().isString();
    s.field("target").required().isString();
    try {
        s.enforce(nlohmann::json::object(), "relationship");
        FAIL() << "expected InvalidArgument";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
        std::string msg = e.what();
        EXPECT_NE(msg.find("source is required"), std::string::npos);
        EXPECT_NE(msg.find("target is required"), std::string::npos);
    }
}

TEST(ValidatorTest, ErrorsToJson) {
    std::vector<ValidationError> errors{{"id", "id is required", "required"}};
    auto j = toJson(errors);
    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j[0]["field"], "id");
    EXPECT_EQ(j[0]["rule"], "required");
}

// ── record schemas ──

TEST(SchemasTest, RelationshipRecord) {
    auto rules = schemas::relationship();
    nlohmann::json good = {{"source", "A"}, {"target", "B"}, {"relationship_type", "client"},
                           {"transaction_volume", 250.75}, {"frequency", "weekly"},
                           {"created_at", "2024-03-01T08:00:00Z"}};
    EXPECT_TRUE(rules.isValid(good));

    auto negative = good;
    negative["transaction_volume"] = -1;
    EXPECT_FALSE(rules.isValid(negative));

    auto badTime = good;
    badTime["created_at"] = "March 1st";
    auto errors = rules.validate(badTime);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].field, "created_at");
    EXPECT_EQ(errors[0].rule, "custom");
}

TEST(SchemasTest, BusinessRecord) {
    auto rules = schemas::business();
    EXPECT_TRUE(rules.isValid(nlohmann::json{{"id", "acme"}, {"name", "Acme"}}));
    EXPECT_FALSE(rules.isValid(nlohmann::json{{"id", ""}}));
    EXPECT_FALSE(rules.isValid(nlohmann::json{{"name", "no id"}}));
}

TEST(SchemasTest, RelationshipChangeEnvelope) {
    auto rules = schemas::relationshipChange();
    EXPECT_TRUE(rules.isValid(nlohmann::json{{"entity", "edge"}, {"kind", "deleted"},
                                             {"source", "A"}, {"target", "B"},
                                             {"relationship_type", "vendor"}}));
    EXPECT_FALSE(rules.isValid(nlohmann::json{{"entity", "graph"}, {"kind", "deleted"}}));
    EXPECT_FALSE(rules.isValid(nlohmann::json{{"entity", "node"}, {"kind", "renamed"}}));
}
