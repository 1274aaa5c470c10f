#include <gtest/gtest.h>
#include "tpsdk/entity_model.hpp"

using namespace tpsdk;

class EntityModelTest : public ::testing::Test {
protected:
    const EntityModel& model = EntityModel::instance();

    std::vector<DomainIssue> domain(EntityKind kind, const char* json) {
        return model.check_type_domain(kind, Document::parse(json));
    }
};

TEST_F(EntityModelTest, FindRule) {
    const AttributeRule* rule = model.find_rule(EntityKind::ACTION, "prefix");
    ASSERT_NE(rule, nullptr);
    EXPECT_TRUE(rule->required);
    EXPECT_EQ(rule->types, VT_STRING);

    EXPECT_EQ(model.find_rule(EntityKind::ACTION, "valueStateId"), nullptr);
    EXPECT_NE(model.find_rule(EntityKind::EVENT, "valueStateId"), nullptr);
}

TEST_F(EntityModelTest, ListAttributesNameTheirChildKind) {
    const AttributeRule* categories = model.find_rule(EntityKind::ROOT, "categories");
    ASSERT_NE(categories, nullptr);
    ASSERT_TRUE(categories->child.has_value());
    EXPECT_EQ(*categories->child, EntityKind::CATEGORY);

    const AttributeRule* data = model.find_rule(EntityKind::CONNECTOR, "data");
    ASSERT_NE(data, nullptr);
    ASSERT_TRUE(data->child.has_value());
    EXPECT_EQ(*data->child, EntityKind::ACTION_DATA);

    EXPECT_FALSE(model.find_rule(EntityKind::ACTION, "name")->child.has_value());
}

TEST_F(EntityModelTest, AttributeVersionGating) {
    const AttributeRule* rule = nullptr;

    EXPECT_EQ(model.check_attribute(EntityKind::CATEGORY, "connectors", 3, &rule), RuleStatus::TOO_NEW);
    ASSERT_NE(rule, nullptr);
    EXPECT_EQ(rule->min_sdk, 4);

    EXPECT_EQ(model.check_attribute(EntityKind::CATEGORY, "connectors", 4), RuleStatus::ALLOWED);
    EXPECT_EQ(model.check_attribute(EntityKind::STATE, "parentGroup", 5), RuleStatus::TOO_NEW);
    EXPECT_EQ(model.check_attribute(EntityKind::STATE, "parentGroup", 6), RuleStatus::ALLOWED);
    EXPECT_EQ(model.check_attribute(EntityKind::ROOT, "settings", 2), RuleStatus::TOO_NEW);

    EXPECT_EQ(model.check_attribute(EntityKind::STATE, "colour", 6, &rule), RuleStatus::UNKNOWN);
    EXPECT_EQ(rule, nullptr);
}

TEST_F(EntityModelTest, ValueTypes) {
    const AttributeRule* version = model.find_rule(EntityKind::ROOT, "version");
    ASSERT_NE(version, nullptr);
    EXPECT_TRUE(model.check_value_type(*version, Document(3)));
    EXPECT_FALSE(model.check_value_type(*version, Document(3.5)));
    EXPECT_FALSE(model.check_value_type(*version, Document("3")));

    const AttributeRule* def = model.find_rule(EntityKind::ACTION_DATA, "default");
    ASSERT_NE(def, nullptr);
    EXPECT_TRUE(model.check_value_type(*def, Document("text")));
    EXPECT_TRUE(model.check_value_type(*def, Document(1)));
    EXPECT_TRUE(model.check_value_type(*def, Document(1.5)));
    EXPECT_TRUE(model.check_value_type(*def, Document(true)));
    EXPECT_FALSE(model.check_value_type(*def, Document::array()));
    EXPECT_FALSE(model.check_value_type(*def, Document(nullptr)));
}

TEST_F(EntityModelTest, Choices) {
    const AttributeRule* type = model.find_rule(EntityKind::ACTION, "type");
    ASSERT_NE(type, nullptr);
    EXPECT_TRUE(model.check_choice(*type, Document("execute")));
    EXPECT_FALSE(model.check_choice(*type, Document("launch")));

    const AttributeRule* name = model.find_rule(EntityKind::ACTION, "name");
    ASSERT_NE(name, nullptr);
    EXPECT_TRUE(model.check_choice(*name, Document("anything")));
}

TEST_F(EntityModelTest, NumberDomain) {
    EXPECT_TRUE(domain(EntityKind::ACTION_DATA, R"({"type":"number","default":5,"minValue":0,"maxValue":10})").empty());
    EXPECT_TRUE(domain(EntityKind::ACTION_DATA, R"({"type":"number","default":"7.5"})").empty());

    auto issues = domain(EntityKind::ACTION_DATA, R"({"type":"number","default":"abc"})");
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].attribute, "default");

    issues = domain(EntityKind::ACTION_DATA, R"({"type":"number","default":5,"minValue":10,"maxValue":1})");
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].attribute, "minValue");

    issues = domain(EntityKind::ACTION_DATA, R"({"type":"number","default":11,"minValue":0,"maxValue":10})");
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].attribute, "default");

    // Settings default to text, a number setting is checked the same way
    EXPECT_EQ(domain(EntityKind::SETTING, R"({"type":"number","default":"0","minValue":1})").size(), 1u);
    EXPECT_TRUE(domain(EntityKind::SETTING, R"({"default":"anything"})").empty());
}

TEST_F(EntityModelTest, ChoiceDomain) {
    EXPECT_TRUE(domain(EntityKind::ACTION_DATA, R"({"type":"choice","default":"b","valueChoices":["a","b"]})").empty());

    auto issues = domain(EntityKind::ACTION_DATA, R"({"type":"choice","default":"c","valueChoices":["a","b"]})");
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].attribute, "default");

    issues = domain(EntityKind::STATE, R"({"type":"choice","default":"a","valueChoices":[]})");
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].attribute, "valueChoices");

    // Events are not domain checked
    EXPECT_TRUE(domain(EntityKind::EVENT, R"({"type":"choice","valueChoices":[]})").empty());
}

TEST_F(EntityModelTest, ColorAndSwitchDomain) {
    EXPECT_TRUE(domain(EntityKind::ACTION_DATA, R"({"type":"color","default":"#FF00aa"})").empty());
    EXPECT_TRUE(domain(EntityKind::ACTION_DATA, R"({"type":"color","default":"#FF00AA80"})").empty());
    EXPECT_EQ(domain(EntityKind::ACTION_DATA, R"({"type":"color","default":"red"})").size(), 1u);
    EXPECT_EQ(domain(EntityKind::ACTION_DATA, R"({"type":"color","default":"#GG0000"})").size(), 1u);

    EXPECT_TRUE(domain(EntityKind::ACTION_DATA, R"({"type":"switch","default":true})").empty());
    EXPECT_EQ(domain(EntityKind::ACTION_DATA, R"({"type":"switch","default":"true"})").size(), 1u);
}

TEST_F(EntityModelTest, ColorFormat) {
    EXPECT_TRUE(EntityModel::is_valid_color("#000000"));
    EXPECT_TRUE(EntityModel::is_valid_color("#000000FF"));
    EXPECT_FALSE(EntityModel::is_valid_color("000000"));
    EXPECT_FALSE(EntityModel::is_valid_color("#0000"));
    EXPECT_FALSE(EntityModel::is_valid_color(""));
}

TEST_F(EntityModelTest, Names) {
    EXPECT_STREQ(EntityModel::id_attribute(EntityKind::SETTING), "name");
    EXPECT_STREQ(EntityModel::id_attribute(EntityKind::ACTION), "id");
    EXPECT_STREQ(EntityModel::id_attribute(EntityKind::ROOT), "");
    EXPECT_STREQ(EntityModel::kind_name(EntityKind::ACTION_DATA), "action data");
    EXPECT_EQ(EntityModel::type_names(VT_STRING | VT_INTEGER), "string|integer");
    EXPECT_STREQ(violation_kind_name(ViolationKind::DUPLICATE_ID), "duplicate_id");
}

TEST_F(EntityModelTest, ViolationText) {
    Violation violation{"categories[0].actions[1]", "prefix", ViolationKind::MISSING_REQUIRED, "missing prefix"};
    EXPECT_EQ(violation.attribute_path(), "categories[0].actions[1].prefix");
    EXPECT_EQ(violation.to_string(), "missing_required: missing prefix");

    Violation root{"", "sdk", ViolationKind::INVALID_CHOICE, "bad sdk"};
    EXPECT_EQ(root.attribute_path(), "sdk");
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
