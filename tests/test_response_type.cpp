#include "message.hpp"
#include "response_type.hpp"
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <vector>

TEST(response_type, instance_matches_exact_type_only) {
    auto type = querybus::instance_of<std::string>();

    EXPECT_TRUE(type->matches(typeid(std::string)));
    EXPECT_FALSE(type->matches(typeid(int)));
    EXPECT_FALSE(type->matches(typeid(std::vector<std::string>)));
}

TEST(response_type, instance_converts_value) {
    auto type = querybus::instance_of<int>();

    auto converted = type->convert(std::any(7));
    EXPECT_EQ(std::any_cast<int>(converted), 7);
    EXPECT_EQ(type->response_payload_type(), std::type_index(typeid(int)));
}

TEST(response_type, instance_of_nothing_is_null) {
    auto type = querybus::instance_of<int>();

    querybus::query_response response(type->convert(std::any{}));
    EXPECT_TRUE(response.is_null());
}

TEST(response_type, instance_rejects_wrong_type) {
    auto type = querybus::instance_of<int>();

    EXPECT_THROW(type->convert(std::any(std::string("7"))), std::bad_any_cast);
}

TEST(response_type, optional_matches_value_and_optional) {
    auto type = querybus::optional_of<int>();

    EXPECT_TRUE(type->matches(typeid(int)));
    EXPECT_TRUE(type->matches(typeid(std::optional<int>)));
    EXPECT_FALSE(type->matches(typeid(long)));
}

TEST(response_type, optional_wraps_value) {
    auto type = querybus::optional_of<int>();

    auto converted = std::any_cast<std::optional<int>>(type->convert(std::any(3)));
    ASSERT_TRUE(converted.has_value());
    EXPECT_EQ(*converted, 3);

    auto passthrough = std::any_cast<std::optional<int>>(type->convert(std::any(std::optional<int>(4))));
    EXPECT_EQ(passthrough, std::optional<int>(4));
}

TEST(response_type, optional_of_nothing_is_empty_not_null) {
    auto type = querybus::optional_of<int>();

    querybus::query_response response(type->convert(std::any{}));
    EXPECT_FALSE(response.is_null());
    EXPECT_FALSE(response.payload_as<std::optional<int>>().has_value());
}

TEST(response_type, multiple_instances_matches_list_and_single) {
    auto type = querybus::multiple_instances_of<std::string>();

    EXPECT_TRUE(type->matches(typeid(std::vector<std::string>)));
    EXPECT_TRUE(type->matches(typeid(std::string)));
    EXPECT_FALSE(type->matches(typeid(std::vector<int>)));
}

TEST(response_type, multiple_instances_converts) {
    auto type = querybus::multiple_instances_of<std::string>();

    auto list = std::any_cast<std::vector<std::string>>(
        type->convert(std::any(std::vector<std::string>{"a", "b"})));
    EXPECT_EQ(list, (std::vector<std::string>{"a", "b"}));

    auto single = std::any_cast<std::vector<std::string>>(type->convert(std::any(std::string("c"))));
    EXPECT_EQ(single, (std::vector<std::string>{"c"}));

    auto none = std::any_cast<std::vector<std::string>>(type->convert(std::any{}));
    EXPECT_TRUE(none.empty());
}

TEST(response_type, describe_names_shape_and_type) {
    EXPECT_EQ(querybus::instance_of<int>()->describe(), "instance_of<int>");
    EXPECT_EQ(querybus::optional_of<int>()->describe(), "optional_of<int>");
    EXPECT_EQ(querybus::multiple_instances_of<int>()->describe(), "multiple_instances_of<int>");
}

TEST(query_message, requires_name_and_response_type) {
    EXPECT_THROW(querybus::make_query("", 1, querybus::instance_of<int>()), std::invalid_argument);
    EXPECT_THROW(querybus::make_query("price", 1, nullptr), std::invalid_argument);
}

TEST(query_message, and_metadata_returns_new_instance) {
    auto query = querybus::make_query("price", 1, querybus::instance_of<int>(), {{"a", "1"}});
    auto tagged = query->and_metadata({{"b", "2"}});

    EXPECT_NE(tagged.get(), query.get());
    EXPECT_EQ(query->metadata().size(), 1u);
    EXPECT_EQ(tagged->metadata().at("a"), "1");
    EXPECT_EQ(tagged->metadata().at("b"), "2");
    EXPECT_EQ(tagged->query_name(), "price");
    EXPECT_EQ(tagged->payload_as<int>(), 1);
}

TEST(query_message, metadata_copy_keeps_subscription_query_type) {
    auto query = querybus::make_subscription_query("price", 1, querybus::instance_of<int>(),
                                                   querybus::instance_of<double>());
    auto tagged = query->with_metadata({{"trace", "t1"}});

    auto as_subscription = std::dynamic_pointer_cast<const querybus::subscription_query_message>(tagged);
    ASSERT_TRUE(as_subscription);
    EXPECT_TRUE(as_subscription->update_response_type().matches(typeid(double)));
    EXPECT_EQ(as_subscription->metadata().at("trace"), "t1");
}

TEST(query_message, identifiers_are_unique) {
    auto a = querybus::make_query("price", 1, querybus::instance_of<int>());
    auto b = querybus::make_query("price", 1, querybus::instance_of<int>());

    EXPECT_NE(a->identifier(), b->identifier());
    EXPECT_EQ(a->identifier().size(), 32u);
}
