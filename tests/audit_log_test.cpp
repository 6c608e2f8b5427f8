#include <gtest/gtest.h>

#include "daemon/audit_log.hpp"

using namespace dockbox::daemon;
using dockbox::provision::ProvisionState;

TEST(AuditLog, CategoriesForStates)
{
    EXPECT_EQ(audit_category_for_state(ProvisionState::CONNECTING), AuditCategory::ENGINE);
    EXPECT_EQ(audit_category_for_state(ProvisionState::CONN_FAILED), AuditCategory::ENGINE);
    EXPECT_EQ(audit_category_for_state(ProvisionState::PULLING), AuditCategory::IMAGE);
    EXPECT_EQ(audit_category_for_state(ProvisionState::PRESENT), AuditCategory::IMAGE);
    EXPECT_EQ(audit_category_for_state(ProvisionState::CREATING), AuditCategory::CONTAINER);
    EXPECT_EQ(audit_category_for_state(ProvisionState::START_FAILED), AuditCategory::CONTAINER);
}

TEST(AuditLog, CategoryNames)
{
    EXPECT_EQ(audit_category_from_string("IMAGE"), AuditCategory::IMAGE);
    EXPECT_FALSE(audit_category_from_string("image").has_value());
    EXPECT_EQ(audit_category_to_string(AuditCategory::REQUEST), "REQUEST");
}

TEST(AuditLog, TransitionsRecordImageAndOutcome)
{
    AuditLogger logger;
    logger.log_transition(3, "alpine", ProvisionState::PULLING);
    logger.log_transition(3, "alpine", ProvisionState::PULL_FAILED);

    auto entries = logger.get_entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].event_type, "PULLING");
    EXPECT_TRUE(entries[0].success);
    EXPECT_EQ(entries[1].event_type, "PULL_FAILED");
    EXPECT_FALSE(entries[1].success);
    EXPECT_EQ(entries[1].category, AuditCategory::IMAGE);
    EXPECT_EQ(entries[1].client_id, 3u);
    EXPECT_EQ(entries[1].details["image"], "alpine");
}

TEST(AuditLog, FiltersAndLimit)
{
    AuditLogger logger;
    for (int i = 0; i < 5; ++i) {
        logger.log(AuditCategory::REQUEST, "INIT_ENV", 1, {{"n", i}});
        logger.log(AuditCategory::ENGINE, "CONNECTED", 2, {{"n", i}});
    }

    auto requests = logger.get_entries(AuditCategory::REQUEST);
    ASSERT_EQ(requests.size(), 5u);
    EXPECT_EQ(requests.front().details["n"], 0);
    EXPECT_EQ(requests.back().details["n"], 4);

    auto client_two = logger.get_entries(std::nullopt, 2u);
    ASSERT_EQ(client_two.size(), 5u);

    // Limit keeps the most recent entries, oldest first
    auto latest = logger.get_entries(std::nullopt, std::nullopt, 0, 3);
    ASSERT_EQ(latest.size(), 3u);
    EXPECT_EQ(latest[0].id, 8u);
    EXPECT_EQ(latest[2].id, 10u);

    auto since = logger.get_entries(std::nullopt, std::nullopt, 7);
    ASSERT_EQ(since.size(), 3u);
    EXPECT_EQ(since.front().id, 8u);
}

TEST(AuditLog, BoundedSize)
{
    AuditConfig config;
    config.max_entries = 3;
    AuditLogger logger(config);

    for (int i = 0; i < 10; ++i) {
        logger.log(AuditCategory::IMAGE, "PULLING", 0, nlohmann::json::object());
    }

    EXPECT_EQ(logger.entry_count(), 3u);
    EXPECT_EQ(logger.last_entry_id(), 10u);
    EXPECT_EQ(logger.get_entries().front().id, 8u);
}

TEST(AuditLog, DisabledCategoryIsDropped)
{
    AuditConfig config;
    config.log_engine = false;
    AuditLogger logger(config);

    logger.log_transition(1, "alpine", ProvisionState::CONNECTING);
    logger.log_transition(1, "alpine", ProvisionState::CHECKING_IMAGE);

    auto entries = logger.get_entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].event_type, "CHECKING_IMAGE");
}

TEST(AuditLog, EntryJson)
{
    AuditLogger logger;
    logger.log(AuditCategory::REQUEST, "INIT_ENV", 4, {{"image", "alpine"}}, false);

    auto j = logger.get_entries().front().to_json();
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["category"], "REQUEST");
    EXPECT_EQ(j["event_type"], "INIT_ENV");
    EXPECT_EQ(j["client_id"], 4);
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["details"]["image"], "alpine");
    // 2024-01-01T00:00:00.000Z
    EXPECT_EQ(j["timestamp"].get<std::string>().size(), 24u);
    EXPECT_EQ(j["timestamp"].get<std::string>().back(), 'Z');
}
