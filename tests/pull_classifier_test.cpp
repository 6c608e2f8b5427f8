#include <gtest/gtest.h>

#include "provision/pull_classifier.hpp"

using namespace dockbox::provision;
using dockbox::util::ContextError;

TEST(PullClassifier, TimeoutBeatsNotFoundText)
{
    auto failure = classify_transport_failure(PullStage::CALL, ContextError::DEADLINE_EXCEEDED,
        "manifest for ghost:1 not found: manifest unknown", "ghost:1");

    EXPECT_EQ(failure.kind, ProvisionErrorKind::PULL_TIMEOUT);
    EXPECT_EQ(failure.message,
        "timeout while trying to pull Docker image ghost:1 - this usually means the image "
        "doesn't exist in the registry or the registry is unreachable");
}

TEST(PullClassifier, DrainTimeout)
{
    auto failure = classify_transport_failure(PullStage::DRAIN, ContextError::DEADLINE_EXCEEDED,
        "context deadline exceeded", "python:3.12-slim-bookworm");

    EXPECT_EQ(failure.kind, ProvisionErrorKind::PULL_TIMEOUT);
    EXPECT_EQ(failure.message, "timeout while downloading Docker image python:3.12-slim-bookworm");
}

TEST(PullClassifier, NotFoundSignals)
{
    for (const char* text : {"pull access denied: repository not found",
                             "Error response from daemon: 404 page",
                             "manifest unknown"}) {
        auto failure = classify_transport_failure(PullStage::CALL, ContextError::NONE, text, "x:1");
        EXPECT_EQ(failure.kind, ProvisionErrorKind::IMAGE_NOT_FOUND) << text;
        EXPECT_EQ(failure.message,
            "docker image x:1 not found in registry. Please check that the image name and tag are correct");
    }
}

TEST(PullClassifier, GenericCallFailure)
{
    auto failure = classify_transport_failure(PullStage::CALL, ContextError::NONE,
        "connection reset by peer", "alpine");

    EXPECT_EQ(failure.kind, ProvisionErrorKind::PULL_FAILED);
    EXPECT_EQ(failure.message, "failed to pull Docker image alpine: connection reset by peer");
}

TEST(PullClassifier, CancelledCallIsGeneric)
{
    auto failure = classify_transport_failure(PullStage::CALL, ContextError::CANCELLED,
        "context canceled", "alpine");

    EXPECT_EQ(failure.kind, ProvisionErrorKind::PULL_FAILED);
}

TEST(PullClassifier, DrainFailureIgnoresNotFoundText)
{
    auto failure = classify_transport_failure(PullStage::DRAIN, ContextError::NONE,
        "unexpected EOF (404)", "alpine");

    EXPECT_EQ(failure.kind, ProvisionErrorKind::PULL_FAILED);
    EXPECT_EQ(failure.message, "failed to read pull response for image alpine: unexpected EOF (404)");
}

TEST(PullClassifier, PayloadNotFound)
{
    auto failure = classify_pull_payload(
        "{\"status\":\"Pulling from library/ghost\"}\n"
        "{\"errorDetail\":{\"message\":\"manifest unknown\"},\"error\":\"manifest unknown\"}\n",
        "ghost:latest");

    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->kind, ProvisionErrorKind::IMAGE_NOT_FOUND);
}

TEST(PullClassifier, PayloadErrorMarker)
{
    std::string payload = "{\"error\":\"toomanyrequests: rate limit\"}\n";
    auto failure = classify_pull_payload(payload, "alpine");

    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->kind, ProvisionErrorKind::PULL_FAILED);
    EXPECT_EQ(failure->message, "failed to pull Docker image alpine: " + payload);
}

TEST(PullClassifier, CleanPayload)
{
    auto failure = classify_pull_payload(
        "{\"status\":\"Pulling fs layer\",\"id\":\"a1b2\"}\n"
        "{\"status\":\"Download complete\",\"id\":\"a1b2\"}\n"
        "{\"status\":\"Status: Downloaded newer image for alpine:latest\"}\n",
        "alpine");

    EXPECT_FALSE(failure.has_value());
}
