#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "provision/provisioner.hpp"
#include "fake_engine.hpp"

using namespace dockbox::provision;
using namespace std::chrono_literals;
using dockbox::engine::ConnectionResolver;
using dockbox::fakes::FakeConnector;
using dockbox::fakes::FakeEngineScript;
using dockbox::util::CallContext;

namespace {

// Provisioner wired to a single fake engine reached through the environment
struct ProvisionerFixture : public ::testing::Test {
    FakeConnector connector;
    std::shared_ptr<FakeEngineScript> engine = std::make_shared<FakeEngineScript>();
    ConnectionResolver resolver{connector, [](const std::string&) { return false; }};
    ProvisionerConfig config;

    void SetUp() override { connector.env_script = engine; }

    ProvisionResult run(const ProvisionRequest& request,
                        const CallContext& ctx = CallContext::background())
    {
        EnvironmentProvisioner provisioner(resolver, config);
        return provisioner.provision(request, ctx);
    }
};

ProvisionRequest request_for(const std::string& image)
{
    ProvisionRequest request;
    request.image = image;
    return request;
}

} // namespace

TEST_F(ProvisionerFixture, DefaultImageAndInteractiveSpec)
{
    auto result = run(request_for(""));

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.image, "python:3.12-slim-bookworm");
    EXPECT_EQ(result.to_text(), "container_id: 4f2b9c1d7e3a");
    EXPECT_EQ(result.final_state, ProvisionState::RUNNING);
    EXPECT_EQ(result.error_kind, ProvisionErrorKind::NONE);

    EXPECT_EQ(engine->created_spec.image, "python:3.12-slim-bookworm");
    EXPECT_EQ(engine->created_spec.working_dir, "/app");
    EXPECT_TRUE(engine->created_spec.tty);
    EXPECT_TRUE(engine->created_spec.open_stdin);
    EXPECT_FALSE(engine->created_spec.stdin_once);
    EXPECT_EQ(engine->created_name, "");
    EXPECT_EQ(engine->started_id, "4f2b9c1d7e3a");
    EXPECT_EQ(engine->close_calls, 1);
}

TEST_F(ProvisionerFixture, AbsentImageUsesDefault)
{
    auto result = run(ProvisionRequest{});

    ASSERT_TRUE(result.success);
    EXPECT_EQ(engine->inspected_image, "python:3.12-slim-bookworm");
}

TEST_F(ProvisionerFixture, PresentImageIsNeverPulled)
{
    engine->image_present = true;

    auto result = run(request_for("alpine:3.20"));

    ASSERT_TRUE(result.success);
    EXPECT_EQ(engine->inspect_calls, 1);
    EXPECT_EQ(engine->pull_calls, 0);
    EXPECT_EQ(engine->create_calls, 1);
}

TEST_F(ProvisionerFixture, MissingImageIsPulledOnceAndDrained)
{
    engine->image_present = false;
    engine->pull_chunks = {
        "{\"status\":\"Pulling from library/alpine\"}\n",
        "{\"status\":\"Download complete\"}\n",
    };

    auto result = run(request_for("alpine:3.20"));

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(engine->pull_calls, 1);
    EXPECT_EQ(engine->pulled_image, "alpine:3.20");
    EXPECT_EQ(engine->stream_close_calls, 1);
    EXPECT_EQ(engine->create_calls, 1);
}

TEST_F(ProvisionerFixture, PullDeadlineIsFiveMinutes)
{
    engine->image_present = false;

    auto before = CallContext::Clock::now();
    auto result = run(request_for("alpine:3.20"));
    auto after = CallContext::Clock::now();

    ASSERT_TRUE(result.success);
    ASSERT_TRUE(engine->pull_deadline.has_value());
    EXPECT_GE(*engine->pull_deadline, before + 5min);
    EXPECT_LE(*engine->pull_deadline, after + 5min);
}

TEST_F(ProvisionerFixture, PullDeadlineHonoursShorterCallerDeadline)
{
    engine->image_present = false;
    auto caller = CallContext::background().with_timeout(30s);

    auto result = run(request_for("alpine:3.20"), caller);

    ASSERT_TRUE(result.success);
    ASSERT_TRUE(engine->pull_deadline.has_value());
    EXPECT_EQ(*engine->pull_deadline, *caller.deadline());
}

TEST_F(ProvisionerFixture, PullTimeoutBeatsNotFoundText)
{
    engine->image_present = false;
    engine->pull_call_waits_for_context = true;
    engine->pull_call_error = "manifest for ghost:1 not found";
    config.pull_timeout = 20ms;

    auto result = run(request_for("ghost:1"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ProvisionErrorKind::PULL_TIMEOUT);
    EXPECT_EQ(result.final_state, ProvisionState::PULL_FAILED);
    EXPECT_NE(result.error.find("timeout while trying to pull Docker image ghost:1"), std::string::npos);
    EXPECT_EQ(engine->create_calls, 0);
}

TEST_F(ProvisionerFixture, DrainTimeout)
{
    engine->image_present = false;
    engine->pull_chunks = {"{\"status\":\"Downloading\"}\n"};
    engine->drain_waits_for_context = true;
    config.pull_timeout = 20ms;

    auto result = run(request_for("python:3.12"));

    EXPECT_EQ(result.error_kind, ProvisionErrorKind::PULL_TIMEOUT);
    EXPECT_EQ(result.error, "timeout while downloading Docker image python:3.12");
    EXPECT_EQ(engine->stream_close_calls, 1);
}

TEST_F(ProvisionerFixture, CallerCancellationAbortsPull)
{
    engine->image_present = false;
    engine->pull_call_waits_for_context = true;
    auto caller = CallContext::background().with_cancel();

    std::thread canceller([caller] {
        std::this_thread::sleep_for(20ms);
        caller.cancel();
    });
    auto result = run(request_for("alpine:3.20"), caller);
    canceller.join();

    EXPECT_EQ(result.error_kind, ProvisionErrorKind::PULL_FAILED);
    EXPECT_EQ(result.error, "failed to pull Docker image alpine:3.20: context canceled");
}

TEST_F(ProvisionerFixture, ManifestUnknownIsImageNotFound)
{
    engine->image_present = false;
    engine->pull_call_ok = false;
    engine->pull_call_error = "Error response from daemon: manifest unknown";

    auto result = run(request_for("ghost:1"));

    EXPECT_EQ(result.error_kind, ProvisionErrorKind::IMAGE_NOT_FOUND);
    EXPECT_EQ(result.to_text(),
        "Error: docker image ghost:1 not found in registry. "
        "Please check that the image name and tag are correct");
}

TEST_F(ProvisionerFixture, NotFoundInPullCallFailure)
{
    engine->image_present = false;
    engine->pull_call_ok = false;
    engine->pull_call_error = "Error response from daemon: 404 Not Found";

    auto result = run(request_for("ghost:1"));

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("not found in registry"), std::string::npos);
    EXPECT_EQ(engine->create_calls, 0);
}

TEST_F(ProvisionerFixture, ErrorInPullPayload)
{
    engine->image_present = false;
    engine->pull_chunks = {"{\"error\":\"toomanyrequests\"}\n"};

    auto result = run(request_for("alpine"));

    EXPECT_EQ(result.error_kind, ProvisionErrorKind::PULL_FAILED);
    EXPECT_EQ(result.error, "failed to pull Docker image alpine: {\"error\":\"toomanyrequests\"}\n");
    EXPECT_EQ(engine->create_calls, 0);
}

TEST_F(ProvisionerFixture, CreateFailure)
{
    engine->create_ok = false;
    engine->create_error = "Error response from daemon: Conflict";

    auto result = run(request_for("alpine"));

    EXPECT_EQ(result.error_kind, ProvisionErrorKind::CONTAINER_CREATE);
    EXPECT_EQ(result.error, "failed to create container: Error response from daemon: Conflict");
    EXPECT_EQ(result.final_state, ProvisionState::CREATE_FAILED);
    EXPECT_EQ(engine->start_calls, 0);
}

TEST_F(ProvisionerFixture, StartFailureHidesContainerId)
{
    engine->start_ok = false;
    engine->start_error = "Error response from daemon: OCI runtime create failed";

    auto result = run(request_for("alpine"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ProvisionErrorKind::CONTAINER_START);
    EXPECT_TRUE(result.container_id.empty());
    EXPECT_EQ(result.to_text().find("4f2b9c1d7e3a"), std::string::npos);
    EXPECT_EQ(engine->remove_calls, 0);
    EXPECT_EQ(engine->close_calls, 1);
}

TEST_F(ProvisionerFixture, StartFailureRemovesContainerWhenConfigured)
{
    engine->start_ok = false;
    engine->start_error = "boom";
    config.remove_on_start_failure = true;

    auto result = run(request_for("alpine"));

    EXPECT_EQ(result.error_kind, ProvisionErrorKind::CONTAINER_START);
    EXPECT_EQ(engine->remove_calls, 1);
    EXPECT_EQ(engine->removed_id, "4f2b9c1d7e3a");
    EXPECT_TRUE(engine->remove_forced);
}

TEST_F(ProvisionerFixture, NoTransportIsConnectionError)
{
    connector.env_script.reset();

    auto result = run(request_for("alpine"));

    EXPECT_EQ(result.error_kind, ProvisionErrorKind::CONNECTION);
    EXPECT_EQ(result.final_state, ProvisionState::CONN_FAILED);
    EXPECT_EQ(result.error.rfind("failed to create Docker client: could not connect to Docker daemon. "
                                 "Tried standard connection and socket paths: [/var/run/docker.sock",
                                 0),
              0u);
    EXPECT_EQ(engine->inspect_calls, 0);
}

TEST_F(ProvisionerFixture, StateTransitionsAreReported)
{
    engine->image_present = false;
    std::vector<ProvisionState> states;

    EnvironmentProvisioner provisioner(resolver, config);
    provisioner.set_event_callback([&states](const std::string& image, ProvisionState state) {
        EXPECT_EQ(image, "alpine");
        states.push_back(state);
    });
    auto result = provisioner.provision(request_for("alpine"), CallContext::background());

    ASSERT_TRUE(result.success);
    std::vector<ProvisionState> expected = {
        ProvisionState::CONNECTING, ProvisionState::CONNECTED,
        ProvisionState::CHECKING_IMAGE, ProvisionState::PULLING, ProvisionState::PULLED,
        ProvisionState::CREATING, ProvisionState::CREATED,
        ProvisionState::STARTING, ProvisionState::RUNNING,
    };
    EXPECT_EQ(states, expected);
}

TEST(ProvisionWire, RequestFromJson)
{
    EXPECT_EQ(request_from_json(nlohmann::json::parse(R"({"image":"alpine"})")).image, "alpine");
    EXPECT_FALSE(request_from_json(nlohmann::json::parse(R"({"image":42})")).image.has_value());
    EXPECT_FALSE(request_from_json(nlohmann::json::parse(R"({})")).image.has_value());
    EXPECT_FALSE(request_from_json(nlohmann::json::parse(R"(["alpine"])")).image.has_value());
}

TEST(ProvisionWire, ResultToJson)
{
    ProvisionResult ok;
    ok.success = true;
    ok.container_id = "abc";
    ok.image = "alpine";
    ok.final_state = ProvisionState::RUNNING;

    auto j = result_to_json(ok);
    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["text"], "container_id: abc");
    EXPECT_EQ(j["container_id"], "abc");
    EXPECT_FALSE(j.contains("error_kind"));

    ProvisionResult failed;
    failed.error_kind = ProvisionErrorKind::PULL_TIMEOUT;
    failed.error = "timeout while downloading Docker image alpine";

    j = result_to_json(failed);
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["text"], "Error: timeout while downloading Docker image alpine");
    EXPECT_EQ(j["error_kind"], "PULL_TIMEOUT");
    EXPECT_FALSE(j.contains("container_id"));
}
