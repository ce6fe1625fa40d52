#include "../src/kube/client/client.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../src/kube/error/kube_error.hpp"
#include "fakes.hpp"

using kube::client::Client;
using kube::client::ClientConfig;
using kube::client::labels_to_selector;
using kube::model::Job;
using kube::model::Pod;
using kube::model::Secret;
using kube::testing::CapturingLogger;
using kube::testing::EchoTransport;
using kube::testing::make_response;
using kube::testing::RecordingSleeper;
using kube::testing::ScriptedTransport;
using kube::testing::Step;
using kube::testing::TransportFailure;

namespace {
    size_t count_of(const std::string& haystack, const std::string& needle) {
        size_t n = 0;
        for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size())) {
            ++n;
        }
        return n;
    }

    Job sample_job() {
        Job job;
        job.metadata_.name_ = "pull-test-infra-bazel";
        job.metadata_.labels_ = {{"created-by-prow", "true"}};
        job.spec_.parallelism_ = 1;
        job.spec_.template_.spec_.restart_policy_ = "Never";
        job.spec_.template_.spec_.containers_.push_back({.name_ = "test", .image_ = "bazel:0.4", .args_ = {"test", "//..."}});
        return job;
    }

    Secret sample_secret() {
        Secret secret;
        secret.metadata_.name_ = "oauth-token";
        secret.type_ = "Opaque";
        secret.data_["token"] = "c3VwZXItc2VjcmV0LXZhbHVl";
        return secret;
    }

    class ClientTest : public ::testing::Test {
       protected:
        std::unique_ptr<Client> make_client(std::shared_ptr<const kube::transport::ITransport> transport, std::shared_ptr<CapturingLogger> logger = nullptr) {
            ClientConfig config{
                .base_url_ = "https://kubernetes",
                .token_ = "abc123",
                .namespace_ = "test-pods",
                .logger_ = std::move(logger),
            };
            return std::make_unique<Client>(std::move(config), std::move(transport), kube::retry::RetryPolicy{}, sleeper_.sleeper());
        }

        RecordingSleeper sleeper_;
    };
}  // namespace

TEST(LabelsToSelectorTest, JoinsPairsWithCommas) {
    const std::string selector = labels_to_selector({{"a", "1"}, {"b", "2"}});
    EXPECT_EQ(count_of(selector, "a = 1"), 1U);
    EXPECT_EQ(count_of(selector, "b = 2"), 1U);
    EXPECT_EQ(count_of(selector, ","), 1U);
    EXPECT_EQ(selector.size(), std::string("a = 1,b = 2").size());
}

TEST(LabelsToSelectorTest, EmptyLabelsGiveEmptySelector) { EXPECT_EQ(labels_to_selector({}), ""); }

TEST(FakeClientTest, EveryCallAnswersWithEmptyResult) {
    auto client = Client::make_fake();

    EXPECT_TRUE(client->config().fake_);
    EXPECT_EQ(client->config().namespace_, "default");

    EXPECT_EQ(client->get_pod("p"), Pod{});
    EXPECT_TRUE(client->list_pods({{"a", "1"}}).empty());
    EXPECT_NO_THROW(client->delete_pod("p"));
    EXPECT_EQ(client->create_pod(Pod{}), Pod{});
    EXPECT_EQ(client->get_job("j"), Job{});
    EXPECT_TRUE(client->list_jobs({}).empty());
    EXPECT_EQ(client->create_job(sample_job()), Job{});
    EXPECT_NO_THROW(client->delete_job("j"));
    EXPECT_EQ(client->patch_job("j", sample_job()), Job{});
    EXPECT_EQ(client->patch_job_status("j", sample_job()), Job{});
    EXPECT_NO_THROW(client->replace_secret("s", sample_secret()));
    EXPECT_EQ(client->get_log("p"), "{}");
    EXPECT_EQ(client->request_retry({.method_ = "GET", .path_ = "/anything"}), "{}");
}

TEST(FakeClientTest, StillLogsCalls) {
    auto logger = std::make_shared<CapturingLogger>();
    auto client = Client::make_fake(logger);

    static_cast<void>(client->get_pod("build-1"));

    ASSERT_EQ(logger->lines().size(), 1U);
    EXPECT_EQ(logger->lines()[0], "get_pod(build-1)");
}

TEST_F(ClientTest, RequiresTransportUnlessFake) {
    EXPECT_THROW(make_client(nullptr), std::invalid_argument);
}

TEST_F(ClientTest, GetPodBuildsNamespacedPath) {
    auto transport = std::make_shared<ScriptedTransport>(std::vector<Step>{make_response(200, R"({"metadata":{"name":"build-1"}})")});
    auto client = make_client(transport);

    EXPECT_EQ(client->get_pod("build-1").metadata_.name_, "build-1");

    const auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 1U);
    EXPECT_EQ(requests[0].method_, "GET");
    EXPECT_EQ(requests[0].path_, "/api/v1/namespaces/test-pods/pods/build-1");
    EXPECT_TRUE(requests[0].query_.empty());
    EXPECT_FALSE(requests[0].body_.has_value());
}

TEST_F(ClientTest, ListJobsSendsLabelSelector) {
    auto transport =
        std::make_shared<ScriptedTransport>(std::vector<Step>{make_response(200, R"({"items":[{"metadata":{"name":"a"}},{"metadata":{"name":"b"}}]})")});
    auto client = make_client(transport);

    const auto jobs = client->list_jobs({{"created-by-prow", "true"}});
    ASSERT_EQ(jobs.size(), 2U);
    EXPECT_EQ(jobs[0].metadata_.name_, "a");

    const auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 1U);
    EXPECT_EQ(requests[0].path_, "/apis/batch/v1/namespaces/test-pods/jobs");
    EXPECT_EQ(requests[0].query_.at("labelSelector"), "created-by-prow = true");
}

TEST_F(ClientTest, MutatingCallsUseExpectedVerbs) {
    auto transport = std::make_shared<ScriptedTransport>(std::vector<Step>{make_response(200, "{}")});
    auto client = make_client(transport);

    client->delete_pod("p");
    client->delete_job("j");
    static_cast<void>(client->patch_job("j", sample_job()));
    static_cast<void>(client->patch_job_status("j", sample_job()));
    client->replace_secret("oauth-token", sample_secret());

    const auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 5U);
    EXPECT_EQ(requests[0].method_, "DELETE");
    EXPECT_EQ(requests[0].path_, "/api/v1/namespaces/test-pods/pods/p");
    EXPECT_FALSE(requests[0].body_.has_value());
    EXPECT_EQ(requests[1].method_, "DELETE");
    EXPECT_EQ(requests[1].path_, "/apis/batch/v1/namespaces/test-pods/jobs/j");
    EXPECT_EQ(requests[2].method_, "PATCH");
    EXPECT_TRUE(requests[2].body_.has_value());
    EXPECT_EQ(requests[3].path_, "/apis/batch/v1/namespaces/test-pods/jobs/j/status");
    EXPECT_EQ(requests[4].method_, "PUT");
    EXPECT_EQ(requests[4].path_, "/api/v1/namespaces/test-pods/secrets/oauth-token");
    ASSERT_TRUE(requests[4].body_.has_value());
    EXPECT_EQ(requests[4].body_->at("data").at("token"), "c3VwZXItc2VjcmV0LXZhbHVl");
}

TEST_F(ClientTest, CreatedJobRoundTripsThroughServer) {
    auto client = make_client(std::make_shared<EchoTransport>());

    const Job job = sample_job();
    EXPECT_EQ(client->create_job(job), job);
    EXPECT_EQ(client->patch_job(job.metadata_.name_, job), job);

    Pod pod;
    pod.metadata_.name_ = "build-7";
    pod.spec_ = job.spec_.template_.spec_;
    pod.status_.phase_ = "Pending";
    EXPECT_EQ(client->create_pod(pod), pod);
}

TEST_F(ClientTest, GetLogReturnsRawBytes) {
    auto transport = std::make_shared<ScriptedTransport>(std::vector<Step>{make_response(200, "line one\nline two\n")});
    auto client = make_client(transport);

    EXPECT_EQ(client->get_log("build-1"), "line one\nline two\n");
    EXPECT_EQ(transport->requests().at(0).path_, "/api/v1/namespaces/test-pods/pods/build-1/log");
}

TEST_F(ClientTest, DecodeFailureIsDistinctAndNotRetried) {
    auto transport = std::make_shared<ScriptedTransport>(std::vector<Step>{make_response(200, "<html>proxy error</html>")});
    auto client = make_client(transport);

    EXPECT_THROW(static_cast<void>(client->get_job("j")), kube::error::DecodeError);
    EXPECT_EQ(transport->attempts(), 1U);
    EXPECT_TRUE(sleeper_.delays_.empty());
}

TEST_F(ClientTest, ConflictReachesCaller) {
    auto transport = std::make_shared<ScriptedTransport>(std::vector<Step>{make_response(409, R"({"reason":"Conflict"})", "409 Conflict")});
    auto client = make_client(transport);

    EXPECT_THROW(static_cast<void>(client->patch_job_status("j", sample_job())), kube::error::ConflictError);
    EXPECT_EQ(transport->attempts(), 1U);
}

TEST_F(ClientTest, TransportFailuresAreRetriedThenSucceed) {
    auto transport = std::make_shared<ScriptedTransport>(
        std::vector<Step>{TransportFailure{}, TransportFailure{}, make_response(200, R"({"metadata":{"name":"build-1"}})")});
    auto client = make_client(transport);

    EXPECT_EQ(client->get_pod("build-1").metadata_.name_, "build-1");
    EXPECT_EQ(transport->attempts(), 3U);
    EXPECT_EQ(sleeper_.delays_, (std::vector<std::chrono::milliseconds>{std::chrono::seconds{2}, std::chrono::seconds{4}}));
}

TEST_F(ClientTest, LogsCallsBeforeDispatch) {
    auto logger = std::make_shared<CapturingLogger>();
    auto transport = std::make_shared<ScriptedTransport>(std::vector<Step>{make_response(500, "boom")});
    auto client = make_client(transport, logger);

    EXPECT_THROW(client->delete_job("j"), kube::error::HttpError);
    ASSERT_EQ(logger->lines().size(), 1U);
    EXPECT_EQ(logger->lines()[0], "delete_job(j)");
}

TEST_F(ClientTest, SecretPayloadNeverLogged) {
    auto logger = std::make_shared<CapturingLogger>();
    auto client = make_client(std::make_shared<EchoTransport>(), logger);

    const Secret secret = sample_secret();
    client->replace_secret("oauth-token", secret);
    const Job job = sample_job();
    static_cast<void>(client->create_job(job));

    const auto lines = logger->lines();
    ASSERT_EQ(lines.size(), 2U);
    EXPECT_EQ(lines[0], "replace_secret(oauth-token)");
    for (const auto& line : lines) {
        EXPECT_EQ(line.find("c3VwZXItc2VjcmV0LXZhbHVl"), std::string::npos) << line;
        EXPECT_EQ(line.find("abc123"), std::string::npos) << line;
    }

    EXPECT_EQ(lines[1].rfind("create_job(", 0), 0U);
    EXPECT_NE(lines[1].find("pull-test-infra-bazel"), std::string::npos);
    EXPECT_NE(lines[1].find("bazel:0.4"), std::string::npos);
}

TEST_F(ClientTest, SharedAcrossThreads) {
    auto logger = std::make_shared<CapturingLogger>();
    auto client = make_client(std::make_shared<EchoTransport>(), logger);
    const Job job = sample_job();

    std::vector<std::thread> workers;
    std::vector<int> matches(8, 0);
    for (size_t i = 0; i < matches.size(); ++i) {
        workers.emplace_back([&, i] { matches[i] = client->create_job(job) == job ? 1 : 0; });
    }
    for (auto& w : workers) {
        w.join();
    }

    for (const int m : matches) {
        EXPECT_EQ(m, 1);
    }
    EXPECT_EQ(logger->lines().size(), matches.size());
}
