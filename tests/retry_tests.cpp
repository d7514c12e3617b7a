// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <pavtv/core/retry.hpp>
#include <vector>

using namespace pavtv::core;
using namespace std::chrono_literals;

namespace {

// Fails the first `failures` calls, then answers with `status`
class ScriptedTransport final : public HttpTransport {
public:
    ScriptedTransport(int failures, std::int32_t status)
        : failures_(failures), status_(status) {}

    std::expected<HttpResponse, TransportFailure> perform(const HttpRequest&) override {
        ++calls;
        if (calls <= failures_) {
            return std::unexpected(TransportFailure{"connection reset"});
        }
        HttpResponse response;
        response.status_code = status_;
        response.body = {'o', 'k'};
        return response;
    }

    int calls{0};

private:
    int failures_;
    std::int32_t status_;
};

} // namespace

TEST_CASE("RetryPolicy delay schedule", "[retry]") {
    RetryPolicy policy;
    CHECK(policy.max_attempts == 5);
    CHECK(policy.delay_for(1) == 2000ms);
    CHECK(policy.delay_for(2) == 4000ms);
    CHECK(policy.delay_for(3) == 8000ms);
    CHECK(policy.delay_for(4) == 16000ms);
}

TEST_CASE("Transport failures are retried", "[retry]") {
    const HttpRequest request{HttpMethod::get, "https://host/x"};
    RetryPolicy policy;

    std::vector<std::chrono::milliseconds> sleeps;
    SleepFn record = [&](std::chrono::milliseconds d) { sleeps.push_back(d); };

    SECTION("Success after fewer failures than the limit") {
        for (int k = 0; k < 5; ++k) {
            sleeps.clear();
            ScriptedTransport transport(k, 200);
            auto response = request_with_retry(transport, request, policy, record);
            REQUIRE(response);
            CHECK(response->text() == "ok");
            CHECK(transport.calls == k + 1);
            CHECK(sleeps.size() == static_cast<std::size_t>(k));
        }
    }

    SECTION("Exhaustion reports the attempt count") {
        ScriptedTransport transport(10, 200);
        auto response = request_with_retry(transport, request, policy, record);
        REQUIRE_FALSE(response);
        CHECK(response.error().is(ReplayErrc::network_error));
        CHECK(response.error().attempts == 5);
        CHECK(transport.calls == 5);
        CHECK_THAT(response.error().detail, Catch::Matchers::ContainsSubstring("https://host/x"));
        CHECK_THAT(response.error().detail, Catch::Matchers::ContainsSubstring("5 attempts"));

        REQUIRE(sleeps.size() == 4);
        CHECK(sleeps[0] == 2000ms);
        CHECK(sleeps[1] == 4000ms);
        CHECK(sleeps[2] == 8000ms);
        CHECK(sleeps[3] == 16000ms);
    }
}

TEST_CASE("HTTP error status is not retried", "[retry]") {
    ScriptedTransport transport(0, 404);
    int slept = 0;
    auto response = request_with_retry(transport, HttpRequest{HttpMethod::post, "https://host/y"},
                                       RetryPolicy{}, [&](std::chrono::milliseconds) { ++slept; });
    REQUIRE_FALSE(response);
    CHECK(response.error().is(ReplayErrc::server_error));
    CHECK(response.error().http_status == 404);
    CHECK_THAT(response.error().detail, Catch::Matchers::ContainsSubstring("POST"));
    CHECK(transport.calls == 1);
    CHECK(slept == 0);
}

TEST_CASE("Zero-delay policy", "[retry]") {
    ScriptedTransport transport(2, 204);
    RetryPolicy policy{3, 0ms, 2};
    auto response = request_with_retry(transport, HttpRequest{HttpMethod::get, "u"}, policy);
    REQUIRE(response);
    CHECK(response->status_code == 204);
    CHECK(transport.calls == 3);
}
