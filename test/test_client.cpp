// test_client.cpp - Tests for the query client
// Module 5: request preparation, status mapping, response decoding, sessions

#include <catch2/catch_all.hpp>
#include <faunadb/client.h>
#include <faunadb/codec.h>
#include <faunadb/decode.h>

#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace faunadb;

// ============================================================
// Helper Functions
// ============================================================

/// Records every request and answers with a canned response
class FakeTransport : public Transport {
public:
    explicit FakeTransport(HttpResponse response) : response_(std::move(response)) {}

    HttpResponse send(const HttpRequest& request) override {
        requests.push_back(request);
        return response_;
    }

    std::vector<HttpRequest> requests;

private:
    HttpResponse response_;
};

std::shared_ptr<FakeTransport> respond_with(int status, std::string body) {
    return std::make_shared<FakeTransport>(HttpResponse{status, std::move(body), {}});
}

// ============================================================
// Authorization
// ============================================================

TEST_CASE("basic_auth encodes the secret as the user name", "[client][auth]") {
    REQUIRE(basic_auth("secret") == "Basic c2VjcmV0:");
    REQUIRE(basic_auth("ab") == "Basic YWI=:");
    REQUIRE(basic_auth("a") == "Basic YQ==:");
    REQUIRE(basic_auth("") == "Basic :");
}

// ============================================================
// Requests
// ============================================================

TEST_CASE("query sends one POST with the encoded expression", "[client][request]") {
    auto transport = respond_with(200, R"({"resource":{"@ref":"classes/spells/1"}})");
    ClientConfig config;
    config.endpoint = "http://localhost:8443";
    config.timeout = std::chrono::milliseconds{5000};
    Client client{"secret", transport, config};

    auto res = client.query(Value::object({{"get", Value::ref("classes/spells/1")}}));
    REQUIRE(res);
    REQUIRE(res.value == Value::ref("classes/spells/1"));

    REQUIRE(transport->requests.size() == 1);
    const auto& request = transport->requests.front();
    REQUIRE(request.method == "POST");
    REQUIRE(request.url == "http://localhost:8443");
    REQUIRE(request.timeout == std::chrono::milliseconds{5000});
    REQUIRE(request.header("Authorization") == "Basic c2VjcmV0:");
    REQUIRE(request.header("Content-Type") == "application/json; charset=utf-8");
    REQUIRE(request.header("X-Missing").empty());
    REQUIRE(request.body == R"({"object":{"get":{"@ref":"classes/spells/1"}}})");
}

TEST_CASE("default configuration", "[client][config]") {
    auto transport = respond_with(200, R"({"resource":null})");
    Client client{"secret", transport};

    REQUIRE(client.config().endpoint == "https://db.fauna.com");
    REQUIRE(client.config().timeout == std::chrono::milliseconds{60000});

    auto res = client.query(Value{1});
    REQUIRE(res);
    REQUIRE(res.value.is_null());
    REQUIRE(transport->requests.front().url == "https://db.fauna.com");
}

// ============================================================
// Failures
// ============================================================

TEST_CASE("Non-2xx statuses map to transport errors", "[client][status]") {
    auto [status, expected] = GENERATE(table<int, ErrorCode>({
        {400, ErrorCode::BadRequest},
        {401, ErrorCode::Unauthorized},
        {403, ErrorCode::PermissionDenied},
        {404, ErrorCode::NotFound},
        {500, ErrorCode::InternalError},
        {503, ErrorCode::Unavailable},
        {409, ErrorCode::UnknownStatus},
        {302, ErrorCode::UnknownStatus},
    }));

    REQUIRE(error_code_for_status(status) == expected);

    auto transport = respond_with(status, R"({"errors":[{"code":"failed"}]})");
    Client client{"secret", transport};
    auto res = client.query(Value{1});
    REQUIRE_FALSE(res);
    REQUIRE(res.error_code == expected);
    REQUIRE(res.category() == ErrorCategory::Transport);
    REQUIRE(res.error_message.find(std::to_string(status)) != std::string::npos);
}

TEST_CASE("Transport failures are not decode errors", "[client][transport]") {
    SECTION("transport reports an error") {
        auto transport = std::make_shared<FakeTransport>(HttpResponse{0, {}, "connection refused"});
        Client client{"secret", transport};
        auto res = client.query(Value{1});
        REQUIRE(res.error_code == ErrorCode::TransportFailure);
        REQUIRE(res.error_message == "connection refused");
    }

    SECTION("no transport") {
        Client client{"secret", nullptr};
        auto res = client.query(Value{1});
        REQUIRE(res.error_code == ErrorCode::TransportFailure);
    }

    SECTION("error body on a non-2xx status is never parsed") {
        auto transport = respond_with(401, "not json at all");
        Client client{"secret", transport};
        auto res = client.query(Value{1});
        REQUIRE(res.error_code == ErrorCode::Unauthorized);
    }
}

TEST_CASE("Response bodies", "[client][response]") {
    SECTION("malformed body") {
        auto res = parse_response("{\"resource\":");
        REQUIRE(res.error_code == ErrorCode::MalformedJson);
    }

    SECTION("body without resource") {
        auto res = parse_response(R"({"other":1})");
        REQUIRE(res.error_code == ErrorCode::KeyNotFound);
    }

    SECTION("resource is decoded with tags") {
        auto res = parse_response(R"({"resource":{"object":{"when":{"@date":"2020-06-15"}}}})");
        REQUIRE(res);
        REQUIRE(res.value == Value::object({{"when", Value::date(2020, 6, 15)}}));
    }

    SECTION("expression that cannot be encoded never reaches the transport") {
        auto transport = respond_with(200, R"({"resource":1})");
        Client client{"secret", transport};
        auto res = client.query(Value{std::numeric_limits<double>::infinity()});
        REQUIRE(res.error_code == ErrorCode::UnsupportedValue);
        REQUIRE(transport->requests.empty());
    }
}

// ============================================================
// Batches and sessions
// ============================================================

TEST_CASE("batch_query sends one array and keeps order", "[client][batch]") {
    SECTION("success") {
        auto transport = respond_with(200, R"({"resource":[{"@ref":"classes/spells/1"},"Fire",10]})");
        Client client{"secret", transport};

        auto res = client.batch_query({Value::ref("classes/spells/1"), Value{"Fire"}, Value{10}});
        REQUIRE(res);
        REQUIRE(res.values.size() == 3);
        REQUIRE(res.values[0] == Value::ref("classes/spells/1"));
        REQUIRE(res.values[1] == Value{"Fire"});
        REQUIRE(res.values[2] == Value{10});
        REQUIRE(transport->requests.front().body == R"([{"@ref":"classes/spells/1"},"Fire",10])");
    }

    SECTION("resource that is not an array") {
        auto transport = respond_with(200, R"({"resource":"single"})");
        Client client{"secret", transport};
        auto res = client.batch_query({Value{1}});
        REQUIRE_FALSE(res);
        REQUIRE(res.error_code == ErrorCode::TypeMismatch);
        REQUIRE(res.values.empty());
    }

    SECTION("transport failure") {
        auto transport = respond_with(503, "");
        Client client{"secret", transport};
        auto res = client.batch_query({Value{1}});
        REQUIRE(res.error_code == ErrorCode::Unavailable);
        REQUIRE(res.category() == ErrorCategory::Transport);
    }
}

TEST_CASE("new_session_client shares endpoint and transport", "[client][session]") {
    auto transport = respond_with(200, R"({"resource":true})");
    ClientConfig config;
    config.endpoint = "http://localhost:8443";
    Client root{"root-secret", transport, config};

    Client session = root.new_session_client("session-secret");
    REQUIRE(session.config().endpoint == "http://localhost:8443");

    REQUIRE(root.query(Value{1}));
    REQUIRE(session.query(Value{1}));

    REQUIRE(transport->requests.size() == 2);
    REQUIRE(transport->requests[0].header("Authorization") == basic_auth("root-secret"));
    REQUIRE(transport->requests[1].header("Authorization") == basic_auth("session-secret"));
}
