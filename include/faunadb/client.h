// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file client.h
/// @brief Query client: one POST per query over a pluggable transport.
///
/// The client encodes the expression, attaches the authorization header,
/// hands the request to a Transport, and decodes the "resource" field of a
/// successful response. The HTTP stack itself lives behind Transport.
///
/// @code
///   auto transport = std::make_shared<MyHttpTransport>();
///   Client client{"secret", transport};
///
///   QueryResult res = client.query(Value::ref("classes/spells/181388642046968320"));
///   if (!res) {
///       std::cerr << res.error_message << "\n";
///   }
///
///   Client admin = client.new_session_client("admin-secret");  // shares transport
/// @endcode
///
/// Thread safety: a Client is immutable after construction; concurrent
/// queries are safe when the Transport's send() is.

#pragma once

#include "value.h"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace faunadb {

struct ClientConfig {
    std::string endpoint = "https://db.fauna.com";
    std::chrono::milliseconds timeout{60000};
};

struct HttpRequest {
    std::string method = "POST";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::milliseconds timeout{60000};

    /// First header with the given name, empty if absent
    [[nodiscard]] std::string_view header(std::string_view name) const {
        for (const auto& [key, value] : headers) {
            if (key == name) return value;
        }
        return {};
    }
};

struct HttpResponse {
    int status = 0;
    std::string body;
    std::string transport_error;    // Non-empty when no response was received
};

/// Sends one fully buffered request and returns the fully buffered response
class Transport {
public:
    virtual ~Transport() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

struct BatchQueryResult {
    std::vector<Value> values;
    bool success = false;
    ErrorCode error_code = ErrorCode::Success;
    std::string error_message;

    explicit operator bool() const noexcept { return success; }

    [[nodiscard]] ErrorCategory category() const noexcept { return error_category(error_code); }
};

class FAUNADB_API Client {
public:
    Client(std::string_view secret, std::shared_ptr<Transport> transport, ClientConfig config = {});

    /// Send one query expression
    [[nodiscard]] QueryResult query(const Value& expr) const;

    /// Send several expressions in one request; results keep request order
    [[nodiscard]] BatchQueryResult batch_query(const std::vector<Value>& exprs) const;

    /// Client with another secret sharing this client's endpoint and transport
    [[nodiscard]] Client new_session_client(std::string_view secret) const;

    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] HttpRequest prepare_request(std::string body) const;

    std::string basic_auth_;
    ClientConfig config_;
    std::shared_ptr<Transport> transport_;
};

/// Value of the Authorization header for a secret
[[nodiscard]] FAUNADB_API std::string basic_auth(std::string_view secret);

/// Error code for a non-2xx HTTP status
[[nodiscard]] FAUNADB_API ErrorCode error_code_for_status(int status) noexcept;

/// Parse a successful response body and extract its "resource" field
[[nodiscard]] FAUNADB_API QueryResult parse_response(std::string_view body);

} // namespace faunadb
