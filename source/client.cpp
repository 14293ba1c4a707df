// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file client.cpp
/// @brief Query client: request preparation, status mapping, response decoding.

#include <faunadb/client.h>
#include <faunadb/builders.h>
#include <faunadb/codec.h>
#include <faunadb/decode.h>
#include <faunadb/field.h>

namespace faunadb {

namespace {

constexpr std::string_view content_type = "application/json; charset=utf-8";

/// Longest response body excerpt carried in an error message
constexpr std::size_t max_body_excerpt = 256;

std::string base64_encode(std::string_view input)
{
    static constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve((input.size() + 2) / 3 * 4);

    std::size_t i = 0;
    for (; i + 3 <= input.size(); i += 3) {
        const auto n = (static_cast<unsigned>(static_cast<unsigned char>(input[i])) << 16) |
                       (static_cast<unsigned>(static_cast<unsigned char>(input[i + 1])) << 8) |
                       static_cast<unsigned>(static_cast<unsigned char>(input[i + 2]));
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        out += alphabet[n & 0x3F];
    }

    const std::size_t rest = input.size() - i;
    if (rest == 1) {
        const auto n = static_cast<unsigned>(static_cast<unsigned char>(input[i])) << 16;
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const auto n = (static_cast<unsigned>(static_cast<unsigned char>(input[i])) << 16) |
                       (static_cast<unsigned>(static_cast<unsigned char>(input[i + 1])) << 8);
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::string body_excerpt(std::string_view body)
{
    if (body.size() <= max_body_excerpt) {
        return std::string{body};
    }
    return std::string{body.substr(0, max_body_excerpt)} + "...";
}

} // anonymous namespace

std::string basic_auth(std::string_view secret)
{
    // The secret is the user name with an empty password
    return "Basic " + base64_encode(secret) + ":";
}

ErrorCode error_code_for_status(int status) noexcept
{
    switch (status) {
        case 400: return ErrorCode::BadRequest;
        case 401: return ErrorCode::Unauthorized;
        case 403: return ErrorCode::PermissionDenied;
        case 404: return ErrorCode::NotFound;
        case 500: return ErrorCode::InternalError;
        case 503: return ErrorCode::Unavailable;
        default:  return ErrorCode::UnknownStatus;
    }
}

QueryResult parse_response(std::string_view body)
{
    ParseResult parsed = parse_json(body);
    if (!parsed) {
        return parsed;
    }

    FieldValue resource = parsed.value.at(obj_key("resource"));
    if (!resource) {
        return QueryResult::failure(resource.error_code, resource.error_message);
    }
    return QueryResult::ok(std::move(resource.value));
}

Client::Client(std::string_view secret, std::shared_ptr<Transport> transport, ClientConfig config)
    : basic_auth_(basic_auth(secret))
    , config_(std::move(config))
    , transport_(std::move(transport))
{
}

HttpRequest Client::prepare_request(std::string body) const
{
    HttpRequest request;
    request.method = "POST";
    request.url = config_.endpoint;
    request.headers.emplace_back("Authorization", basic_auth_);
    request.headers.emplace_back("Content-Type", std::string{content_type});
    request.body = std::move(body);
    request.timeout = config_.timeout;
    return request;
}

QueryResult Client::query(const Value& expr) const
{
    if (!transport_) {
        detail::log_error("Client::query", ErrorCode::TransportFailure, "no transport configured");
        return QueryResult::failure(ErrorCode::TransportFailure, "no transport configured");
    }

    EncodeResult encoded = encode(expr);
    if (!encoded) {
        return QueryResult::failure(encoded.error_code, encoded.error_message);
    }

    HttpResponse response = transport_->send(prepare_request(std::move(encoded.json)));

    if (!response.transport_error.empty()) {
        detail::log_error("Client::query", ErrorCode::TransportFailure, response.transport_error);
        return QueryResult::failure(ErrorCode::TransportFailure, response.transport_error);
    }

    if (response.status < 200 || response.status > 299) {
        const ErrorCode code = error_code_for_status(response.status);
        std::string message = "HTTP status " + std::to_string(response.status);
        if (!response.body.empty()) {
            message += ": " + body_excerpt(response.body);
        }
        detail::log_error("Client::query", code, message);
        return QueryResult::failure(code, std::move(message));
    }

    return parse_response(response.body);
}

BatchQueryResult Client::batch_query(const std::vector<Value>& exprs) const
{
    BatchQueryResult result;

    ArrayBuilder batch;
    for (const auto& expr : exprs) {
        batch.push_back(expr);
    }

    QueryResult response = query(batch.finish());
    if (!response) {
        result.error_code = response.error_code;
        result.error_message = std::move(response.error_message);
        return result;
    }

    Status decoded = response.value.get(result.values);
    if (!decoded) {
        result.values.clear();
        result.error_code = decoded.error_code;
        result.error_message = std::move(decoded.error_message);
        return result;
    }

    result.success = true;
    return result;
}

Client Client::new_session_client(std::string_view secret) const
{
    return Client{secret, transport_, config_};
}

} // namespace faunadb
