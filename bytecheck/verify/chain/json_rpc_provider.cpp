// Copyright 2025 The Bytecheck Authors
// SPDX-License-Identifier: Apache-2.0

#include "json_rpc_provider.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>

#include <bytecheck/core/common/base.hpp>
#include <bytecheck/core/common/util.hpp>
#include <bytecheck/core/types/address.hpp>
#include <bytecheck/infra/common/log.hpp>

namespace bytecheck::verify {

namespace http = boost::beast::http;
using boost::asio::ip::tcp;

static constexpr std::string_view kJsonVersion{"2.0"};
static constexpr std::string_view kHttpScheme{"http://"};
static constexpr uint64_t kMaxResponseSize{512 * kMebi};  // callTracer results of large deployments
static constexpr int64_t kParseErrorCode{-32700};
static constexpr int64_t kInternalErrorCode{-32603};

RpcError::RpcError(int64_t code, const std::string& message)
    : std::runtime_error{absl::StrCat("JSON-RPC error ", code, ": ", message)}, code_{code} {}

std::optional<RpcEndpoint> parse_rpc_endpoint(std::string_view url) {
    if (!absl::StartsWithIgnoreCase(url, kHttpScheme)) {
        return std::nullopt;
    }
    url.remove_prefix(kHttpScheme.size());

    RpcEndpoint endpoint;
    const auto slash{url.find('/')};
    if (slash != std::string_view::npos) {
        endpoint.target = std::string{url.substr(slash)};
        url = url.substr(0, slash);
    }
    const auto colon{url.rfind(':')};
    if (colon != std::string_view::npos) {
        const std::string_view port{url.substr(colon + 1)};
        if (port.empty() || port.size() > 5 ||
            !std::all_of(port.begin(), port.end(), [](char c) { return absl::ascii_isdigit(static_cast<unsigned char>(c)); })) {
            return std::nullopt;
        }
        endpoint.port = std::string{port};
        url = url.substr(0, colon);
    }
    if (url.empty()) {
        return std::nullopt;
    }
    endpoint.host = std::string{url};
    return endpoint;
}

nlohmann::json make_json_request(uint32_t id, std::string_view method, nlohmann::json params) {
    return {{"jsonrpc", std::string{kJsonVersion}}, {"id", id}, {"method", std::string{method}}, {"params", std::move(params)}};
}

nlohmann::json parse_json_response(std::string_view body, uint32_t id) {
    auto response = nlohmann::json::parse(body, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (response.is_discarded() || !response.is_object()) {
        throw RpcError{kParseErrorCode, absl::StrCat("invalid response body: ", abridge(body, 256))};
    }
    if (response.contains("error") && !response["error"].is_null()) {
        const auto& error{response["error"]};
        const int64_t code{error.contains("code") && error["code"].is_number_integer() ? error["code"].get<int64_t>()
                                                                                        : kInternalErrorCode};
        const std::string message{error.contains("message") && error["message"].is_string()
                                      ? error["message"].get<std::string>()
                                      : error.dump()};
        throw RpcError{code, message};
    }
    if (!response.contains("id") || response["id"] != id) {
        throw RpcError{kInternalErrorCode, absl::StrCat("response id mismatch, expected ", id)};
    }
    if (!response.contains("result")) {
        throw RpcError{kInternalErrorCode, "response without result"};
    }
    return std::move(response["result"]);
}

JsonRpcProvider::JsonRpcProvider(RpcEndpoint endpoint, std::chrono::milliseconds timeout)
    : endpoint_{std::move(endpoint)}, timeout_{timeout} {}

nlohmann::json JsonRpcProvider::call(std::string_view method, nlohmann::json params) {
    const uint32_t id{next_id_++};
    const auto request = make_json_request(id, method, std::move(params));
    BYTECHECK_TRACE << "JsonRpcProvider::call request: " << request.dump();
    const std::string response_body{post(request.dump())};
    BYTECHECK_TRACE << "JsonRpcProvider::call response: " << abridge(response_body, 1024);
    return parse_json_response(response_body, id);
}

std::string JsonRpcProvider::post(const std::string& body) {
    boost::asio::io_context ioc;
    tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};

    stream.expires_after(timeout_);
    stream.connect(resolver.resolve(endpoint_.host, endpoint_.port));

    http::request<http::string_body> request{http::verb::post, endpoint_.target, 11};
    request.set(http::field::host, endpoint_.host);
    request.set(http::field::user_agent, "bytecheck");
    request.set(http::field::content_type, "application/json");
    request.body() = body;
    request.prepare_payload();
    http::write(stream, request);

    boost::beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxResponseSize);
    http::read(stream, buffer, parser);

    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::beast::errc::not_connected) {
        BYTECHECK_DEBUG << "JsonRpcProvider::post shutdown error: " << ec.message();
    }

    auto response{parser.release()};
    if (response.result() != http::status::ok) {
        throw RpcError{static_cast<int64_t>(response.result_int()),
                       absl::StrCat("HTTP status ", response.result_int(), " from ", endpoint_.host)};
    }
    return std::move(response.body());
}

Bytes JsonRpcProvider::code_at(const evmc::address& address) {
    const auto result = call("eth_getCode", nlohmann::json::array({address_to_hex(address), "latest"}));
    auto code{result.is_string() ? from_hex(result.get<std::string>()) : std::nullopt};
    if (!code) {
        throw RpcError{kInternalErrorCode, absl::StrCat("invalid eth_getCode result: ", abridge(result.dump(), 64))};
    }
    return std::move(*code);
}

template <typename T>
static std::optional<T> decode_result(const nlohmann::json& result, std::string_view method) {
    if (result.is_null()) {
        return std::nullopt;
    }
    try {
        return result.get<T>();
    } catch (const std::system_error& se) {
        throw RpcError{kInternalErrorCode, absl::StrCat("invalid ", method, " result: ", se.what())};
    } catch (const nlohmann::json::exception& je) {
        throw RpcError{kInternalErrorCode, absl::StrCat("invalid ", method, " result: ", je.what())};
    }
}

std::optional<Transaction> JsonRpcProvider::transaction(const evmc::bytes32& tx_hash) {
    const auto result = call("eth_getTransactionByHash", nlohmann::json::array({to_hex(tx_hash, /*with_prefix=*/true)}));
    return decode_result<Transaction>(result, "eth_getTransactionByHash");
}

std::optional<TransactionReceipt> JsonRpcProvider::receipt(const evmc::bytes32& tx_hash) {
    const auto result = call("eth_getTransactionReceipt", nlohmann::json::array({to_hex(tx_hash, /*with_prefix=*/true)}));
    return decode_result<TransactionReceipt>(result, "eth_getTransactionReceipt");
}

nlohmann::json JsonRpcProvider::debug_trace(const evmc::bytes32& tx_hash) {
    const nlohmann::json tracer_config{{"tracer", "callTracer"}};
    return call("debug_traceTransaction", nlohmann::json::array({to_hex(tx_hash, /*with_prefix=*/true), tracer_config}));
}

}  // namespace bytecheck::verify
