/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <functional>
#include <optional>
#include <string>
#ifdef __clang__
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT 1
#ifndef BOOST_ALLOW_DEPRECATED_HEADERS
#   define BOOST_ALLOW_DEPRECATED_HEADERS
#   define EC_CLEAR_BOOST_DEPRECATED_HEADERS
#endif
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#ifdef EC_CLEAR_BOOST_DEPRECATED_HEADERS
#   undef BOOST_ALLOW_DEPRECATED_HEADERS
#   undef EC_CLEAR_BOOST_DEPRECATED_HEADERS
#endif
#ifdef __clang__
#   pragma GCC diagnostic pop
#endif
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/url.hpp>
#include <ec/base64.hpp>
#include <ec/ledger/rpc-reader.hpp>
#include <ec/logger.hpp>

namespace evore_crank::ledger {
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;
    using tcp = boost::asio::ip::tcp;

    struct rpc_reader::impl {
        static constexpr size_t max_response_size = 256 << 20;

        impl(const std::string &url, const std::chrono::milliseconds timeout):
            _url { url }, _timeout { timeout }
        {
            const auto uri = boost::urls::parse_uri(url);
            if (!uri)
                throw configuration_error(fmt::format("not a valid RPC url: {}", url));
            if (uri->scheme() != "http")
                throw configuration_error(fmt::format("only http RPC urls are supported but got {}", url));
            _host = uri->host();
            if (_host.empty())
                throw configuration_error(fmt::format("an RPC url must have a host: {}", url));
            _port = uri->port().empty() ? "80" : std::string { uri->port() };
            _target = uri->encoded_target().empty() ? "/" : std::string { uri->encoded_target() };
            if (_timeout.count() <= 0)
                throw configuration_error(fmt::format("the RPC timeout must be positive but got {}", _timeout));
        }

        ~impl()
        {
            _close();
        }

        json::value call(const std::string_view method, json::array params)
        {
            const auto req_id = ++_next_id;
            const json::object req {
                { "jsonrpc", "2.0" },
                { "id", req_id },
                { "method", method },
                { "params", std::move(params) }
            };
            const auto body = _post(json::serialize(req), method);
            json::value resp {};
            try {
                resp = json::parse(buffer { body });
            } catch (const std::exception &ex) {
                throw ledger_unavailable(fmt::format("{}: the response is not valid JSON", method), ex);
            }
            const auto *resp_obj = resp.if_object();
            if (!resp_obj)
                throw ledger_unavailable(fmt::format("{}: the response is not a JSON object", method));
            if (const auto *err = resp_obj->if_contains("error"); err && !err->is_null()) {
                const auto err_str = json::serialize(*err);
                if (method == "sendTransaction")
                    throw submit_rejected(fmt::format("{} rejected: {}", method, err_str));
                throw ledger_unavailable(fmt::format("{} failed: {}", method, err_str));
            }
            const auto *res = resp_obj->if_contains("result");
            if (!res)
                throw ledger_unavailable(fmt::format("{}: the response has no result", method));
            return *res;
        }
    private:
        const std::string _url;
        const std::chrono::milliseconds _timeout;
        std::string _host {};
        std::string _port {};
        std::string _target {};
        uint64_t _next_id = 0;
        net::io_context _ioc {};
        tcp::resolver _resolver { _ioc };
        std::optional<tcp::resolver::results_type> _endpoints {};
        std::optional<beast::tcp_stream> _stream {};
        beast::flat_buffer _buffer {};

        void _close()
        {
            if (_stream) {
                beast::error_code ec {};
                _stream->socket().shutdown(tcp::socket::shutdown_both, ec);
                _stream->close();
                _stream.reset();
            }
        }

        // Runs the pending asynchronous operation so that the stream's expiry timer can cancel it.
        void _run_io()
        {
            _ioc.restart();
            _ioc.run();
        }

        void _connect()
        {
            if (!_endpoints) {
                beast::error_code ec {};
                auto res = _resolver.resolve(_host, _port, ec);
                if (ec)
                    throw ledger_unavailable(fmt::format("failed to resolve {}:{}: {}", _host, _port, ec.message()));
                _endpoints.emplace(std::move(res));
            }
            logger::trace("connecting to {}:{}", _host, _port);
            _stream.emplace(_ioc);
            beast::error_code ec {};
            _stream->expires_after(_timeout);
            _stream->async_connect(*_endpoints, [&](const beast::error_code &e, const tcp::endpoint &) { ec = e; });
            _run_io();
            if (ec) {
                _close();
                _endpoints.reset();
                throw ledger_unavailable(fmt::format("failed to connect to {}:{}: {}", _host, _port, ec.message()));
            }
        }

        std::string _exchange(const std::string &body)
        {
            http::request<http::string_body> req { http::verb::post, _target, 11 };
            req.set(http::field::host, _host);
            req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
            req.set(http::field::content_type, "application/json");
            req.keep_alive(true);
            req.body() = body;
            req.prepare_payload();

            beast::error_code ec {};
            _stream->expires_after(_timeout);
            http::async_write(*_stream, req, [&](const beast::error_code &e, size_t) { ec = e; });
            _run_io();
            if (ec)
                throw beast::system_error { ec };

            http::response_parser<http::string_body> parser {};
            parser.body_limit(max_response_size);
            _buffer.clear();
            _stream->expires_after(_timeout);
            http::async_read(*_stream, _buffer, parser, [&](const beast::error_code &e, size_t) { ec = e; });
            _run_io();
            if (ec)
                throw beast::system_error { ec };
            if (!parser.keep_alive()) {
                logger::debug("{}: the server turns down keep-alive, closing the connection", _url);
                _close();
            }
            auto resp = parser.release();
            if (resp.result() != http::status::ok)
                throw ledger_unavailable(fmt::format("{}: bad http status: {}", _url, resp.result_int()));
            return std::move(resp.body());
        }

        std::string _post(const std::string &body, const std::string_view method)
        {
            // a reused keep-alive connection may have been dropped by the server, so such requests are retried once
            for (size_t attempt = 0; ; ++attempt) {
                const bool reused = static_cast<bool>(_stream);
                if (!_stream)
                    _connect();
                try {
                    return _exchange(body);
                } catch (const beast::system_error &ex) {
                    _close();
                    if (!reused || attempt > 0)
                        throw ledger_unavailable(fmt::format("{}: {}", method, ex.code().message()));
                    logger::debug("{}: retrying {} on a fresh connection after: {}", _url, method, ex.code().message());
                }
            }
        }
    };

    optional_account parse_account(const json::value &j)
    {
        if (j.is_null())
            return {};
        const auto &obj = j.as_object();
        const auto &data = obj.at("data").as_array();
        if (data.size() != 2 || json::as_sv(data.at(1)) != "base64")
            throw error(fmt::format("unsupported account data encoding: {}", json::serialize(obj.at("data"))));
        return account_info {
            json::as_u64(obj.at("lamports")),
            pubkey::from_base58(json::as_sv(obj.at("owner"))),
            base64::decode(json::as_sv(data.at(0)))
        };
    }

    confirmation_status parse_signature_status(const json::value &j)
    {
        if (j.is_null())
            return confirmation_status::pending;
        const auto &obj = j.as_object();
        if (const auto *err = obj.if_contains("err"); err && !err->is_null())
            return confirmation_status::failed;
        if (const auto *status = obj.if_contains("confirmationStatus"); status && status->is_string()) {
            const auto sv = json::as_sv(*status);
            if (sv == "confirmed" || sv == "finalized")
                return confirmation_status::confirmed;
        }
        return confirmation_status::pending;
    }

    namespace {
        json::object account_config()
        {
            return json::object {
                { "encoding", "base64" },
                { "commitment", rpc_reader::commitment }
            };
        }

        // Converts malformed responses into ledger_unavailable so that callers see a single failure kind.
        template<typename T>
        T parse_response(const std::string_view method, const std::function<T()> &action)
        {
            try {
                return action();
            } catch (const ledger_unavailable &) {
                throw;
            } catch (const std::exception &ex) {
                throw ledger_unavailable(fmt::format("{}: malformed response", method), ex);
            }
        }
    }

    rpc_reader::rpc_reader(const std::string &url, const std::chrono::milliseconds timeout):
        _impl { std::make_unique<impl>(url, timeout) }
    {
    }

    rpc_reader::~rpc_reader() =default;

    json::value rpc_reader::call(const std::string_view method, json::array params)
    {
        return _impl->call(method, std::move(params));
    }

    uint64_t rpc_reader::_get_slot_impl()
    {
        const auto res = call("getSlot", json::array { json::object { { "commitment", commitment } } });
        return parse_response<uint64_t>("getSlot", [&] { return json::as_u64(res); });
    }

    optional_account rpc_reader::_get_account_impl(const pubkey &addr)
    {
        const auto res = call("getAccountInfo", json::array { addr.to_base58(), account_config() });
        return parse_response<optional_account>("getAccountInfo", [&] { return parse_account(res.as_object().at("value")); });
    }

    vector<optional_account> rpc_reader::_get_accounts_impl(const pubkey_list &addrs)
    {
        json::array j_addrs {};
        for (const auto &addr: addrs)
            j_addrs.emplace_back(addr.to_base58());
        const auto res = call("getMultipleAccounts", json::array { std::move(j_addrs), account_config() });
        return parse_response<vector<optional_account>>("getMultipleAccounts", [&] {
            vector<optional_account> accs {};
            for (const auto &j_acc: res.as_object().at("value").as_array())
                accs.emplace_back(parse_account(j_acc));
            return accs;
        });
    }

    vector<keyed_account> rpc_reader::_get_program_accounts_impl(const pubkey &program, const filter_list &filters)
    {
        json::array j_filters {};
        for (const auto &f: filters) {
            j_filters.emplace_back(json::object {
                { "memcmp", json::object {
                    { "offset", f.offset },
                    { "bytes", base58::encode(f.bytes) }
                } }
            });
        }
        auto cfg = account_config();
        cfg.emplace("filters", std::move(j_filters));
        const auto res = call("getProgramAccounts", json::array { program.to_base58(), std::move(cfg) });
        return parse_response<vector<keyed_account>>("getProgramAccounts", [&] {
            vector<keyed_account> accs {};
            for (const auto &j_item: res.as_array()) {
                const auto &item = j_item.as_object();
                auto acc = parse_account(item.at("account"));
                if (!acc)
                    throw error("getProgramAccounts returned an empty account");
                accs.emplace_back(keyed_account { pubkey::from_base58(json::as_sv(item.at("pubkey"))), std::move(*acc) });
            }
            return accs;
        });
    }

    blockhash_info rpc_reader::_latest_blockhash_impl()
    {
        const auto res = call("getLatestBlockhash", json::array { json::object { { "commitment", commitment } } });
        return parse_response<blockhash_info>("getLatestBlockhash", [&] {
            const auto &val = res.as_object().at("value").as_object();
            return blockhash_info {
                blockhash::from_base58(json::as_sv(val.at("blockhash"))),
                json::as_u64(val.at("lastValidBlockHeight"))
            };
        });
    }

    signature rpc_reader::_submit_transaction_impl(const buffer &tx_bytes)
    {
        const auto res = call("sendTransaction", json::array {
            base64::encode(tx_bytes),
            json::object {
                { "encoding", "base64" },
                { "skipPreflight", true },
                { "preflightCommitment", commitment }
            }
        });
        return parse_response<signature>("sendTransaction", [&] { return signature::from_base58(json::as_sv(res)); });
    }

    confirmation_status rpc_reader::_confirm_transaction_impl(const signature &sig)
    {
        const auto res = call("getSignatureStatuses", json::array {
            json::array { sig.to_base58() },
            json::object { { "searchTransactionHistory", false } }
        });
        return parse_response<confirmation_status>("getSignatureStatuses", [&] {
            const auto &vals = res.as_object().at("value").as_array();
            if (vals.size() != 1)
                throw error(fmt::format("expected one signature status but got {}", vals.size()));
            return parse_signature_status(vals.at(0));
        });
    }
}
