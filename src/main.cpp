//
// main.cpp: uno_arbiterd, HTTP decision service and bridge endpoint on WebSocket++
//

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <random>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Arbiter.hpp"
#include "core/ClassicRules.hpp"
#include "debug/AuditLogger.hpp"
#include "net/DecisionService.hpp"
#include "net/RemoteProposer.hpp"
#include "net/codec.hpp"
#include "proposer/ProposerRegistry.hpp"

namespace
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    struct CmdLine
    {
        std::uint16_t port{8000};
        std::size_t retries{uno::core::constants::DefaultRetryBudget};
        std::uint32_t timeout_ms{15000};
        std::uint64_t seed{std::random_device{}()};
        std::optional<std::string> audit;
    };

    CmdLine parse_args(int argc, char** argv)
    {
        CmdLine c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string key = argv[i];
            bool const has_value = i + 1 < argc;
            if (key == "--port" && has_value)
            {
                c.port = static_cast<std::uint16_t>(std::strtoul(argv[++i], nullptr, 10));
            }
            else if (key == "--retries" && has_value)
            {
                c.retries = static_cast<std::size_t>(std::strtoull(argv[++i], nullptr, 10));
            }
            else if (key == "--timeout_ms" && has_value)
            {
                c.timeout_ms = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
            }
            else if (key == "--seed" && has_value)
            {
                c.seed = std::strtoull(argv[++i], nullptr, 10);
            }
            else if (key == "--audit" && has_value)
            {
                c.audit = argv[++i];
            }
            else
            {
                std::print("[Server] Ignoring unknown argument '{}'\n", key);
            }
        }
        return c;
    }

    // One connected bridge, keyed by its connection handle
    struct BridgeConn
    {
        std::shared_ptr<uno::net::BridgeChannel> chan;
        std::string provider;
        std::string owner;
    };
} // anon

int main(int argc, char** argv)
{
    CmdLine cfg = parse_args(argc, argv);
    std::print("[Server] Booting on port {} | retries={} timeout={}ms seed={}\n",
               cfg.port, cfg.retries, cfg.timeout_ms, cfg.seed);

    uno::core::Config ecfg{};
    ecfg.retry_budget = cfg.retries;
    ecfg.attempt_timeout = std::chrono::milliseconds(cfg.timeout_ms);
    ecfg.seed = cfg.seed;

    uno::core::Arbiter arbiter(ecfg, std::make_unique<uno::core::ClassicRules>());
    uno::proposer::ProposerRegistry registry;
    uno::proposer::RegisterBuiltins(registry, cfg.seed);

    std::unique_ptr<uno::core::debug::AuditLogger> audit;
    if (cfg.audit)
    {
        audit = std::make_unique<uno::core::debug::AuditLogger>(*cfg.audit);
        if (!audit->IsOpen())
        {
            std::print("[Server] Cannot open audit log {}\n", *cfg.audit);
            return 2;
        }
        std::print("[Server] Writing decision transcripts to {}\n", *cfg.audit);
    }

    uno::net::DecisionService service(arbiter, registry, audit.get());

    WsServer server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.set_access_channels(websocketpp::log::alevel::connect |
                               websocketpp::log::alevel::disconnect);
    server.init_asio();
    server.set_reuse_addr(true);

    std::mutex bridges_mx;
    std::map<Hdl, BridgeConn, std::owner_less<Hdl>> bridges;
    std::uint64_t next_bridge = 0;

    // Decisions can wait on a bridge reply, which arrives on the network thread: never block it.
    server.set_http_handler([&](Hdl hdl)
    {
        WsServer::connection_ptr con = server.get_con_from_hdl(hdl);
        std::string method = con->get_request().get_method();
        std::string resource = con->get_resource();
        std::string body = con->get_request_body();

        websocketpp::lib::error_code ec = con->defer_http_response();
        if (ec)
        {
            std::print("[Server] defer_http_response failed: {}\n", ec.message());
            return;
        }

        std::thread worker([&service, con, method = std::move(method), resource = std::move(resource),
                            body = std::move(body)]()
        {
            uno::net::HttpResponse const res = service.Handle(method, resource, body);
            std::print("[Server] {} {} -> {}\n", method, resource, res.status);
            con->set_status(static_cast<websocketpp::http::status_code::value>(res.status));
            con->replace_header("Content-Type", "application/json");
            con->set_body(res.body);
            websocketpp::lib::error_code send_ec = con->send_http_response();
            if (send_ec)
            {
                std::print("[Server] send_http_response failed: {}\n", send_ec.message());
            }
        });
        worker.detach();
    });

    server.set_close_handler([&](Hdl hdl)
    {
        std::optional<BridgeConn> gone;
        {
            std::lock_guard<std::mutex> g(bridges_mx);
            auto it = bridges.find(hdl);
            if (it != bridges.end())
            {
                gone = std::move(it->second);
                bridges.erase(it);
            }
        }
        if (gone.has_value())
        {
            gone->chan->Close();
            // a refused or replaced claim leaves the current holder in place
            registry.RemoveProvider(gone->provider, gone->owner);
            std::print("[Server] Bridge '{}' disconnected\n", gone->provider);
        }
    });

    server.set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        // Only binary frames are valid
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[Server] Ignoring non-binary frame from bridge\n");
            return;
        }

        std::string const& payload = msg->get_payload();
        std::vector<std::uint8_t> bytes(reinterpret_cast<const std::uint8_t*>(payload.data()),
                                        reinterpret_cast<const std::uint8_t*>(payload.data()) + payload.size());

        {
            std::lock_guard<std::mutex> g(bridges_mx);
            auto it = bridges.find(hdl);
            if (it != bridges.end())
            {
                it->second.chan->Enqueue(std::move(bytes));
                return;
            }
        }

        auto send_violation = [&](std::string const& text)
        {
            flatbuffers::DetachedBuffer const buf =
                uno::net::BuildViolation(0, uno::net::ProtocolViolationCode, text);
            websocketpp::lib::error_code ec;
            server.send(hdl, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
            if (ec)
            {
                std::print("[Server] send() error: {}\n", ec.message());
            }
        };

        // First frame of a connection must announce the bridge
        auto const decoded = uno::net::DecodeEnvelope(uno::net::AsBytes(bytes));
        if (!decoded.has_value())
        {
            std::print("[Server] Bad frame from unannounced bridge: {}\n", decoded.error().message);
            send_violation(decoded.error().message);
            return;
        }
        auto const* hello = std::get_if<uno::net::HelloMsg>(&decoded.value());
        if (!hello)
        {
            send_violation("expected Hello");
            return;
        }

        auto chan = std::make_shared<uno::net::BridgeChannel>(
            [&server, hdl](std::span<std::uint8_t const> out) -> bool
            {
                websocketpp::lib::error_code ec;
                server.send(hdl, out.data(), out.size(), websocketpp::frame::opcode::binary, ec);
                if (ec)
                {
                    std::print("[Server] send() error: {}\n", ec.message());
                }
                return !ec;
            });
        // every model of this provider shares the one connection
        auto proposer = std::make_shared<uno::net::RemoteProposer>(chan);

        std::string owner;
        {
            std::lock_guard<std::mutex> g(bridges_mx);
            owner = std::format("bridge#{}", ++next_bridge);
        }
        std::string const model = hello->model.empty() ? std::string("default") : hello->model;
        bool const claimed = registry.ClaimProvider(uno::proposer::ProviderInfo{
            .name = hello->provider,
            .description = "Remote bridge",
            .default_model = model,
            .supported_models = {model},
            .factory = [proposer](std::string const&, std::optional<std::string> const&)
                -> std::shared_ptr<uno::core::MoveProposer>
            {
                return proposer;
            },
            .owner = owner});
        if (!claimed)
        {
            send_violation(std::format("provider '{}' is already registered", hello->provider));
            return;
        }
        {
            std::lock_guard<std::mutex> g(bridges_mx);
            bridges[hdl] = BridgeConn{chan, hello->provider, owner};
        }
        std::print("[Server] Bridge '{}' connected (model {})\n", hello->provider, model);
    });

    websocketpp::lib::error_code listen_ec;
    server.listen(cfg.port, listen_ec);
    if (listen_ec)
    {
        std::print("[Server] listen failed: {}\n", listen_ec.message());
        return 2;
    }
    server.start_accept();
    std::print("[Server] Ready\n");

    server.run();
    return 0;
}
