//
// BridgeClientMain.cpp
//
// Headless bridge. Connects to uno_arbiterd, announces itself as a provider,
// then answers every ProposalRequest with a locally chosen move.
//

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <print>
#include <span>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include "core/Proposer.hpp"
#include "core/State.hpp"
#include "net/JsonCodec.hpp"
#include "net/codec.hpp"
#include "proposer/FirstLegalProposer.hpp"
#include "proposer/RandomProposer.hpp"

namespace
{
    using WsClient = websocketpp::client<websocketpp::config::asio_client>;

    struct CmdLine
    {
        std::string url{"ws://127.0.0.1:8000"};
        std::string provider{"bridge"};
        std::string model{"first-legal"};
        std::string strategy{"first-legal"};
        std::uint64_t seed{424242ULL};
        std::uint32_t think_ms{800};
        // reply with raw JSON text instead of a structured move
        bool text{false};
    };

    CmdLine parse_args(int argc, char** argv)
    {
        CmdLine c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string k = argv[i];
            if (k == "--url" && i + 1 < argc)
            {
                c.url = argv[++i];
            }
            else if (k == "--provider" && i + 1 < argc)
            {
                c.provider = argv[++i];
            }
            else if (k == "--model" && i + 1 < argc)
            {
                c.model = argv[++i];
            }
            else if (k == "--strategy" && i + 1 < argc)
            {
                c.strategy = argv[++i];
            }
            else if (k == "--seed" && i + 1 < argc)
            {
                c.seed = std::strtoull(argv[++i], nullptr, 10);
            }
            else if (k == "--think_ms" && i + 1 < argc)
            {
                c.think_ms = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
            }
            else if (k == "--text")
            {
                c.text = true;
            }
        }
        return c;
    }

    std::unique_ptr<uno::core::MoveProposer> make_strategy(CmdLine const& cfg)
    {
        if (cfg.strategy == "random")
        {
            return std::make_unique<uno::proposer::RandomProposer>(cfg.seed);
        }
        if (cfg.strategy != "first-legal")
        {
            std::print("[Bridge] Unknown strategy '{}', using first-legal\n", cfg.strategy);
        }
        return std::make_unique<uno::proposer::FirstLegalProposer>();
    }

    // Answer one request with whatever the local strategy produced
    flatbuffers::DetachedBuffer answer(uno::net::RequestMsg const& req,
                                       uno::core::MoveProposer& strategy,
                                       CmdLine const& cfg)
    {
        auto const snapshot = std::make_shared<uno::core::GameSnapshot const>(req.view);
        auto const deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(cfg.think_ms);

        if (req.kind == uno::net::RequestKind::Analysis)
        {
            uno::core::Consultation const c = strategy.Consult(snapshot, deadline);
            if (!c.has_value())
            {
                return uno::net::BuildReply_Failure(req.msg_id, c.error());
            }
            return uno::net::BuildReply_Text(req.msg_id, c.value());
        }

        uno::core::Proposal const p = strategy.Propose(snapshot, deadline);
        if (!p.has_value())
        {
            return uno::net::BuildReply_Failure(req.msg_id, p.error());
        }
        if (cfg.text)
        {
            return uno::net::BuildReply_Text(req.msg_id, uno::net::Dump(uno::net::MoveToJson(p.value())));
        }
        return uno::net::BuildReply_Move(req.msg_id, p.value());
    }
} // anon

int main(int argc, char** argv)
{
    CmdLine cfg = parse_args(argc, argv);
    std::print("[Bridge] Connecting to {} as '{}' ({}) | strategy={} seed={}\n",
               cfg.url, cfg.provider, cfg.model, cfg.strategy, cfg.seed);

    std::unique_ptr<uno::core::MoveProposer> strategy = make_strategy(cfg);

    WsClient c;
    c.clear_access_channels(websocketpp::log::alevel::all);
    c.init_asio();

    std::atomic<std::uint64_t> answered{0};

    auto send_bytes = [&](websocketpp::connection_hdl hdl, flatbuffers::DetachedBuffer const& buf)
    {
        websocketpp::lib::error_code ec;
        c.send(hdl, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
        if (ec)
        {
            std::print("[Bridge] send() failed: {}\n", ec.message());
            return false;
        }
        return true;
    };

    c.set_message_handler([&](websocketpp::connection_hdl hdl, WsClient::message_ptr msg)
    {
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[Bridge] Ignoring non-binary frame\n");
            return;
        }

        std::string const& pl = msg->get_payload();
        std::span<std::uint8_t const> bytes(reinterpret_cast<const std::uint8_t*>(pl.data()), pl.size());

        auto decoded = uno::net::DecodeEnvelope(uno::net::AsBytes(bytes));
        if (!decoded.has_value())
        {
            std::print("[Bridge] Bad frame: {}\n", decoded.error().message);
            return;
        }

        std::visit([&](auto const& m)
        {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, uno::net::RequestMsg>)
            {
                std::print("[Bridge] Request #{} ({}) hand={} pending={}\n",
                           m.msg_id,
                           m.kind == uno::net::RequestKind::Move ? "move" : "analysis",
                           m.view.my_hand.size(), m.view.pending_draw);
                if (send_bytes(hdl, answer(m, *strategy, cfg)))
                {
                    ++answered;
                }
            }
            else if constexpr (std::is_same_v<T, uno::net::ViolationMsg>)
            {
                std::print("[Bridge] Server reported violation #{} (code {}): {}\n", m.msg_id, m.code, m.text);
            }
            else
            {
                std::print("[Bridge] Unexpected message ignored\n");
            }
        }, decoded.value());
    });

    c.set_open_handler([&](websocketpp::connection_hdl hdl)
    {
        std::print("[Bridge] Connected.\n");
        send_bytes(hdl, uno::net::BuildHello(cfg.provider, cfg.model));
    });

    c.set_close_handler([&](websocketpp::connection_hdl)
    {
        std::print("[Bridge] Closed by server after {} answers.\n", answered.load());
    });

    websocketpp::lib::error_code ec;
    WsClient::connection_ptr con = c.get_connection(cfg.url, ec);
    if (ec)
    {
        std::print("[Bridge] get_connection error: {}\n", ec.message());
        return 2;
    }

    c.connect(con);
    c.run();

    return 0;
}
