//
// DecisionService.hpp
//

#ifndef UNOARBITER_DECISIONSERVICE_HPP
#define UNOARBITER_DECISIONSERVICE_HPP

#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "../core/Arbiter.hpp"
#include "../debug/AuditLogger.hpp"
#include "../proposer/Advisor.hpp"
#include "../proposer/ProposerRegistry.hpp"

namespace uno::net
{
    struct HttpResponse
    {
        int status{200};
        std::string body;
    };

    // The HTTP surface without the socket: method + path + body in, status + JSON out.
    // Every request works on its own GameState; only the registry and the audit log are shared.
    class DecisionService
    {
    public:
        DecisionService(core::Arbiter const& arbiter,
                        proposer::ProposerRegistry& registry,
                        core::debug::AuditLogger* audit = nullptr);

        auto Handle(std::string const& method, std::string const& path, std::string const& body) -> HttpResponse;

    private:
        auto Root() const -> HttpResponse;
        auto Health() const -> HttpResponse;
        auto ListProviders() const -> HttpResponse;
        auto PostMove(std::string const& body) -> HttpResponse;
        auto PostAnalysis(std::string const& body) -> HttpResponse;
        auto PostValidate(std::string const& body) const -> HttpResponse;
        auto Cache() const -> HttpResponse;
        auto ClearCache() -> HttpResponse;

        auto Audit(core::GameState const& before, std::string const& provider, core::Decision const& d) -> void;

    private:
        core::Arbiter const& arbiter_;
        proposer::ProposerRegistry& registry_;
        proposer::Advisor advisor_;
        core::debug::AuditLogger* audit_;
        std::mutex audit_mtx_;
    };

    auto Json(int status, nlohmann::json const& j) -> HttpResponse;
    auto Detail(int status, std::string const& detail) -> HttpResponse;
}

#endif //UNOARBITER_DECISIONSERVICE_HPP
