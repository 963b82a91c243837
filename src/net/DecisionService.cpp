//
// DecisionService.cpp
//
#include "DecisionService.hpp"

#include <chrono>
#include <format>
#include <print>
#include <utility>

#include "../core/Exception.hpp"
#include "JsonCodec.hpp"

using nlohmann::json;

namespace uno::net
{
    auto Json(int const status, json const& j) -> HttpResponse
    {
        return HttpResponse{status, Dump(j)};
    }

    auto Detail(int const status, std::string const& detail) -> HttpResponse
    {
        return Json(status, json{{"detail", detail}});
    }

    DecisionService::DecisionService(core::Arbiter const& arbiter,
                                     proposer::ProposerRegistry& registry,
                                     core::debug::AuditLogger* audit) :
        arbiter_(arbiter),
        registry_(registry),
        audit_(audit)
    {
    }

    auto DecisionService::Handle(std::string const& method, std::string const& path, std::string const& body)
        -> HttpResponse
    {
        // query strings are not used by any route
        std::string const route = path.substr(0, path.find('?'));
        try
        {
            if (route == "/" && method == "GET") return Root();
            if (route == "/health" && method == "GET") return Health();
            if (route == "/providers" && method == "GET") return ListProviders();
            if (route == "/move" && method == "POST") return PostMove(body);
            if (route == "/analysis" && method == "POST") return PostAnalysis(body);
            if (route == "/validate" && method == "POST") return PostValidate(body);
            if (route == "/cache" && method == "GET") return Cache();
            if (route == "/cache" && method == "DELETE") return ClearCache();

            bool const known = route == "/" || route == "/health" || route == "/providers" || route == "/move" ||
                               route == "/analysis" || route == "/validate" || route == "/cache";
            return known ? Detail(405, "Method Not Allowed") : Detail(404, "Not Found");
        }
        catch (core::OmegaException<core::error::Code> const& e)
        {
            std::print("[Server] {} {} failed: {}\n", method, route, e);
            return Detail(500, e.what());
        }
        catch (std::exception const& e)
        {
            std::print("[Server] {} {} failed: {}\n", method, route, e.what());
            return Detail(500, e.what());
        }
    }

    auto DecisionService::Root() const -> HttpResponse
    {
        return Json(200, json{
            {"message", "UNO move arbiter"},
            {"endpoints", {"/health", "/providers", "/move", "/analysis", "/validate", "/cache"}}});
    }

    auto DecisionService::Health() const -> HttpResponse
    {
        return Json(200, json{{"status", "healthy"}, {"message", "Arbiter is running"}});
    }

    auto DecisionService::ListProviders() const -> HttpResponse
    {
        json providers = json::object();
        for (proposer::ProviderInfo const& p : registry_.Providers())
        {
            providers[p.name] = json{{"description", p.description},
                                     {"default_model", p.default_model},
                                     {"supported_models", p.supported_models}};
        }
        return Json(200, json{{"providers", std::move(providers)},
                              {"usage", "Specify provider and optionally model in your requests"}});
    }

    auto DecisionService::PostMove(std::string const& body) -> HttpResponse
    {
        auto req = ParseDecisionRequest(body);
        if (!req) return Detail(400, req.error().message);
        if (req->provider.empty()) return Detail(400, "provider is required");

        auto lease = registry_.GetOrCreate(req->provider, req->model, req->base_url);
        if (!lease) return Detail(400, lease.error().detail);

        core::GameState& state = *req->state;
        core::GameState const before = state;
        core::Decision const d = arbiter_.Decide(state, *lease->proposer);
        Audit(before, req->provider, d);

        auto const verdict = arbiter_.Check(before, d.move);

        json attempts = json::array();
        for (core::AttemptVerdict const& v : d.attempts) attempts.push_back(VerdictToJson(v));

        json out = MoveToJson(d.move);
        out["isValid"] = verdict.has_value();
        out["validationMessage"] = verdict.has_value() ? json(nullptr) : json(core::error::describe(verdict.error()));
        out["provider"] = req->provider;
        out["model"] = lease->model;
        out["attempts"] = std::move(attempts);
        out["outcome"] = d.outcome == core::DecisionOutcome::Accepted ? "accepted" : "fallback";
        out["nextState"] = GameStateToJson(state);
        return Json(200, out);
    }

    auto DecisionService::PostAnalysis(std::string const& body) -> HttpResponse
    {
        auto req = ParseDecisionRequest(body);
        if (!req) return Detail(400, req.error().message);
        if (req->provider.empty()) return Detail(400, "provider is required");

        auto lease = registry_.GetOrCreate(req->provider, req->model, req->base_url);
        if (!lease) return Detail(400, lease.error().detail);

        auto const deadline = std::chrono::steady_clock::now() + arbiter_.Cfg().attempt_timeout;
        GameAnalysis const a = advisor_.Analyze(*req->state, *lease->proposer, deadline);
        return Json(200, json{{"analysis", AnalysisToJson(a)},
                              {"provider", req->provider},
                              {"model", lease->model}});
    }

    auto DecisionService::PostValidate(std::string const& body) const -> HttpResponse
    {
        auto req = ParseDecisionRequest(body, /*require_move*/ true);
        if (!req) return Detail(400, req.error().message);

        auto const ok = arbiter_.Check(*req->state, *req->move);
        json out{{"isValid", ok.has_value()},
                 {"validationMessage", arbiter_.Explain(*req->state, *req->move)}};
        if (!ok.has_value())
            out["category"] = std::string(core::error::to_string(core::error::category(ok.error().code)));
        return Json(200, out);
    }

    auto DecisionService::Cache() const -> HttpResponse
    {
        std::vector<std::string> const keys = registry_.CachedKeys();
        return Json(200, json{{"cached", keys}, {"count", keys.size()}});
    }

    auto DecisionService::ClearCache() -> HttpResponse
    {
        return Json(200, json{{"cleared", registry_.Clear()}});
    }

    auto DecisionService::Audit(core::GameState const& before, std::string const& provider, core::Decision const& d)
        -> void
    {
        if (!audit_) return;
        std::lock_guard<std::mutex> lock(audit_mtx_);
        audit_->start(before, provider);
        for (size_t i{}; i < d.attempts.size(); ++i) audit_->attempt(i + 1, d.attempts[i]);
        audit_->decision(d);
    }
}
