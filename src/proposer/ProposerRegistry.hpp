//
// ProposerRegistry.hpp
//

#ifndef UNOARBITER_PROPOSERREGISTRY_HPP
#define UNOARBITER_PROPOSERREGISTRY_HPP

#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../core/Proposer.hpp"

namespace uno::proposer
{
    struct ProviderInfo
    {
        using Factory = std::function<std::shared_ptr<core::MoveProposer>(std::string const& model,
                                                                          std::optional<std::string> const& base_url)>;
        std::string name;
        std::string description;
        std::string default_model;
        std::vector<std::string> supported_models;
        Factory factory;
        // connection that announced the provider; empty for providers registered in-process
        std::string owner;
    };

    struct Lease
    {
        std::shared_ptr<core::MoveProposer> proposer;
        std::string model;
        std::string key;
    };

    // Provider catalogue plus a cache of constructed proposers keyed by provider, model and endpoint.
    // Safe for concurrent lookup-or-create; construction happens under the lock.
    class ProposerRegistry
    {
    public:
        // "provider:model:base_url", with "default" for a missing endpoint
        static auto CacheKey(std::string const& provider,
                             std::string const& model,
                             std::optional<std::string> const& base_url) -> std::string;

        // Replaces an existing provider of the same name and evicts its cached proposers.
        auto RegisterProvider(ProviderInfo info) -> void;
        // Refuses a name that is already registered, builtin or owned by another connection.
        auto ClaimProvider(ProviderInfo info) -> bool;
        // With an owner, removes the provider only while that owner still holds the name.
        auto RemoveProvider(std::string const& name, std::optional<std::string> const& owner = std::nullopt) -> bool;

        // Unknown provider or a failing factory -> Unavailable
        auto GetOrCreate(std::string const& provider,
                         std::optional<std::string> const& model = std::nullopt,
                         std::optional<std::string> const& base_url = std::nullopt)
            -> std::expected<Lease, core::ProposerFailure>;

        auto Providers() const -> std::vector<ProviderInfo>;
        auto DefaultModel(std::string const& provider) const -> std::optional<std::string>;
        auto CachedKeys() const -> std::vector<std::string>;
        // Returns the number of evicted entries
        auto Clear() -> size_t;

    private:
        auto EvictLocked(std::string const& provider) -> size_t;

        mutable std::mutex mtx_;
        std::map<std::string, ProviderInfo> providers_;
        std::map<std::string, std::shared_ptr<core::MoveProposer>> cache_;
    };

    // "random" and "first-legal"
    auto RegisterBuiltins(ProposerRegistry& registry, uint64_t seed) -> void;
}

#endif //UNOARBITER_PROPOSERREGISTRY_HPP
