//
// ProposerRegistry.cpp
//

#include "ProposerRegistry.hpp"

#include <atomic>
#include <format>
#include <print>
#include <utility>

#include "../core/Exception.hpp"
#include "FirstLegalProposer.hpp"
#include "RandomProposer.hpp"

namespace uno::proposer
{
    using core::ProposerFailure;
    using core::ProposerFailureCode;

    auto ProposerRegistry::CacheKey(std::string const& provider,
                                    std::string const& model,
                                    std::optional<std::string> const& base_url) -> std::string
    {
        return std::format("{}:{}:{}", provider, model, base_url.value_or("default"));
    }

    auto ProposerRegistry::EvictLocked(std::string const& provider) -> size_t
    {
        std::string const prefix = provider + ":";
        return std::erase_if(cache_, [&prefix](auto const& kv) { return kv.first.starts_with(prefix); });
    }

    auto ProposerRegistry::RegisterProvider(ProviderInfo info) -> void
    {
        UNO_ASSERT(!info.name.empty(), "Provider registered without a name");
        UNO_ASSERT(static_cast<bool>(info.factory), "Provider registered without a factory");

        std::lock_guard<std::mutex> lock(mtx_);
        size_t const evicted = EvictLocked(info.name);
        std::print("[Registry] provider '{}' registered ({} cached entries evicted)\n", info.name, evicted);
        std::string name = info.name;
        providers_.insert_or_assign(std::move(name), std::move(info));
    }

    auto ProposerRegistry::ClaimProvider(ProviderInfo info) -> bool
    {
        UNO_ASSERT(!info.name.empty(), "Provider claimed without a name");
        UNO_ASSERT(static_cast<bool>(info.factory), "Provider claimed without a factory");

        std::lock_guard<std::mutex> lock(mtx_);
        if (providers_.contains(info.name))
        {
            std::print("[Registry] provider '{}' already registered, claim by '{}' refused\n", info.name, info.owner);
            return false;
        }
        EvictLocked(info.name);
        std::print("[Registry] provider '{}' claimed by '{}'\n", info.name, info.owner);
        std::string name = info.name;
        providers_.emplace(std::move(name), std::move(info));
        return true;
    }

    auto ProposerRegistry::RemoveProvider(std::string const& name, std::optional<std::string> const& owner) -> bool
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto const it = providers_.find(name);
        if (it == providers_.end()) return false;
        if (owner.has_value() && it->second.owner != *owner) return false;

        EvictLocked(name);
        providers_.erase(it);
        std::print("[Registry] provider '{}' removed\n", name);
        return true;
    }

    auto ProposerRegistry::GetOrCreate(std::string const& provider,
                                       std::optional<std::string> const& model,
                                       std::optional<std::string> const& base_url)
        -> std::expected<Lease, ProposerFailure>
    {
        std::lock_guard<std::mutex> lock(mtx_);

        auto const p = providers_.find(provider);
        if (p == providers_.end())
            return std::unexpected(ProposerFailure{ProposerFailureCode::Unavailable,
                                                   std::format("Unknown provider '{}'", provider)});

        std::string const resolved = model.value_or(p->second.default_model);
        std::string key = CacheKey(provider, resolved, base_url);

        if (auto const it = cache_.find(key); it != cache_.end())
            return Lease{it->second, resolved, std::move(key)};

        std::shared_ptr<core::MoveProposer> created;
        try
        {
            created = p->second.factory(resolved, base_url);
        }
        catch (core::OmegaException<core::error::Code> const& e)
        {
            return std::unexpected(ProposerFailure{ProposerFailureCode::Unavailable,
                                                   std::format("Failed to initialize provider: {}", e.what())});
        }
        catch (std::exception const& e)
        {
            return std::unexpected(ProposerFailure{ProposerFailureCode::Unavailable,
                                                   std::format("Failed to initialize provider: {}", e.what())});
        }
        if (!created)
            return std::unexpected(ProposerFailure{ProposerFailureCode::Unavailable,
                                                   std::format("Failed to initialize provider: {}", provider)});

        std::print("[Registry] created proposer {}\n", key);
        cache_.emplace(key, created);
        return Lease{std::move(created), resolved, std::move(key)};
    }

    auto ProposerRegistry::Providers() const -> std::vector<ProviderInfo>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<ProviderInfo> out;
        out.reserve(providers_.size());
        for (auto const& [name, info] : providers_) out.push_back(info);
        return out;
    }

    auto ProposerRegistry::DefaultModel(std::string const& provider) const -> std::optional<std::string>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto const it = providers_.find(provider);
        if (it == providers_.end()) return std::nullopt;
        return it->second.default_model;
    }

    auto ProposerRegistry::CachedKeys() const -> std::vector<std::string>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<std::string> out;
        out.reserve(cache_.size());
        for (auto const& kv : cache_) out.push_back(kv.first);
        return out;
    }

    auto ProposerRegistry::Clear() -> size_t
    {
        std::lock_guard<std::mutex> lock(mtx_);
        size_t const n = cache_.size();
        cache_.clear();
        return n;
    }

    auto RegisterBuiltins(ProposerRegistry& registry, uint64_t seed) -> void
    {
        // each cached random proposer gets its own stream
        auto stream = std::make_shared<std::atomic<uint64_t>>(seed);
        registry.RegisterProvider(ProviderInfo{
            .name = "random",
            .description = "Uniformly random moves, legal or not",
            .default_model = "uniform",
            .supported_models = {"uniform"},
            .factory = [stream](std::string const&, std::optional<std::string> const&)
                -> std::shared_ptr<core::MoveProposer>
            {
                return std::make_shared<RandomProposer>(stream->fetch_add(1));
            }});

        registry.RegisterProvider(ProviderInfo{
            .name = "first-legal",
            .description = "Plays the first legal card, else draws",
            .default_model = "first-legal",
            .supported_models = {"first-legal"},
            .factory = [](std::string const&, std::optional<std::string> const&)
                -> std::shared_ptr<core::MoveProposer>
            {
                return std::make_shared<FirstLegalProposer>();
            }});
    }
}
