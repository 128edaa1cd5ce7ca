#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "provider_factory.hpp"
#include "shredstream/factory.hpp"
#include "yellowstone/factory.hpp"

// Name → factory for every provider a config may name. Ordered so that
// listings in error messages and help text are stable.
class ProviderRegistry {
public:
    static const ProviderRegistry& instance() {
        static ProviderRegistry registry;
        return registry;
    }

    const ProviderFactory* find(std::string_view name) const {
        auto it = factories_.find(name);
        if (it == factories_.end()) {
            return nullptr;
        }
        return &it->second;
    }

    // "a, b, c" for diagnostics.
    std::string joined_names() const {
        std::string out;
        for (const auto& kv : factories_) {
            if (!out.empty()) out += ", ";
            out += kv.first;
        }
        return out;
    }

private:
    ProviderRegistry() {
        register_factory(make_yellowstone_factory());
        register_factory(make_yellowstone_accounts_factory());
        register_factory(make_shredstream_factory());
    }

    // Dual-stream providers log under their own suffix so their audit file
    // never collides with a plain transaction log of the same endpoint name.
    void register_factory(ProviderFactory factory) {
        if (factory.name.empty() || !factory.make_protocol) {
            return;
        }
        if (factory.dual_stream && factory.log_suffix.empty()) {
            return;
        }
        factories_.emplace(factory.name, std::move(factory));
    }

    std::map<std::string, ProviderFactory, std::less<>> factories_;
};
