#pragma once
#include <memory>

#include "providers/provider_factory.hpp"
#include "protocol.hpp"

inline ProviderFactory make_yellowstone_factory() {
    ProviderFactory f;
    f.name = "yellowstone";
    f.dual_stream = false;
    f.make_protocol = [] { return std::make_unique<YellowstoneProtocol>(false); };
    return f;
}

// Transactions plus account writes for the same account on one subscription.
inline ProviderFactory make_yellowstone_accounts_factory() {
    ProviderFactory f;
    f.name = "yellowstone_accounts";
    f.dual_stream = true;
    f.make_protocol = [] { return std::make_unique<YellowstoneProtocol>(true); };
    f.log_suffix = "_dual_stream";
    return f;
}
