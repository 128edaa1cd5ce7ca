#pragma once
#include <memory>

#include "providers/provider_factory.hpp"
#include "protocol.hpp"

inline ProviderFactory make_shredstream_factory() {
    ProviderFactory f;
    f.name = "shredstream";
    f.make_protocol = [] { return std::make_unique<ShredstreamProtocol>(); };
    return f;
}
