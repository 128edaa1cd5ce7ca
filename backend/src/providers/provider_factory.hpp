#pragma once

#include <functional>
#include <memory>
#include <string>

struct IStreamProtocol;

struct ProviderFactory {
    std::string name;
    bool dual_stream{false};
    std::function<std::unique_ptr<IStreamProtocol>()> make_protocol;
    std::string log_suffix; // appended to the endpoint name for its audit log file
};
