#pragma once
#include <stdexcept>

// Fatal to one runner, surfaced through its handle. Never retried.
struct ConnectError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct SubscribeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Ends one runner's read loop; logged, not escalated.
struct StreamError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// One payload could not be decoded; the frame is dropped.
struct DecodeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
