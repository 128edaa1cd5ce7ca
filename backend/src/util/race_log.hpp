#pragma once
#include <fstream>
#include <stdexcept>
#include <string>

struct LogWriteError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Per-endpoint audit trail: one "<timestamp> <label> <signature>" line per
// observation, flushed as written. Owned by exactly one runner.
class RaceLog {
public:
    // Opens (truncates) <dir>/<name>.log, creating <dir> if needed.
    RaceLog(const std::string& dir, const std::string& name);

    void write_entry(double timestamp, const std::string& label, const std::string& signature);

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
    std::ofstream out_;
};
