#include "race_log.hpp"

#include <filesystem>
#include <iomanip>
#include <system_error>

RaceLog::RaceLog(const std::string& dir, const std::string& name) {
    std::filesystem::path base(dir.empty() ? "." : dir);
    std::error_code ec;
    std::filesystem::create_directories(base, ec);
    if (ec) {
        throw LogWriteError("cannot create log directory " + base.string() + ": " + ec.message());
    }

    path_ = (base / (name + ".log")).string();
    out_.open(path_, std::ios::out | std::ios::trunc);
    if (!out_.is_open()) {
        throw LogWriteError("cannot open " + path_);
    }
}

void RaceLog::write_entry(double timestamp, const std::string& label, const std::string& signature) {
    out_ << std::fixed << std::setprecision(6) << timestamp << ' ' << label << ' ' << signature << '\n';
    out_.flush();
    if (!out_) {
        throw LogWriteError("write to " + path_ + " failed");
    }
}
