#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "race_types.hpp"

// Comparator is the shared race registry: signature -> first arrival per
// endpoint. All methods are safe to call from every runner thread.
//
// A record is complete as soon as one endpoint has reported it, so slow or
// disconnected endpoints never hold back termination. The valid count is
// therefore the number of distinct signatures seen so far.
class Comparator {
public:
    struct AddResult {
        bool recorded{false};      // false when the endpoint already had an entry
        bool new_race{false};      // this call completed a previously unseen record
        std::size_t valid_count{0}; // count right after this call, same critical section
    };

    // Records `obs` for `endpoint` unless that endpoint already reported the
    // signature; repeats are dropped and never overwrite the first timestamp.
    AddResult add(const std::string& endpoint, const Observation& obs);

    std::size_t get_valid_count() const;

    std::optional<RaceRecord> find(const std::string& signature) const;

    // Copy of every record, in first-seen order.
    std::vector<RaceRecord> records() const;

private:
    mutable std::mutex m_;
    std::unordered_map<std::string, std::size_t> index_; // signature -> records_ slot
    std::vector<RaceRecord> records_;
    std::size_t valid_count_{0};
};
