#include "comparator.hpp"

Comparator::AddResult Comparator::add(const std::string& endpoint, const Observation& obs) {
    AddResult res;
    std::lock_guard<std::mutex> lk(m_);

    auto it = index_.find(obs.signature);
    if (it == index_.end()) {
        RaceRecord rec;
        rec.signature  = obs.signature;
        rec.start_time = obs.start_time;
        rec.arrivals.emplace_back(endpoint, obs.timestamp);
        index_.emplace(obs.signature, records_.size());
        records_.push_back(std::move(rec));

        ++valid_count_;
        res.recorded = true;
        res.new_race = true;
        res.valid_count = valid_count_;
        return res;
    }

    RaceRecord& rec = records_[it->second];
    if (!rec.has_endpoint(endpoint)) {
        rec.arrivals.emplace_back(endpoint, obs.timestamp);
        res.recorded = true;
    }
    res.valid_count = valid_count_;
    return res;
}

std::size_t Comparator::get_valid_count() const {
    std::lock_guard<std::mutex> lk(m_);
    return valid_count_;
}

std::optional<RaceRecord> Comparator::find(const std::string& signature) const {
    std::lock_guard<std::mutex> lk(m_);
    auto it = index_.find(signature);
    if (it == index_.end()) return std::nullopt;
    return records_[it->second];
}

std::vector<RaceRecord> Comparator::records() const {
    std::lock_guard<std::mutex> lk(m_);
    return records_;
}
