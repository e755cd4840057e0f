// ==============================================================================
// accumulator.cpp - Подсчёт вхождений GUID
// ==============================================================================

#include "guidscan/accumulator.hpp"

namespace guidscan::scan {

bool GuidAccumulator::record(const Guid& guid, std::optional<std::uint64_t> offset) {
    ++total_;
    auto it = records_.find(guid);
    if (it != records_.end()) {
        ++it->second.count;
        return false;
    }
    records_.emplace(guid, GuidRecord{guid, 1, offset});
    return true;
}

std::vector<GuidRecord> GuidAccumulator::results() const {
    std::vector<GuidRecord> out;
    out.reserve(records_.size());
    for (const auto& [guid, rec] : records_) {
        out.push_back(rec);
    }
    return out;
}

}  // namespace guidscan::scan
