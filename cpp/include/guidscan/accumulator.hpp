// ==============================================================================
// guidscan/accumulator.hpp - Подсчёт вхождений GUID в одном файле
// ==============================================================================
//
// Один экземпляр на сканирование файла: создаётся перед чтением,
// выдаёт results() после конца потока и уничтожается.
//
// ==============================================================================

#ifndef GUIDSCAN_ACCUMULATOR_HPP
#define GUIDSCAN_ACCUMULATOR_HPP

#include <guidscan/guid.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace guidscan::scan {

/// Уникальный GUID и число его вхождений
struct GuidRecord {
    Guid guid;
    std::uint64_t count = 1;
    std::optional<std::uint64_t> first_offset;  // смещение первого вхождения (если отслеживается)
};

class GuidAccumulator {
public:
    /// Учесть вхождение
    /// @param offset Смещение в декодированном тексте; сохраняется только для первого вхождения
    /// @return true если GUID встретился впервые
    bool record(const Guid& guid, std::optional<std::uint64_t> offset = std::nullopt);

    /// Все записи; порядок не определён
    std::vector<GuidRecord> results() const;

    std::size_t unique_count() const { return records_.size(); }
    std::uint64_t total_count() const { return total_; }
    bool empty() const { return records_.empty(); }

private:
    std::unordered_map<Guid, GuidRecord, GuidHash> records_;
    std::uint64_t total_ = 0;
};

}  // namespace guidscan::scan

#endif  // GUIDSCAN_ACCUMULATOR_HPP
