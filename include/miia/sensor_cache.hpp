/**
 * @file sensor_cache.hpp
 * @brief Holder for the most recent sensor snapshot.
 *
 * Readers see either no snapshot (nothing read yet) or one complete snapshot
 * decoded from a single reply. Only the dispatcher writes, and it replaces
 * the whole value at once.
 */

#ifndef MIIA_SENSOR_CACHE_HPP_
#define MIIA_SENSOR_CACHE_HPP_

#include "miia/frame_codec.hpp"
#include "miia/vocabulary.hpp"

#include <cstdint>

namespace miia {

template <typename Link>
class BasicDispatcher;

class SensorCache final {
 public:
  SensorCache() = default;

  optional<SensorSnapshot> Latest() const { return latest_; }

  bool HasSnapshot() const noexcept { return latest_.has_value(); }

  /// Button state of the latest snapshot, empty before the first reading.
  optional<bool> InputButtonState() const {
    if (!latest_) return {};
    return optional<bool>(latest_.value().input_button_state);
  }

  /// Distance reading of the latest snapshot, empty before the first reading.
  optional<uint16_t> DistanceSensor() const {
    if (!latest_) return {};
    return optional<uint16_t>(latest_.value().distance_sensor);
  }

  /// Successful refreshes so far.
  uint32_t RefreshCount() const noexcept { return refresh_count_; }

 private:
  template <typename Link>
  friend class BasicDispatcher;

  const SensorSnapshot& Replace(const SensorSnapshot& fresh) {
    SensorSnapshot next = fresh;
    next.sequence = ++refresh_count_;
    latest_ = next;
    return latest_.value();
  }

  optional<SensorSnapshot> latest_;
  uint32_t refresh_count_ = 0U;
};

}  // namespace miia

#endif  // MIIA_SENSOR_CACHE_HPP_
