#include "tnsw/trip_monitor.h"

#include <utility>

#include "utl/logging.h"

#include "tnsw/error.h"

namespace tnsw {

trip_monitor::trip_monitor(trip_query query,
                           client const& c,
                           realtime_cache& cache,
                           metrics_registry* metrics)
    : query_{std::move(query)}, client_{c}, cache_{cache}, metrics_{metrics} {}

bool trip_monitor::refresh() {
  try {
    auto data = std::make_shared<data_t const>(
        retrieve(client_, cache_, query_, metrics_));
    auto const lock = std::scoped_lock{mutex_};
    data_ = std::move(data);
    available_ = true;
    return true;
  } catch (error const& e) {
    utl::log_error("tnsw.monitor", "update {} -> {} failed: {}",
                   query_.origin_, query_.destination_, e.what());
    auto const lock = std::scoped_lock{mutex_};
    available_ = false;
    return false;
  }
}

bool trip_monitor::available() const {
  auto const lock = std::scoped_lock{mutex_};
  return available_;
}

std::shared_ptr<trip_monitor::data_t const> trip_monitor::data() const {
  auto const lock = std::scoped_lock{mutex_};
  return data_;
}

}  // namespace tnsw
