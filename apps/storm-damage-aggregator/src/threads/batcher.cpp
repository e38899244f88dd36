#include "batcher.hpp"

#include <algorithm>

namespace stormagg {

void batcherThread(std::size_t event_count, std::size_t batch_size, BlockingQueue<EventBatch>& output) {
  const std::size_t step = std::max<std::size_t>(batch_size, 1);
  for (std::size_t begin = 0; begin < event_count; begin += step) {
    EventBatch batch;
    batch.begin = begin;
    batch.end = std::min(event_count, begin + step);
    if (!output.push(batch)) {
      break;
    }
  }

  output.close();
}

} // namespace stormagg
