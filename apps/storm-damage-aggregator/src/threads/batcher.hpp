#ifndef STORM_DAMAGE_AGGREGATOR_BATCHER_HPP
#define STORM_DAMAGE_AGGREGATOR_BATCHER_HPP

#include <cstddef>

#include "../queue.hpp"
#include "../types.hpp"

namespace stormagg {

// Splits [0, event_count) into batches of at most batch_size and closes the
// queue when done or when consumers have cancelled it.
void batcherThread(std::size_t event_count, std::size_t batch_size, BlockingQueue<EventBatch>& output);

} // namespace stormagg

#endif
