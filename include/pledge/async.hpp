#pragma once

// Future/promise core and everything built on it:
//   - completion.hpp, cancellation_token.hpp, future.hpp: the core
//   - factories.hpp: just, just_error, just_cancelled, deferred
//   - then.hpp, upon.hpp: value and side-effect combinators
//   - executor.hpp, schedulers.hpp: execution contexts
//   - timer_queue.hpp, delay.hpp, retry.hpp: time-based operators

#include "async/cancellation_token.hpp"  // Cancellation token and slot
#include "async/completion.hpp"          // completion<T, E>, cancelled
#include "async/delay.hpp"               // delay
#include "async/executor.hpp"            // executor concept, inline/any executor
#include "async/factories.hpp"           // Future factories
#include "async/future.hpp"              // future<T, E>, resolver<T, E>
#include "async/retry.hpp"               // retry, then_retry, retry_strategy
#include "async/schedulers.hpp"          // run_loop, serial_queue, thread_pool
#include "async/then.hpp"                // map, map_error, then, flat_map
#include "async/timer_queue.hpp"         // Timer thread
#include "async/transfer.hpp"            // schedule_on, receive_on
#include "async/upon.hpp"                // on_success, on_failure, on_cancelled
#include "async/utils.hpp"               // Type utilities
#include "version.hpp"
