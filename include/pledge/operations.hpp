#pragma once

// Operation scheduling on top of the future core:
//   - operation.hpp: operation, block_operation, async_block_operation
//   - operation_queue.hpp: runs ready operations on an executor
//   - exclusivity_controller.hpp: per-category serialization
//   - future_operation.hpp: run_on, futures as queued operations

#include "operations/exclusivity_controller.hpp"
#include "operations/future_operation.hpp"
#include "operations/operation.hpp"
#include "operations/operation_queue.hpp"
#include "version.hpp"
