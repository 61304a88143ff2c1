#pragma once

/**
 * IITPhi: parallel C++ engine for IIT 3.0 integrated information
 *
 * This is the main header file that includes all components.
 */

// Core types and utilities
#include "iit/core/types.hpp"
#include "iit/core/errors.hpp"
#include "iit/core/log.hpp"
#include "iit/core/config.hpp"
#include "iit/core/budget.hpp"

// Data structures
#include "iit/data/tpm.hpp"
#include "iit/data/node.hpp"
#include "iit/data/repertoire.hpp"
#include "iit/data/subsystem.hpp"

// Partition generation
#include "iit/partition/partition.hpp"
#include "iit/partition/system_cut.hpp"

// Metrics
#include "iit/metrics/emd.hpp"
#include "iit/metrics/distance.hpp"

// Infrastructure
#include "iit/cache/cache.hpp"
#include "iit/parallel/executor.hpp"

// Computation algorithms
#include "iit/compute/small_phi.hpp"
#include "iit/compute/ces.hpp"
#include "iit/compute/big_phi.hpp"
#include "iit/compute/network.hpp"

namespace iit {

/**
 * Version information
 */
constexpr const char* VERSION = "0.2.0";
constexpr const char* VERSION_NAME = "Beta";

}  // namespace iit
