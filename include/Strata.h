#ifndef STRATA_LIBRARY_H
#define STRATA_LIBRARY_H

#include "../src/common/context.hpp"
#include "../src/common/error.hpp"
#include "../src/common/graph.hpp"
#include "../src/common/shape.hpp"
#include "../src/activation/activation.hpp"
#include "../src/initialization/initialization.hpp"
#include "../src/parameter/dict.hpp"
#include "../src/parameter/parameter.hpp"
#include "../src/ops/ops.hpp"
#include "../src/block/block.hpp"
#include "../src/layer/layer.hpp"
#include "../src/utils/log.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Parameters and ParameterDict: named, possibly deferred tensor slots.
//  - Block / HybridBlock: composition, scoped naming and the F-polymorphic
//    forward with its per-instance graph cache.
//  - Layer factories return shared handles ready to register in a container.

#endif // STRATA_LIBRARY_H
