#ifndef STRATA_OPS_HPP
#define STRATA_OPS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/attributes.hpp"
#include "details/eager.hpp"
#include "details/kernels.hpp"
#include "details/namespace.hpp"
#include "details/shape_rules.hpp"
#include "details/symbolic.hpp"
#include "details/value.hpp"

namespace Strata {
    using Ops::Value;
}

#endif // STRATA_OPS_HPP
