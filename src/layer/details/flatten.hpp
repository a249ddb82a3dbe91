#ifndef STRATA_LAYER_FLATTEN_HPP
#define STRATA_LAYER_FLATTEN_HPP

#include <string>
#include <utility>

#include "../../block/details/hybrid.hpp"
#include "../../ops/ops.hpp"

namespace Strata::Layer::Details {
    // (N, d1, ..., dk) -> (N, d1 * ... * dk), keeping row-major element order.
    class FlattenImpl : public HybridBlock {
    public:
        explicit FlattenImpl(BlockOptions block = {}) : HybridBlock("Flatten", std::move(block)) {}

        [[nodiscard]] std::string repr() const override { return type_name(); }

    protected:
        Ops::Value hybrid_forward(Ops::Namespace& F, const Ops::Value& x, const ParameterValues&) override
        {
            return F.flatten(x);
        }
    };
}

#endif // STRATA_LAYER_FLATTEN_HPP
