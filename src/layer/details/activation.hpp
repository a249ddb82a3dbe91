#ifndef STRATA_LAYER_ACTIVATION_HPP
#define STRATA_LAYER_ACTIVATION_HPP

#include <string>
#include <utility>

#include "../../activation/activation.hpp"
#include "../../block/details/hybrid.hpp"
#include "../../ops/ops.hpp"

namespace Strata::Layer::Details {
    struct ActivationOptions {
        ::Strata::Activation::Type type{::Strata::Activation::Type::Identity};
    };

    class ActivationImpl : public HybridBlock {
    public:
        explicit ActivationImpl(ActivationOptions options, BlockOptions block = {})
            : HybridBlock("Activation", std::string(::Strata::Activation::name(options.type)), std::move(block)),
              options_(options) {}

        [[nodiscard]] const ActivationOptions& options() const noexcept { return options_; }

    protected:
        Ops::Value hybrid_forward(Ops::Namespace& F, const Ops::Value& x, const ParameterValues&) override
        {
            return F.activation(x, options_.type);
        }

        [[nodiscard]] std::string extra_repr() const override
        {
            return std::string(::Strata::Activation::name(options_.type));
        }

    private:
        ActivationOptions options_{};
    };
}

#endif // STRATA_LAYER_ACTIVATION_HPP
