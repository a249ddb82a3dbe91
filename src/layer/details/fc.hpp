#ifndef STRATA_LAYER_FC_HPP
#define STRATA_LAYER_FC_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../block/details/hybrid.hpp"
#include "../../common/error.hpp"
#include "../../common/shape.hpp"
#include "../../initialization/initialization.hpp"
#include "../../ops/ops.hpp"
#include "../../parameter/parameter.hpp"
#include "activation.hpp"

namespace Strata::Layer::Details {
    struct DenseOptions {
        std::int64_t units{};
        // Unset: inferred from the last dimension of the first input.
        std::optional<std::int64_t> in_units{};
        bool use_bias{true};
        torch::ScalarType dtype{torch::kFloat32};
    };

    // y = act(x W^T + b) on (batch, in_units) inputs.
    class DenseImpl : public HybridBlock {
    public:
        DenseImpl(DenseOptions options,
                  ::Strata::Activation::Descriptor activation = ::Strata::Activation::Identity,
                  ::Strata::Initialization::Descriptor weight_initializer = ::Strata::Initialization::Default,
                  ::Strata::Initialization::Descriptor bias_initializer = ::Strata::Initialization::Zeros,
                  BlockOptions block = {})
            : HybridBlock("Dense", std::move(block)), options_(options)
        {
            if (options_.units <= 0) {
                throw std::invalid_argument("Dense layers require a positive number of units.");
            }
            if (options_.in_units && *options_.in_units <= 0) {
                throw std::invalid_argument("Dense layers require positive in_units when given.");
            }

            weight_ = declare_parameter("weight", ParameterOptions{
                .shape = {options_.units, options_.in_units ? Dim{*options_.in_units} : Dim{Unknown}},
                .dtype = options_.dtype,
                .initializer = weight_initializer,
                .allow_deferred_init = true,
            });
            if (options_.use_bias) {
                bias_ = declare_parameter("bias", ParameterOptions{
                    .shape = {options_.units},
                    .dtype = options_.dtype,
                    .initializer = bias_initializer,
                    .allow_deferred_init = true,
                });
            }
            if (activation.type != ::Strata::Activation::Type::Identity) {
                activation_ = register_child(std::make_shared<ActivationImpl>(ActivationOptions{activation.type}));
            }
        }

        [[nodiscard]] const DenseOptions& options() const noexcept { return options_; }
        [[nodiscard]] const std::shared_ptr<Parameter>& weight() const noexcept { return weight_; }
        [[nodiscard]] const std::shared_ptr<Parameter>& bias() const noexcept { return bias_; }

        [[nodiscard]] std::string repr() const override
        {
            const auto& in_units = weight_->shape()[1];
            return "Dense(" + (in_units ? std::to_string(*in_units) : std::string{"None"}) + " -> "
                   + std::to_string(options_.units) + ", " + (activation_ ? activation_->repr() : std::string{"linear"})
                   + ')';
        }

    protected:
        void infer_shape(const Ops::Value& x) override
        {
            if (x.dim() != 2) {
                throw Error::RankError("Dense '" + name() + "' expects a rank-2 input (batch, in_units), got "
                                       + format_sizes(x.shape()) + ".");
            }
            weight_->resolve_shape({options_.units, x.size(1)});
        }

        Ops::Value hybrid_forward(Ops::Namespace& F, const Ops::Value& x, const ParameterValues& params) override
        {
            auto output = bias_ ? F.fully_connected(x, params["weight"], params["bias"], options_.units)
                                : F.fully_connected(x, params["weight"], options_.units);
            if (activation_) {
                output = activation_->invoke(F, output);
            }
            return output;
        }

    private:
        DenseOptions options_{};
        std::shared_ptr<Parameter> weight_{};
        std::shared_ptr<Parameter> bias_{};
        std::shared_ptr<ActivationImpl> activation_{};
    };
}

#endif // STRATA_LAYER_FC_HPP
