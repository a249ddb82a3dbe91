#ifndef STRATA_OPS_KERNELS_HPP
#define STRATA_OPS_KERNELS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../../activation/apply.hpp"
#include "../../activation/details/leaky_relu.hpp"
#include "../../common/context.hpp"
#include "../../common/overloaded.hpp"
#include "../../common/shape.hpp"
#include "attributes.hpp"
#include "shape_rules.hpp"

// Concrete libtorch execution of every operation. The eager namespace calls
// these directly and graph replay calls them node by node, so both paths
// produce identical values.
namespace Strata::Ops::Details {
    namespace detail {
        [[nodiscard]] inline torch::Tensor dropout(const torch::Tensor& input, double rate, bool training)
        {
            if (!training || rate == 0.0) {
                return input;
            }
            if (rate >= 1.0) {
                return torch::zeros_like(input);
            }
            return torch::dropout(input, rate, /*train=*/true);
        }

        [[nodiscard]] inline torch::Tensor batch_norm(const BatchNormAttributes& op,
                                                      const std::vector<torch::Tensor>& inputs,
                                                      bool training)
        {
            const auto& data = inputs[0];
            const auto axis = detail::normalize_axis(op.axis, data.dim());
            // libtorch normalizes over every axis except 1.
            auto input = axis == 1 ? data : data.movedim(axis, 1);

            const torch::Tensor gamma = op.scale ? inputs[1] : torch::Tensor{};
            const torch::Tensor beta = op.center ? inputs[2] : torch::Tensor{};
            const bool use_batch_statistics = training && !op.use_global_stats;

            auto output = torch::batch_norm(input, gamma, beta, inputs[3], inputs[4],
                                            use_batch_statistics, 1.0 - op.momentum, op.epsilon,
                                            /*cudnn_enabled=*/true);
            return axis == 1 ? output : output.movedim(1, axis);
        }

        [[nodiscard]] inline torch::Tensor embedding(const EmbeddingAttributes& op,
                                                     const torch::Tensor& indices,
                                                     const torch::Tensor& weight)
        {
            if (indices.numel() > 0) {
                const auto lowest = indices.min().item<std::int64_t>();
                const auto highest = indices.max().item<std::int64_t>();
                if (lowest < 0 || highest >= op.input_dim) {
                    throw std::out_of_range("Embedding index out of range [0, " + std::to_string(op.input_dim)
                                            + "): observed values in [" + std::to_string(lowest) + ", "
                                            + std::to_string(highest) + "].");
                }
            }
            return torch::embedding(weight, indices.to(torch::kLong));
        }
    }

    [[nodiscard]] inline torch::Tensor run(const Attributes& attributes,
                                           const std::vector<torch::Tensor>& inputs,
                                           const ExecutionContext& context)
    {
        return std::visit(Overloaded{
            [&](const FullyConnectedAttributes& op) {
                const torch::Tensor bias = op.no_bias ? torch::Tensor{} : inputs[2];
                return torch::linear(inputs[0], inputs[1], bias);
            },
            [&](const ActivationAttributes& op) {
                return ::Strata::Activation::Details::apply(op.type, inputs[0]);
            },
            [&](const LeakyReLUAttributes& op) {
                return ::Strata::Activation::Details::LeakyReLU{op.slope}(inputs[0]);
            },
            [&](const DropoutAttributes& op) {
                return detail::dropout(inputs[0], op.rate, context.is_training());
            },
            [&](const BatchNormAttributes& op) {
                return detail::batch_norm(op, inputs, context.is_training());
            },
            [&](const EmbeddingAttributes& op) {
                return detail::embedding(op, inputs[0], inputs[1]);
            },
            [&](const ReshapeAttributes& op) {
                return inputs[0].reshape(resolve_reshape(op.shape, tensor_sizes(inputs[0])));
            },
            [&](const ElementwiseAttributes& op) {
                switch (op.kind) {
                    case ElementwiseAttributes::Kind::Subtract: return torch::sub(inputs[0], inputs[1]);
                    case ElementwiseAttributes::Kind::Multiply: return torch::mul(inputs[0], inputs[1]);
                    case ElementwiseAttributes::Kind::Add:
                    default: return torch::add(inputs[0], inputs[1]);
                }
            },
            [&](const DotAttributes&) {
                return torch::matmul(inputs[0], inputs[1]);
            },
        }, attributes);
    }
}

#endif // STRATA_OPS_KERNELS_HPP
