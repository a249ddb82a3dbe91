#ifndef STRATA_OPS_SHAPE_RULES_HPP
#define STRATA_OPS_SHAPE_RULES_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../../common/error.hpp"
#include "../../common/overloaded.hpp"
#include "../../common/shape.hpp"
#include "attributes.hpp"

// Output signature of every operation, computed from input signatures only.
// Both backends validate through these rules so eager and traced execution
// reject the same inputs with the same errors.
namespace Strata::Ops::Details {
    namespace detail {
        inline void require_arity(const Attributes& attributes, const std::vector<TensorSignature>& inputs,
                                  std::size_t minimum, std::size_t maximum)
        {
            if (inputs.size() < minimum || inputs.size() > maximum) {
                throw std::invalid_argument(std::string(op_name(attributes)) + " expects between "
                                            + std::to_string(minimum) + " and " + std::to_string(maximum)
                                            + " inputs, got " + std::to_string(inputs.size()) + ".");
            }
        }

        inline void require_floating(const Attributes& attributes, const TensorSignature& input)
        {
            if (!c10::isFloatingType(input.dtype)) {
                throw Error::TypeError(std::string(op_name(attributes)) + " expects a floating point input, got "
                                       + scalar_type_name(input.dtype) + ".");
            }
        }

        inline void require_same_dtype(const Attributes& attributes, const TensorSignature& data,
                                       const TensorSignature& parameter)
        {
            if (data.dtype != parameter.dtype) {
                throw Error::TypeError(std::string(op_name(attributes)) + " received input of dtype "
                                       + scalar_type_name(data.dtype) + " for parameters of dtype "
                                       + scalar_type_name(parameter.dtype) + ".");
            }
        }

        inline void require_shape(const Attributes& attributes, const TensorSignature& actual,
                                  const std::vector<std::int64_t>& expected, const char* role)
        {
            if (actual.shape != expected) {
                throw Error::ShapeConflict(std::string(op_name(attributes)) + " expects " + role + " of shape "
                                           + format_sizes(expected) + ", got " + format_sizes(actual.shape) + ".");
            }
        }

        [[nodiscard]] inline std::int64_t normalize_axis(std::int64_t axis, std::int64_t rank)
        {
            const auto resolved = axis < 0 ? axis + rank : axis;
            if (resolved < 0 || resolved >= rank) {
                throw Error::RankError("Axis " + std::to_string(axis) + " is out of range for an input of rank "
                                       + std::to_string(rank) + ".");
            }
            return resolved;
        }

        [[nodiscard]] inline std::vector<std::int64_t> broadcast(const std::vector<std::int64_t>& lhs,
                                                                 const std::vector<std::int64_t>& rhs)
        {
            const auto rank = std::max(lhs.size(), rhs.size());
            std::vector<std::int64_t> result(rank, 1);
            for (std::size_t offset = 0; offset < rank; ++offset) {
                const auto a = offset < lhs.size() ? lhs[lhs.size() - 1 - offset] : 1;
                const auto b = offset < rhs.size() ? rhs[rhs.size() - 1 - offset] : 1;
                if (a != b && a != 1 && b != 1) {
                    throw Error::ShapeConflict("Shapes " + format_sizes(lhs) + " and " + format_sizes(rhs)
                                               + " cannot be broadcast together.");
                }
                result[rank - 1 - offset] = a == 1 ? b : a;
            }
            return result;
        }
    }

    // Resolves 0 / -1 codes of a reshape target against concrete input sizes.
    [[nodiscard]] inline std::vector<std::int64_t> resolve_reshape(const std::vector<std::int64_t>& target,
                                                                   const std::vector<std::int64_t>& input)
    {
        std::int64_t total = 1;
        for (const auto extent : input) {
            total *= extent;
        }

        std::vector<std::int64_t> resolved(target.size());
        std::optional<std::size_t> inferred{};
        std::int64_t known = 1;
        for (std::size_t index = 0; index < target.size(); ++index) {
            const auto code = target[index];
            if (code == 0) {
                if (index >= input.size()) {
                    throw Error::RankError("Reshape code 0 at position " + std::to_string(index)
                                           + " has no matching dimension in input " + format_sizes(input) + ".");
                }
                resolved[index] = input[index];
            } else if (code == -1) {
                if (inferred) {
                    throw std::invalid_argument("Reshape target may contain -1 at most once.");
                }
                inferred = index;
                continue;
            } else if (code > 0) {
                resolved[index] = code;
            } else {
                throw std::invalid_argument("Reshape target contains invalid extent " + std::to_string(code) + ".");
            }
            known *= resolved[index];
        }

        if (inferred) {
            if (known == 0 || total % known != 0) {
                throw Error::ShapeConflict("Cannot reshape " + format_sizes(input) + " into a target with "
                                           + std::to_string(known) + " fixed elements.");
            }
            resolved[*inferred] = total / known;
        } else if (known != total) {
            throw Error::ShapeConflict("Cannot reshape " + format_sizes(input) + " into "
                                       + format_sizes(resolved) + ".");
        }
        return resolved;
    }

    [[nodiscard]] inline TensorSignature infer(const Attributes& attributes, const std::vector<TensorSignature>& inputs)
    {
        return std::visit(Overloaded{
            [&](const FullyConnectedAttributes& op) {
                detail::require_arity(attributes, inputs, op.no_bias ? 2 : 3, op.no_bias ? 2 : 3);
                const auto& data = inputs[0];
                const auto& weight = inputs[1];
                if (data.rank() != 2) {
                    throw Error::RankError("FullyConnected expects a rank-2 input (batch, features), got "
                                           + format_sizes(data.shape) + ". Flatten the input first.");
                }
                detail::require_floating(attributes, data);
                detail::require_same_dtype(attributes, data, weight);
                detail::require_shape(attributes, weight, {op.units, data.shape[1]}, "weight");
                if (!op.no_bias) {
                    detail::require_shape(attributes, inputs[2], {op.units}, "bias");
                }
                TensorSignature output = data;
                output.shape = {data.shape[0], op.units};
                return output;
            },
            [&](const ActivationAttributes&) {
                detail::require_arity(attributes, inputs, 1, 1);
                detail::require_floating(attributes, inputs[0]);
                return inputs[0];
            },
            [&](const LeakyReLUAttributes&) {
                detail::require_arity(attributes, inputs, 1, 1);
                detail::require_floating(attributes, inputs[0]);
                return inputs[0];
            },
            [&](const DropoutAttributes&) {
                detail::require_arity(attributes, inputs, 1, 1);
                detail::require_floating(attributes, inputs[0]);
                return inputs[0];
            },
            [&](const BatchNormAttributes& op) {
                detail::require_arity(attributes, inputs, 5, 5);
                const auto& data = inputs[0];
                if (data.rank() < 2) {
                    throw Error::RankError("BatchNorm expects an input of rank at least 2, got "
                                           + format_sizes(data.shape) + ".");
                }
                detail::require_floating(attributes, data);
                const auto axis = detail::normalize_axis(op.axis, data.rank());
                const std::vector<std::int64_t> channels{data.shape[static_cast<std::size_t>(axis)]};
                for (std::size_t index = 1; index < inputs.size(); ++index) {
                    detail::require_same_dtype(attributes, data, inputs[index]);
                    detail::require_shape(attributes, inputs[index], channels, "statistics");
                }
                return data;
            },
            [&](const EmbeddingAttributes& op) {
                detail::require_arity(attributes, inputs, 2, 2);
                const auto& indices = inputs[0];
                const auto& weight = inputs[1];
                if (!is_integral_type(indices.dtype)) {
                    throw Error::TypeError("Embedding expects integer indices, got "
                                           + scalar_type_name(indices.dtype) + ".");
                }
                detail::require_shape(attributes, weight, {op.input_dim, op.output_dim}, "weight");
                TensorSignature output = weight;
                output.shape = indices.shape;
                output.shape.push_back(op.output_dim);
                return output;
            },
            [&](const ReshapeAttributes& op) {
                detail::require_arity(attributes, inputs, 1, 1);
                TensorSignature output = inputs[0];
                output.shape = resolve_reshape(op.shape, inputs[0].shape);
                return output;
            },
            [&](const ElementwiseAttributes&) {
                detail::require_arity(attributes, inputs, 2, 2);
                TensorSignature output = inputs[0];
                output.shape = detail::broadcast(inputs[0].shape, inputs[1].shape);
                output.dtype = torch::promote_types(inputs[0].dtype, inputs[1].dtype);
                return output;
            },
            [&](const DotAttributes&) {
                detail::require_arity(attributes, inputs, 2, 2);
                const auto& lhs = inputs[0];
                const auto& rhs = inputs[1];
                if (lhs.rank() != 2 || rhs.rank() != 2) {
                    throw Error::RankError("Dot expects two rank-2 operands, got " + format_sizes(lhs.shape)
                                           + " and " + format_sizes(rhs.shape) + ".");
                }
                if (lhs.shape[1] != rhs.shape[0]) {
                    throw Error::ShapeConflict("Dot operands " + format_sizes(lhs.shape) + " and "
                                               + format_sizes(rhs.shape) + " have mismatched inner dimensions.");
                }
                detail::require_same_dtype(attributes, lhs, rhs);
                TensorSignature output = lhs;
                output.shape = {lhs.shape[0], rhs.shape[1]};
                return output;
            },
        }, attributes);
    }
}

#endif // STRATA_OPS_SHAPE_RULES_HPP
