#ifndef STRATA_OPS_VALUE_HPP
#define STRATA_OPS_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/error.hpp"
#include "../../common/shape.hpp"

namespace Strata::Ops {
    // What layer code holds while running through an operator namespace:
    // either a concrete tensor or a placeholder for a node of the graph being
    // traced. Shape metadata is available in both cases, data only in the first.
    class Value {
    public:
        enum class Kind {
            Concrete,
            Symbolic,
        };

        Value() = default;

        [[nodiscard]] static Value concrete(torch::Tensor tensor)
        {
            Value value{};
            value.kind_ = Kind::Concrete;
            value.signature_ = describe_tensor(tensor);
            value.tensor_ = std::move(tensor);
            return value;
        }

        [[nodiscard]] static Value symbolic(std::size_t node, TensorSignature signature)
        {
            Value value{};
            value.kind_ = Kind::Symbolic;
            value.node_ = node;
            value.signature_ = std::move(signature);
            return value;
        }

        [[nodiscard]] Kind kind() const noexcept { return kind_; }
        [[nodiscard]] bool is_symbolic() const noexcept { return kind_ == Kind::Symbolic; }
        [[nodiscard]] bool defined() const noexcept
        {
            return kind_ == Kind::Symbolic || tensor_.defined();
        }

        [[nodiscard]] const TensorSignature& signature() const noexcept { return signature_; }
        [[nodiscard]] const std::vector<std::int64_t>& shape() const noexcept { return signature_.shape; }
        [[nodiscard]] torch::ScalarType dtype() const noexcept { return signature_.dtype; }
        [[nodiscard]] std::int64_t dim() const noexcept { return signature_.rank(); }

        [[nodiscard]] std::int64_t size(std::int64_t axis) const
        {
            const auto rank = dim();
            const auto resolved = axis < 0 ? axis + rank : axis;
            if (resolved < 0 || resolved >= rank) {
                throw Error::RankError("Axis " + std::to_string(axis) + " is out of range for shape "
                                       + format_sizes(signature_.shape) + ".");
            }
            return signature_.shape[static_cast<std::size_t>(resolved)];
        }

        // Concrete data. Asking for it while tracing means the computation
        // depends on values the graph cannot know in advance.
        [[nodiscard]] const torch::Tensor& tensor() const
        {
            if (kind_ == Kind::Symbolic) {
                throw Error::TraceError(
                    "Concrete tensor data was requested from a symbolic value with " + format_signature(signature_)
                    + ". Hybridized computations cannot branch on tensor contents.");
            }
            return tensor_;
        }

        [[nodiscard]] std::size_t node() const
        {
            if (kind_ != Kind::Symbolic) {
                throw std::logic_error("Concrete values are not bound to a graph node.");
            }
            return node_;
        }

    private:
        Kind kind_{Kind::Concrete};
        torch::Tensor tensor_{};
        std::size_t node_{std::numeric_limits<std::size_t>::max()};
        TensorSignature signature_{};
    };
}

#endif // STRATA_OPS_VALUE_HPP
