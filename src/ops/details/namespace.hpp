#ifndef STRATA_OPS_NAMESPACE_HPP
#define STRATA_OPS_NAMESPACE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include "../../activation/activation.hpp"
#include "../../common/context.hpp"
#include "../../common/error.hpp"
#include "../../parameter/parameter.hpp"
#include "attributes.hpp"
#include "value.hpp"

namespace Strata::Ops {
    // The operator namespace handed to hybrid_forward. Layer code is written
    // once against this interface; the eager implementation computes values
    // immediately and the symbolic one records graph nodes.
    class Namespace {
    public:
        explicit Namespace(ExecutionContext context) : context_(context) {}
        virtual ~Namespace() = default;

        Namespace(const Namespace&) = delete;
        Namespace& operator=(const Namespace&) = delete;

        [[nodiscard]] virtual bool is_symbolic() const noexcept = 0;
        [[nodiscard]] const ExecutionContext& context() const noexcept { return context_; }

        // Binds a materialized Parameter into the computation.
        [[nodiscard]] virtual Value parameter(const std::shared_ptr<Parameter>& parameter) = 0;

        [[nodiscard]] Value fully_connected(const Value& x, const Value& weight, const Value& bias, std::int64_t units)
        {
            return apply(FullyConnectedAttributes{units, false}, {x, weight, bias});
        }

        [[nodiscard]] Value fully_connected(const Value& x, const Value& weight, std::int64_t units)
        {
            return apply(FullyConnectedAttributes{units, true}, {x, weight});
        }

        [[nodiscard]] Value activation(const Value& x, Activation::Type type)
        {
            return apply(ActivationAttributes{type}, {x});
        }

        [[nodiscard]] Value activation(const Value& x, std::string_view name)
        {
            return activation(x, Activation::parse(name).type);
        }

        [[nodiscard]] Value leaky_relu(const Value& x, double slope)
        {
            return apply(LeakyReLUAttributes{slope}, {x});
        }

        [[nodiscard]] Value dropout(const Value& x, double rate)
        {
            return apply(DropoutAttributes{rate}, {x});
        }

        [[nodiscard]] Value batch_norm(const Value& x, const Value& gamma, const Value& beta,
                                       const Value& running_mean, const Value& running_var,
                                       const BatchNormAttributes& attributes)
        {
            return apply(attributes, {x, gamma, beta, running_mean, running_var});
        }

        [[nodiscard]] Value embedding(const Value& x, const Value& weight, std::int64_t input_dim, std::int64_t output_dim)
        {
            return apply(EmbeddingAttributes{input_dim, output_dim}, {x, weight});
        }

        [[nodiscard]] Value reshape(const Value& x, std::vector<std::int64_t> shape)
        {
            return apply(ReshapeAttributes{std::move(shape)}, {x});
        }

        // (N, d1, ..., dk) -> (N, d1 * ... * dk)
        [[nodiscard]] Value flatten(const Value& x)
        {
            if (x.dim() == 0) {
                throw Error::RankError("Flatten needs at least one dimension to keep as the batch axis.");
            }
            const auto& sizes = x.shape();
            std::int64_t features = 1;
            for (std::size_t axis = 1; axis < sizes.size(); ++axis) {
                features *= sizes[axis];
            }
            // Explicit extent, so an empty batch does not leave -1 ambiguous.
            return reshape(x, {0, features});
        }

        [[nodiscard]] Value add(const Value& lhs, const Value& rhs)
        {
            return apply(ElementwiseAttributes{ElementwiseAttributes::Kind::Add}, {lhs, rhs});
        }

        [[nodiscard]] Value subtract(const Value& lhs, const Value& rhs)
        {
            return apply(ElementwiseAttributes{ElementwiseAttributes::Kind::Subtract}, {lhs, rhs});
        }

        [[nodiscard]] Value multiply(const Value& lhs, const Value& rhs)
        {
            return apply(ElementwiseAttributes{ElementwiseAttributes::Kind::Multiply}, {lhs, rhs});
        }

        [[nodiscard]] Value dot(const Value& lhs, const Value& rhs)
        {
            return apply(DotAttributes{}, {lhs, rhs});
        }

    protected:
        [[nodiscard]] virtual Value apply(const Attributes& attributes, const std::vector<Value>& inputs) = 0;

    private:
        ExecutionContext context_;
    };
}

#endif // STRATA_OPS_NAMESPACE_HPP
