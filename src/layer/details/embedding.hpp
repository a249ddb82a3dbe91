#ifndef STRATA_LAYER_EMBEDDING_HPP
#define STRATA_LAYER_EMBEDDING_HPP

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../block/details/hybrid.hpp"
#include "../../common/shape.hpp"
#include "../../initialization/initialization.hpp"
#include "../../ops/ops.hpp"
#include "../../parameter/parameter.hpp"

namespace Strata::Layer::Details {
    struct EmbeddingOptions {
        std::int64_t input_dim{};
        std::int64_t output_dim{};
        torch::ScalarType dtype{torch::kFloat32};
    };

    // Maps integer indices of any shape to rows of a (input_dim, output_dim) table.
    class EmbeddingImpl : public HybridBlock {
    public:
        explicit EmbeddingImpl(EmbeddingOptions options,
                               ::Strata::Initialization::Descriptor weight_initializer = ::Strata::Initialization::Default,
                               BlockOptions block = {})
            : HybridBlock("Embedding", std::move(block)), options_(options)
        {
            if (options_.input_dim <= 0 || options_.output_dim <= 0) {
                throw std::invalid_argument("Embedding layers require positive input_dim and output_dim.");
            }
            weight_ = declare_parameter("weight", ParameterOptions{
                .shape = {options_.input_dim, options_.output_dim},
                .dtype = options_.dtype,
                .initializer = weight_initializer,
            });
        }

        [[nodiscard]] const EmbeddingOptions& options() const noexcept { return options_; }
        [[nodiscard]] const std::shared_ptr<Parameter>& weight() const noexcept { return weight_; }

    protected:
        Ops::Value hybrid_forward(Ops::Namespace& F, const Ops::Value& x, const ParameterValues& params) override
        {
            return F.embedding(x, params["weight"], options_.input_dim, options_.output_dim);
        }

        [[nodiscard]] std::string extra_repr() const override
        {
            return std::to_string(options_.input_dim) + " -> " + std::to_string(options_.output_dim) + ", "
                   + scalar_type_name(options_.dtype);
        }

    private:
        EmbeddingOptions options_{};
        std::shared_ptr<Parameter> weight_{};
    };
}

#endif // STRATA_LAYER_EMBEDDING_HPP
