#ifndef STRATA_LAYER_LEAKY_RELU_HPP
#define STRATA_LAYER_LEAKY_RELU_HPP

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "../../block/details/hybrid.hpp"
#include "../../ops/ops.hpp"

namespace Strata::Layer::Details {
    struct LeakyReLUOptions {
        double alpha{0.01};
    };

    class LeakyReLUImpl : public HybridBlock {
    public:
        explicit LeakyReLUImpl(LeakyReLUOptions options = {}, BlockOptions block = {})
            : HybridBlock("LeakyReLU", std::move(block)), options_(options)
        {
            if (!(options_.alpha >= 0.0)) {
                throw std::invalid_argument("LeakyReLU slope must be non-negative.");
            }
        }

        [[nodiscard]] const LeakyReLUOptions& options() const noexcept { return options_; }

    protected:
        Ops::Value hybrid_forward(Ops::Namespace& F, const Ops::Value& x, const ParameterValues&) override
        {
            return F.leaky_relu(x, options_.alpha);
        }

        [[nodiscard]] std::string extra_repr() const override
        {
            std::ostringstream stream;
            stream << options_.alpha;
            return stream.str();
        }

    private:
        LeakyReLUOptions options_{};
    };
}

#endif // STRATA_LAYER_LEAKY_RELU_HPP
