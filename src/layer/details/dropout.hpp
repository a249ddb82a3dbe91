#ifndef STRATA_LAYER_DROPOUT_HPP
#define STRATA_LAYER_DROPOUT_HPP

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "../../block/details/hybrid.hpp"
#include "../../ops/ops.hpp"

namespace Strata::Layer::Details {
    struct DropoutOptions {
        double rate{0.5};
    };

    class DropoutImpl : public HybridBlock {
    public:
        explicit DropoutImpl(DropoutOptions options = {}, BlockOptions block = {})
            : HybridBlock("Dropout", std::move(block)), options_(options)
        {
            if (!(options_.rate >= 0.0 && options_.rate <= 1.0)) {
                throw std::invalid_argument("Dropout rate must lie in [0, 1].");
            }
        }

        [[nodiscard]] const DropoutOptions& options() const noexcept { return options_; }

    protected:
        Ops::Value hybrid_forward(Ops::Namespace& F, const Ops::Value& x, const ParameterValues&) override
        {
            return F.dropout(x, options_.rate);
        }

        [[nodiscard]] std::string extra_repr() const override
        {
            std::ostringstream stream;
            stream << "p = " << options_.rate;
            return stream.str();
        }

    private:
        DropoutOptions options_{};
    };
}

#endif // STRATA_LAYER_DROPOUT_HPP
