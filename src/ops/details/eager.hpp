#ifndef STRATA_OPS_EAGER_HPP
#define STRATA_OPS_EAGER_HPP

#include <memory>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "../../common/context.hpp"
#include "../../parameter/parameter.hpp"
#include "attributes.hpp"
#include "kernels.hpp"
#include "namespace.hpp"
#include "shape_rules.hpp"
#include "value.hpp"

namespace Strata::Ops {
    class EagerNamespace final : public Namespace {
    public:
        explicit EagerNamespace(ExecutionContext context = Inference) : Namespace(context) {}

        [[nodiscard]] bool is_symbolic() const noexcept override { return false; }

        [[nodiscard]] Value parameter(const std::shared_ptr<Parameter>& parameter) override
        {
            if (!parameter) {
                throw std::invalid_argument("Cannot bind a null Parameter.");
            }
            return Value::concrete(parameter->data());
        }

    protected:
        [[nodiscard]] Value apply(const Attributes& attributes, const std::vector<Value>& inputs) override
        {
            std::vector<TensorSignature> signatures;
            std::vector<torch::Tensor> tensors;
            signatures.reserve(inputs.size());
            tensors.reserve(inputs.size());
            for (const auto& input : inputs) {
                tensors.push_back(input.tensor());
                signatures.push_back(input.signature());
            }
            static_cast<void>(Details::infer(attributes, signatures));
            return Value::concrete(Details::run(attributes, tensors, context()));
        }
    };
}

#endif // STRATA_OPS_EAGER_HPP
