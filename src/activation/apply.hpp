#ifndef STRATA_ACTIVATION_APPLY_HPP
#define STRATA_ACTIVATION_APPLY_HPP

#include <torch/torch.h>

#include <utility>

#include "activation.hpp"
#include "details/relu.hpp"
#include "details/sigmoid.hpp"
#include "details/softrelu.hpp"
#include "details/softsign.hpp"
#include "details/tanh.hpp"

namespace Strata::Activation::Details {
    inline torch::Tensor apply(::Strata::Activation::Type type, torch::Tensor input) {
        switch (type) {
            case ::Strata::Activation::Type::ReLU:
                return ReLU{}(std::move(input));
            case ::Strata::Activation::Type::Sigmoid:
                return Sigmoid{}(std::move(input));
            case ::Strata::Activation::Type::Tanh:
                return Tanh{}(std::move(input));
            case ::Strata::Activation::Type::SoftReLU:
                return SoftReLU{}(std::move(input));
            case ::Strata::Activation::Type::SoftSign:
                return SoftSign{}(std::move(input));
            case ::Strata::Activation::Type::Identity:
            default:
                return input;
        }
    }
}
#endif // STRATA_ACTIVATION_APPLY_HPP
