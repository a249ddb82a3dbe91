#ifndef STRATA_ACTIVATION_TANH_HPP
#define STRATA_ACTIVATION_TANH_HPP

#include <torch/torch.h>

namespace Strata::Activation::Details {
    struct Tanh {
        [[nodiscard]] torch::Tensor operator()(const torch::Tensor& input) const {
            return torch::tanh(input);
        }
    };
}

#endif //STRATA_ACTIVATION_TANH_HPP
