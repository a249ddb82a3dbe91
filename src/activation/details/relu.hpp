#ifndef STRATA_ACTIVATION_RELU_HPP
#define STRATA_ACTIVATION_RELU_HPP

#include <torch/torch.h>

namespace Strata::Activation::Details {
    struct ReLU {
        [[nodiscard]] torch::Tensor operator()(const torch::Tensor& input) const {
            return torch::relu(input);
        }
    };
}

#endif //STRATA_ACTIVATION_RELU_HPP
