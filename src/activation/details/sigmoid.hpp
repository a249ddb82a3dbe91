#ifndef STRATA_ACTIVATION_SIGMOID_HPP
#define STRATA_ACTIVATION_SIGMOID_HPP

#include <torch/torch.h>

namespace Strata::Activation::Details {
    struct Sigmoid {
        [[nodiscard]] torch::Tensor operator()(const torch::Tensor& input) const {
            return torch::sigmoid(input);
        }
    };
}

#endif //STRATA_ACTIVATION_SIGMOID_HPP
