#ifndef STRATA_ACTIVATION_LEAKY_RELU_HPP
#define STRATA_ACTIVATION_LEAKY_RELU_HPP

#include <torch/torch.h>

namespace Strata::Activation::Details {

    // x for x >= 0, slope * x otherwise.
    struct LeakyReLU {
        double slope{0.01};

        [[nodiscard]] torch::Tensor operator()(const torch::Tensor& input) const {
            return torch::leaky_relu(input, slope);
        }
    };

}

#endif //STRATA_ACTIVATION_LEAKY_RELU_HPP
