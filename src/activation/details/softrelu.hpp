#ifndef STRATA_ACTIVATION_SOFTRELU_HPP
#define STRATA_ACTIVATION_SOFTRELU_HPP

#include <torch/torch.h>

namespace Strata::Activation::Details {
    struct SoftReLU {
        [[nodiscard]] torch::Tensor operator()(const torch::Tensor& input) const {
            return torch::softplus(input);
        }
    };
}

#endif //STRATA_ACTIVATION_SOFTRELU_HPP
