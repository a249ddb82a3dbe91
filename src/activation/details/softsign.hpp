#ifndef STRATA_ACTIVATION_SOFTSIGN_HPP
#define STRATA_ACTIVATION_SOFTSIGN_HPP

#include <torch/torch.h>

namespace Strata::Activation::Details {
    struct SoftSign {
        [[nodiscard]] torch::Tensor operator()(const torch::Tensor& input) const {
            return input / (1 + torch::abs(input));
        }
    };
}

#endif //STRATA_ACTIVATION_SOFTSIGN_HPP
