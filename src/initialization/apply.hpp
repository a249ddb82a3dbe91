#ifndef STRATA_INITIALIZATION_APPLY_HPP
#define STRATA_INITIALIZATION_APPLY_HPP
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "initialization.hpp"

namespace Strata::Initialization::Details {
    namespace detail {
        inline void require_matrix(const torch::Tensor& tensor, const char* scheme)
        {
            if (tensor.dim() < 2) {
                throw std::invalid_argument(std::string(scheme)
                    + " initialization requires a tensor with at least two dimensions.");
            }
        }
    }  // namespace detail

    [[nodiscard]] inline Descriptor resolve(const Descriptor& preferred, const Descriptor& fallback) noexcept
    {
        if (preferred.type != Type::Default) {
            return preferred;
        }
        if (fallback.type != Type::Default) {
            return fallback;
        }
        return ::Strata::Initialization::Fallback;
    }

    // (shape, dtype) -> tensor. Never records autograd history.
    [[nodiscard]] inline torch::Tensor create(const Descriptor& descriptor,
                                              const std::vector<std::int64_t>& shape,
                                              torch::ScalarType dtype)
    {
        torch::NoGradGuard no_grad{};
        const auto options = torch::TensorOptions().dtype(dtype);
        const auto resolved = resolve(descriptor, ::Strata::Initialization::Fallback);

        switch (resolved.type) {
            case Type::Zeros:
                return torch::zeros(shape, options);
            case Type::Ones:
                return torch::ones(shape, options);
            case Type::Constant:
                return torch::full(shape, resolved.value, options);
            case Type::Normal:
                return torch::empty(shape, options).normal_(0.0, resolved.value);
            case Type::XavierNormal: {
                auto tensor = torch::empty(shape, options);
                detail::require_matrix(tensor, "Xavier");
                torch::nn::init::xavier_normal_(tensor);
                return tensor;
            }
            case Type::XavierUniform: {
                auto tensor = torch::empty(shape, options);
                detail::require_matrix(tensor, "Xavier");
                torch::nn::init::xavier_uniform_(tensor);
                return tensor;
            }
            case Type::HeNormal: {
                auto tensor = torch::empty(shape, options);
                detail::require_matrix(tensor, "He");
                torch::nn::init::kaiming_normal_(tensor, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                return tensor;
            }
            case Type::HeUniform: {
                auto tensor = torch::empty(shape, options);
                detail::require_matrix(tensor, "He");
                torch::nn::init::kaiming_uniform_(tensor, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                return tensor;
            }
            case Type::Uniform:
            case Type::Default:
            default:
                return torch::empty(shape, options).uniform_(-resolved.value, resolved.value);
        }
    }
}
#endif // STRATA_INITIALIZATION_APPLY_HPP
