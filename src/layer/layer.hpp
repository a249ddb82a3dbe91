#ifndef STRATA_LAYER_HPP
#define STRATA_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <string_view>
#include <utility>

#include "details/activation.hpp"
#include "details/batchnorm.hpp"
#include "details/dropout.hpp"
#include "details/embedding.hpp"
#include "details/fc.hpp"
#include "details/flatten.hpp"
#include "details/leaky_relu.hpp"

namespace Strata::Layer {
    using DenseOptions = Details::DenseOptions;
    using DenseImpl = Details::DenseImpl;

    using ActivationOptions = Details::ActivationOptions;
    using ActivationImpl = Details::ActivationImpl;

    using DropoutOptions = Details::DropoutOptions;
    using DropoutImpl = Details::DropoutImpl;

    using BatchNormOptions = Details::BatchNormOptions;
    using BatchNormImpl = Details::BatchNormImpl;

    using LeakyReLUOptions = Details::LeakyReLUOptions;
    using LeakyReLUImpl = Details::LeakyReLUImpl;

    using EmbeddingOptions = Details::EmbeddingOptions;
    using EmbeddingImpl = Details::EmbeddingImpl;

    using FlattenImpl = Details::FlattenImpl;

    [[nodiscard]] inline auto Dense(const DenseOptions& options,
                                    ::Strata::Activation::Descriptor activation = ::Strata::Activation::Identity,
                                    ::Strata::Initialization::Descriptor weight_initializer = ::Strata::Initialization::Default,
                                    ::Strata::Initialization::Descriptor bias_initializer = ::Strata::Initialization::Zeros,
                                    BlockOptions block = {}) -> std::shared_ptr<DenseImpl> {
        return std::make_shared<DenseImpl>(options, activation, weight_initializer, bias_initializer, std::move(block));
    }

    [[nodiscard]] inline auto Activation(::Strata::Activation::Descriptor activation, BlockOptions block = {})
        -> std::shared_ptr<ActivationImpl> {
        return std::make_shared<ActivationImpl>(ActivationOptions{activation.type}, std::move(block));
    }

    [[nodiscard]] inline auto Activation(std::string_view name, BlockOptions block = {}) -> std::shared_ptr<ActivationImpl> {
        return Activation(::Strata::Activation::parse(name), std::move(block));
    }

    [[nodiscard]] inline auto Dropout(const DropoutOptions& options = {}, BlockOptions block = {})
        -> std::shared_ptr<DropoutImpl> {
        return std::make_shared<DropoutImpl>(options, std::move(block));
    }

    [[nodiscard]] inline auto BatchNorm(const BatchNormOptions& options = {}, BlockOptions block = {})
        -> std::shared_ptr<BatchNormImpl> {
        return std::make_shared<BatchNormImpl>(options, std::move(block));
    }

    [[nodiscard]] inline auto LeakyReLU(const LeakyReLUOptions& options = {}, BlockOptions block = {})
        -> std::shared_ptr<LeakyReLUImpl> {
        return std::make_shared<LeakyReLUImpl>(options, std::move(block));
    }

    [[nodiscard]] inline auto Embedding(const EmbeddingOptions& options,
                                        ::Strata::Initialization::Descriptor weight_initializer = ::Strata::Initialization::Default,
                                        BlockOptions block = {}) -> std::shared_ptr<EmbeddingImpl> {
        return std::make_shared<EmbeddingImpl>(options, weight_initializer, std::move(block));
    }

    [[nodiscard]] inline auto Flatten(BlockOptions block = {}) -> std::shared_ptr<FlattenImpl> {
        return std::make_shared<FlattenImpl>(std::move(block));
    }
}

#endif // STRATA_LAYER_HPP
