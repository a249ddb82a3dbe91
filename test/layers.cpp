#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../include/Strata.h"
#include "support.hpp"

namespace {
    using Strata::Test::expect;
    using Strata::Test::expect_throws;

    bool dense_contract()
    {
        auto dense = Strata::Layer::Dense({.units = 3, .in_units = 2, .use_bias = false});
        dense->initialize();
        dense->weight()->set_data(torch::tensor({{1.0F, 2.0F}, {0.0F, 1.0F}, {-1.0F, 0.0F}}));
        const auto x = torch::tensor({{1.0F, 1.0F}, {2.0F, -1.0F}});

        bool ok = true;
        ok &= expect(dense->bias() == nullptr && dense->collect_params().size() == 1, "use_bias = false");
        ok &= expect(torch::allclose((*dense)(x), torch::matmul(x, dense->weight()->data().t())), "x W^T");
        ok &= expect_throws<Strata::Error::RankError>([&] { static_cast<void>((*dense)(torch::ones({2, 2, 2}))); },
                                                      "Dense rejects rank-3 input");
        ok &= expect_throws<Strata::Error::TypeError>(
            [&] { static_cast<void>((*dense)(torch::ones({2, 2}, torch::kLong))); }, "Dense rejects integer input");
        ok &= expect_throws<std::invalid_argument>([] { static_cast<void>(Strata::Layer::Dense({.units = 0})); },
                                                   "units must be positive");
        return ok;
    }

    bool activation_by_name()
    {
        const auto x = torch::linspace(-3.0, 3.0, 13).reshape({1, 13});
        auto softsign = Strata::Layer::Activation("softsign");
        auto sigmoid = Strata::Layer::Activation(Strata::Activation::Sigmoid);

        bool ok = true;
        ok &= expect(torch::allclose((*softsign)(x), x / (1 + x.abs())), "softsign");
        ok &= expect(torch::allclose((*sigmoid)(x), torch::sigmoid(x)), "sigmoid");
        ok &= expect(softsign->repr() == "Activation(softsign)", "activation repr");
        ok &= expect_throws<std::invalid_argument>(
            [] { static_cast<void>(Strata::Layer::Activation("swish")); }, "unknown activation name");
        return ok;
    }

    bool leaky_relu_slope()
    {
        auto leaky = Strata::Layer::LeakyReLU({.alpha = 0.1});
        const auto x = torch::tensor({{-2.0F, 0.0F, 3.0F}});

        bool ok = true;
        ok &= expect(torch::allclose((*leaky)(x), torch::tensor({{-0.2F, 0.0F, 3.0F}})), "x >= 0 ? x : alpha x");
        ok &= expect_throws<std::invalid_argument>(
            [] { static_cast<void>(Strata::Layer::LeakyReLU({.alpha = -0.5})); }, "negative slope");
        return ok;
    }

    bool dropout_bounds()
    {
        const auto x = torch::rand({64, 16}) + 0.5;
        auto keep = Strata::Layer::Dropout({.rate = 0.0});
        auto drop = Strata::Layer::Dropout({.rate = 1.0});
        auto half = Strata::Layer::Dropout({.rate = 0.5});

        const auto sampled = (*half)(x, Strata::Training);
        const auto kept = sampled != 0;

        bool ok = true;
        ok &= expect(torch::equal((*keep)(x, Strata::Training), x), "rate 0 is the identity");
        ok &= expect(torch::equal((*drop)(x, Strata::Training), torch::zeros_like(x)), "rate 1 zeroes everything");
        ok &= expect(torch::equal((*half)(x, Strata::Inference), x), "inference is the identity");
        ok &= expect(torch::allclose(sampled.masked_select(kept), (x * 2).masked_select(kept)),
                     "survivors are scaled by 1 / (1 - rate)");
        ok &= expect_throws<std::invalid_argument>([] { static_cast<void>(Strata::Layer::Dropout({.rate = -0.1})); },
                                                   "negative rate");
        ok &= expect_throws<std::invalid_argument>([] { static_cast<void>(Strata::Layer::Dropout({.rate = 1.5})); },
                                                   "rate above one");
        return ok;
    }

    bool batchnorm_statistics()
    {
        auto bn = Strata::Layer::BatchNorm({.momentum = 0.9});
        bn->initialize();
        const auto x = torch::randn({16, 3}) * 2.0 + 5.0;

        const auto trained = (*bn)(x, Strata::Training);
        const auto batch_mean = x.mean(0);
        const auto running_mean = bn->running_mean()->data().clone();

        const auto inferred = (*bn)(x, Strata::Inference);
        const auto expected = (x - running_mean) / torch::sqrt(bn->running_var()->data() + 1e-3);

        std::vector<std::string> trainable;
        for (const auto& parameter : bn->collect_params().trainable()) {
            trainable.push_back(parameter->short_name());
        }

        bool ok = true;
        ok &= expect(bn->running_mean()->shape() == Strata::Shape{3}, "channels inferred from axis 1");
        ok &= expect(torch::allclose(trained.mean(0), torch::zeros({3}), 1e-4, 1e-4), "training uses batch statistics");
        ok &= expect(torch::allclose(running_mean, batch_mean * 0.1, 1e-5, 1e-5), "running = 0.9 running + 0.1 batch");
        ok &= expect(torch::allclose(inferred, expected, 1e-5, 1e-5), "inference uses running statistics");
        ok &= expect(torch::equal(bn->running_mean()->data(), running_mean), "inference leaves running stats alone");
        ok &= expect(trainable == std::vector<std::string>{"gamma", "beta"}, "running stats are never trainable");
        ok &= expect(!bn->running_var()->data().requires_grad(), "running stats record no gradients");
        return ok;
    }

    bool batchnorm_options()
    {
        auto fixed = Strata::Layer::BatchNorm({.scale = false, .in_channels = 4});
        auto channels_last = Strata::Layer::BatchNorm({.axis = -1, .use_global_stats = true});
        fixed->initialize();
        channels_last->initialize();

        const auto x = torch::randn({2, 5, 6});
        const auto output = (*channels_last)(x, Strata::Training);

        bool ok = true;
        ok &= expect(!fixed->gamma()->is_trainable() && fixed->beta()->is_trainable(), "gamma follows scale");
        ok &= expect(fixed->repr() == "BatchNorm(axis=1, eps=0.001, momentum=0.9, fix_gamma=True, "
                                      "use_global_stats=False, in_channels=4)",
                     "BatchNorm repr, got " + fixed->repr());
        ok &= expect(channels_last->gamma()->shape() == Strata::Shape{6}, "channels read from the last axis");
        ok &= expect(torch::allclose(output, x / std::sqrt(1.0 + 1e-3), 1e-5, 1e-5),
                     "use_global_stats normalizes with running stats even in training");
        ok &= expect(torch::equal(channels_last->running_mean()->data(), torch::zeros({6})),
                     "use_global_stats never updates running stats");
        ok &= expect_throws<std::invalid_argument>(
            [] { static_cast<void>(Strata::Layer::BatchNorm({.momentum = 1.5})); }, "momentum outside [0, 1]");
        ok &= expect_throws<Strata::Error::ShapeConflict>(
            [&] { static_cast<void>((*fixed)(torch::randn({2, 3}), Strata::Training)); }, "fixed in_channels");
        return ok;
    }

    bool batchnorm_initializers()
    {
        auto bn = Strata::Layer::BatchNorm({
            .in_channels = 3,
            .beta_initializer = Strata::Initialization::Constant(0.5),
            .gamma_initializer = Strata::Initialization::Constant(2.0),
            .running_mean_initializer = Strata::Initialization::Ones,
            .running_variance_initializer = Strata::Initialization::Constant(4.0),
        });
        bn->initialize();
        const auto output = (*bn)(torch::ones({2, 3}), Strata::Inference);

        bool ok = true;
        ok &= expect(torch::equal(bn->gamma()->data(), torch::full({3}, 2.0)), "gamma_initializer");
        ok &= expect(torch::equal(bn->beta()->data(), torch::full({3}, 0.5)), "beta_initializer");
        ok &= expect(torch::equal(bn->running_mean()->data(), torch::ones({3})), "running_mean_initializer");
        ok &= expect(torch::equal(bn->running_var()->data(), torch::full({3}, 4.0)), "running_variance_initializer");
        ok &= expect(torch::allclose(output, torch::full({2, 3}, 0.5)), "(1 - 1) / 2 * 2 + 0.5");
        return ok;
    }

    bool embedding_lookup()
    {
        auto embedding = Strata::Layer::Embedding({.input_dim = 10, .output_dim = 4});
        embedding->initialize(Strata::Initialization::Normal(1.0));
        const auto indices = torch::tensor({{0, 3, 9}, {3, 3, 1}}, torch::kLong);
        const auto output = (*embedding)(indices);
        const auto& weight = embedding->weight()->data();

        bool ok = true;
        ok &= expect(output.sizes() == torch::IntArrayRef({2, 3, 4}), "indices shape + output_dim");
        ok &= expect(torch::equal(output[0][2], weight[9]) && torch::equal(output[1][0], weight[3]), "row lookup");
        ok &= expect(embedding->repr() == "Embedding(10 -> 4, float32)", "Embedding repr");
        ok &= expect_throws<Strata::Error::TypeError>([&] { static_cast<void>((*embedding)(torch::zeros({2, 3}))); },
                                                      "floating indices");
        ok &= expect_throws<std::out_of_range>(
            [&] { static_cast<void>((*embedding)(torch::tensor({10}, torch::kLong))); }, "index past input_dim");
        ok &= expect_throws<std::out_of_range>(
            [&] { static_cast<void>((*embedding)(torch::tensor({-1}, torch::kLong))); }, "negative index");
        return ok;
    }

    bool flatten_shape_law()
    {
        auto flatten = Strata::Layer::Flatten();
        const auto x = torch::arange(24, torch::kFloat32).reshape({2, 3, 4});
        const auto eager = (*flatten)(x);
        flatten->hybridize();
        const auto traced = (*flatten)(x);

        bool ok = true;
        ok &= expect(eager.sizes() == torch::IntArrayRef({2, 12}), "(N, d1, d2) -> (N, d1 * d2)");
        ok &= expect(eager[1][5].item<float>() == x[1][1][1].item<float>(), "row-major correspondence");
        ok &= expect(torch::equal(traced, eager), "traced flatten matches");
        ok &= expect((*flatten)(torch::ones({5})).sizes() == torch::IntArrayRef({5, 1}), "rank 1 keeps the batch axis");
        ok &= expect_throws<Strata::Error::RankError>([&] { static_cast<void>((*flatten)(torch::tensor(3.0))); },
                                                      "rank 0 has no batch axis");
        return ok;
    }

    bool flatten_empty_batch()
    {
        auto flatten = Strata::Layer::Flatten();
        const auto x = torch::zeros({0, 3, 4});
        const auto eager = (*flatten)(x);
        flatten->hybridize();
        const auto traced = (*flatten)(x);

        bool ok = true;
        ok &= expect(eager.sizes() == torch::IntArrayRef({0, 12}), "eager (0, 3, 4) -> (0, 12)");
        ok &= expect(traced.sizes() == torch::IntArrayRef({0, 12}), "traced (0, 3, 4) -> (0, 12)");
        return ok;
    }
}

int main()
{
    torch::manual_seed(0);

    bool ok = true;
    ok &= dense_contract();
    ok &= activation_by_name();
    ok &= leaky_relu_slope();
    ok &= dropout_bounds();
    ok &= batchnorm_statistics();
    ok &= batchnorm_options();
    ok &= batchnorm_initializers();
    ok &= embedding_lookup();
    ok &= flatten_shape_law();
    ok &= flatten_empty_batch();
    if (!ok) {
        return 1;
    }
    std::cout << "Layer tests passed." << std::endl;
    return 0;
}
