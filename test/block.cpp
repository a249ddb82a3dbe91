#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../include/Strata.h"
#include "support.hpp"

namespace {
    using Strata::Test::expect;
    using Strata::Test::expect_throws;

    std::vector<std::string> names_of(const Strata::ParameterDict& dict)
    {
        std::vector<std::string> names;
        for (const auto& parameter : dict) {
            names.push_back(parameter->name());
        }
        return names;
    }

    bool registration_scopes_names()
    {
        auto net = Strata::Blocks::Sequential();
        const auto first = net->add(Strata::Layer::Dense({.units = 10}, Strata::Activation::ReLU));
        const auto second = net->add(Strata::Layer::Dense({.units = 2, .use_bias = false}));
        const auto dropout = net->add(Strata::Layer::Dropout({.rate = 0.5}));

        const auto collected = net->collect_params();
        const std::vector<std::string> expected{"sequential0_dense0_weight", "sequential0_dense0_bias",
                                                "sequential0_dense1_weight"};

        bool ok = true;
        ok &= expect(net->prefix() == "sequential0_", "top-level prefix");
        ok &= expect(first->prefix() == "sequential0_dense0_", "first Dense scoped under its parent");
        ok &= expect(second->prefix() == "sequential0_dense1_", "alias counter per parent");
        ok &= expect(dropout->name() == "sequential0_dropout0", "name drops the trailing underscore");
        ok &= expect(first->children().front().second->prefix() == "sequential0_dense0_relu0_",
                     "rescoping reaches grandchildren");
        ok &= expect(names_of(collected) == expected, "collect_params is in registration order");
        ok &= expect(net->children()[1].first == "1", "positional registration keys");
        ok &= expect(first->parent() == net.get(), "parent link");
        return ok;
    }

    bool explicit_prefix_and_keys()
    {
        auto net = Strata::Blocks::Sequential({.prefix = "model_"});
        const auto encoder = net->register_child(Strata::Layer::Dense({.units = 4}, Strata::Activation::Identity,
                                                                      Strata::Initialization::Default,
                                                                      Strata::Initialization::Zeros,
                                                                      {.prefix = "encoder_"}),
                                                 "encoder");

        bool ok = true;
        ok &= expect(encoder->weight()->name() == "model_encoder_weight", "explicit local prefix is kept");
        ok &= expect(net->children().front().first == "encoder", "explicit key");
        ok &= expect_throws<std::invalid_argument>(
            [&] { static_cast<void>(net->register_child(Strata::Layer::Flatten(), "encoder")); }, "duplicate key");
        return ok;
    }

    bool single_parent_and_cycles()
    {
        auto outer = Strata::Blocks::Sequential();
        auto inner = outer->add(Strata::Blocks::Sequential());
        auto dense = Strata::Layer::Dense({.units = 3});
        inner->add(dense);

        bool ok = true;
        ok &= expect_throws<std::invalid_argument>([&] { static_cast<void>(outer->add(dense)); },
                                                   "a Block has one parent");
        ok &= expect_throws<std::invalid_argument>([&] { static_cast<void>(inner->add(outer)); },
                                                   "an ancestor cannot become a child");
        ok &= expect(dense->prefix() == "sequential0_sequential0_dense0_", "nested scopes concatenate");
        return ok;
    }

    bool duplicate_names_are_rejected()
    {
        auto net = Strata::Blocks::Sequential();
        const Strata::BlockOptions fixed{.prefix = "fc_"};
        net->add(Strata::Layer::Dense({.units = 3}, Strata::Activation::Identity, Strata::Initialization::Default,
                                      Strata::Initialization::Zeros, fixed));
        auto clash = Strata::Layer::Dense({.units = 3}, Strata::Activation::Identity, Strata::Initialization::Default,
                                          Strata::Initialization::Zeros, fixed);

        bool ok = true;
        ok &= expect_throws<Strata::Error::DuplicateName>([&] { static_cast<void>(net->add(clash)); },
                                                          "two Parameters named sequential0_fc_weight");
        ok &= expect(net->size() == 1, "failed registration is rolled back");
        ok &= expect(clash->parent() == nullptr && clash->weight()->name() == "fc_weight",
                     "rejected child keeps its previous names");
        return ok;
    }

    bool shared_dict_ties_weights()
    {
        auto tied = std::make_shared<Strata::ParameterDict>("tied_");
        auto net = Strata::Blocks::Sequential();
        const auto first = net->add(Strata::Layer::Dense({.units = 4, .in_units = 4}, Strata::Activation::Identity,
                                                         Strata::Initialization::Default, Strata::Initialization::Zeros,
                                                         {.params = tied}));
        const auto second = net->add(Strata::Layer::Dense({.units = 4, .in_units = 4}, Strata::Activation::Identity,
                                                          Strata::Initialization::Default, Strata::Initialization::Zeros,
                                                          {.params = tied}));
        net->initialize();

        bool ok = true;
        ok &= expect(first->weight() == second->weight(), "shared dict yields one weight");
        ok &= expect(first->weight()->name() == "tied_weight", "explicit dict is not rescoped");
        ok &= expect(net->collect_params().size() == 2, "tied Parameters are collected once");
        return ok;
    }

    bool hybrid_children_must_be_hybrid()
    {
        auto hybrid = Strata::Blocks::HybridSequential();
        return expect_throws<std::invalid_argument>(
            [&] { static_cast<void>(hybrid->add(Strata::Blocks::Sequential())); },
            "HybridSequential rejects plain Blocks");
    }

    bool sequential_law()
    {
        auto net = Strata::Blocks::Sequential();
        const auto a = net->add(Strata::Layer::Dense({.units = 6, .in_units = 5}, Strata::Activation::Tanh));
        const auto b = net->add(Strata::Layer::LeakyReLU({.alpha = 0.2}));
        const auto c = net->add(Strata::Layer::Dense({.units = 3}));
        net->initialize(Strata::Initialization::XavierUniform);

        const auto x = torch::randn({4, 5});
        const auto chained = net->forward(x, Strata::Inference);
        const auto composed = c->forward(b->forward(a->forward(x, Strata::Inference), Strata::Inference),
                                         Strata::Inference);

        bool ok = true;
        ok &= expect(torch::equal(chained, composed), "Sequential[A, B, C](x) == C(B(A(x)))");
        ok &= expect(net->at(2) == c, "at() follows registration order");
        ok &= expect_throws<std::out_of_range>([&] { static_cast<void>(net->at(3)); }, "at() past the end");
        return ok;
    }

    bool repr_is_nested()
    {
        auto net = Strata::Blocks::Sequential();
        net->add(Strata::Layer::Dense({.units = 10, .in_units = 7}, Strata::Activation::ReLU));
        auto body = net->add(Strata::Blocks::HybridSequential());
        body->add(Strata::Layer::Dense({.units = 4}));
        body->add(Strata::Layer::Dropout({.rate = 0.25}));
        net->add(Strata::Layer::Flatten());

        const std::string expected = "Sequential(\n"
                                     "  (0): Dense(7 -> 10, Activation(relu))\n"
                                     "  (1): HybridSequential(\n"
                                     "    (0): Dense(None -> 4, linear)\n"
                                     "    (1): Dropout(p = 0.25)\n"
                                     "  )\n"
                                     "  (2): Flatten\n"
                                     ")";
        std::ostringstream stream;
        stream << *net;

        bool ok = true;
        ok &= expect(net->repr() == expected, "nested repr, got:\n" + net->repr());
        ok &= expect(stream.str() == expected, "operator<< prints repr");
        return ok;
    }
}

int main()
{
    torch::manual_seed(0);

    bool ok = true;
    ok &= registration_scopes_names();
    ok &= explicit_prefix_and_keys();
    ok &= single_parent_and_cycles();
    ok &= duplicate_names_are_rejected();
    ok &= shared_dict_ties_weights();
    ok &= hybrid_children_must_be_hybrid();
    ok &= sequential_law();
    ok &= repr_is_nested();
    if (!ok) {
        return 1;
    }
    std::cout << "Block tests passed." << std::endl;
    return 0;
}
