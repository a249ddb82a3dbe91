#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../include/Strata.h"
#include "support.hpp"

namespace {
    using Strata::Test::expect;
    using Strata::Test::expect_throws;
    using Strata::Ops::Value;

    bool eager_namespace_computes()
    {
        Strata::Ops::EagerNamespace F{Strata::Inference};
        const auto a = torch::tensor({{1.0F, 2.0F}, {3.0F, 4.0F}});
        const auto b = torch::tensor({{0.5F, -1.0F}, {2.0F, 0.0F}});

        bool ok = true;
        ok &= expect(!F.is_symbolic(), "eager namespace");
        ok &= expect(torch::equal(F.add(Value::concrete(a), Value::concrete(b)).tensor(), a + b), "add");
        ok &= expect(torch::equal(F.subtract(Value::concrete(a), Value::concrete(b)).tensor(), a - b), "subtract");
        ok &= expect(torch::equal(F.multiply(Value::concrete(a), Value::concrete(b)).tensor(), a * b), "multiply");
        ok &= expect(torch::equal(F.dot(Value::concrete(a), Value::concrete(b)).tensor(), torch::matmul(a, b)), "dot");
        ok &= expect(F.reshape(Value::concrete(a), {-1}).shape() == std::vector<std::int64_t>{4}, "reshape");
        ok &= expect(torch::equal(F.activation(Value::concrete(a), "tanh").tensor(), torch::tanh(a)), "activation by name");
        return ok;
    }

    bool shape_rules_are_shared()
    {
        Strata::Ops::EagerNamespace eager{};
        Strata::Ops::SymbolicNamespace symbolic{};
        const auto lhs = torch::ones({2, 3});
        const auto rhs = torch::ones({4, 2});
        const auto traced = symbolic.input(Strata::describe_tensor(lhs));

        bool ok = true;
        ok &= expect_throws<Strata::Error::ShapeConflict>(
            [&] { static_cast<void>(eager.dot(Value::concrete(lhs), Value::concrete(rhs))); }, "eager dot mismatch");
        ok &= expect_throws<Strata::Error::ShapeConflict>(
            [&] { static_cast<void>(symbolic.dot(traced, Value::concrete(rhs))); }, "symbolic dot mismatch");
        ok &= expect_throws<Strata::Error::ShapeConflict>(
            [&] { static_cast<void>(eager.add(Value::concrete(lhs), Value::concrete(rhs))); }, "broadcast failure");
        ok &= expect_throws<Strata::Error::RankError>(
            [&] { static_cast<void>(symbolic.flatten(Value::concrete(torch::tensor(1.0)))); }, "flatten of a scalar");
        return ok;
    }

    bool symbolic_values_carry_shapes_only()
    {
        Strata::Ops::SymbolicNamespace F{};
        const auto x = F.input(Strata::TensorSignature{torch::kCPU, torch::kFloat32, {3, 5}});
        const auto y = F.reshape(x, {0, -1, 5});

        bool ok = true;
        ok &= expect(x.is_symbolic() && x.size(-1) == 5, "shape metadata is available while tracing");
        ok &= expect(y.shape() == std::vector<std::int64_t>{3, 1, 5}, "symbolic output shape from the rules");
        ok &= expect_throws<Strata::Error::TraceError>([&] { static_cast<void>(x.tensor()); }, "no data while tracing");
        ok &= expect_throws<Strata::Error::RankError>([&] { static_cast<void>(x.size(2)); }, "axis out of range");
        return ok;
    }

    bool graph_replays_with_constants_and_parameters()
    {
        auto scale = std::make_shared<Strata::Parameter>("scale", "scale", Strata::ParameterOptions{
            .shape = {4},
            .initializer = Strata::Initialization::Constant(2.0),
        });
        static_cast<void>(scale->materialize());

        Strata::Ops::SymbolicNamespace F{};
        const auto x = F.input(Strata::TensorSignature{torch::kCPU, torch::kFloat32, {2, 4}});
        const auto scaled = F.multiply(x, F.parameter(scale));
        const auto again = F.parameter(scale);
        const auto shifted = F.add(scaled, Value::concrete(torch::ones({4})));
        auto graph = F.finish(shifted);

        const auto input = torch::arange(8, torch::kFloat32).reshape({2, 4});
        const auto first = graph.execute(input, Strata::Inference);
        scale->set_data(torch::full({4}, 3.0));
        const auto second = graph.execute(input, Strata::Inference);

        bool ok = true;
        ok &= expect(again.node() == 1, "a Parameter is bound to one node");
        ok &= expect(graph.operation_count() == 2, "two recorded operations");
        ok &= expect(torch::allclose(first, input * 2 + 1), "replay computes the traced expression");
        ok &= expect(torch::allclose(second, input * 3 + 1), "replay reads current Parameter data");
        ok &= expect(graph.describe().find("return %") != std::string::npos, "graph description");
        ok &= expect_throws<std::invalid_argument>(
            [&] { static_cast<void>(graph.execute(torch::ones({3, 4}), Strata::Inference)); },
            "replay with another signature");
        return ok;
    }
}

int main()
{
    bool ok = true;
    ok &= eager_namespace_computes();
    ok &= shape_rules_are_shared();
    ok &= symbolic_values_carry_shapes_only();
    ok &= graph_replays_with_constants_and_parameters();
    if (!ok) {
        return 1;
    }
    std::cout << "Operator namespace tests passed." << std::endl;
    return 0;
}
