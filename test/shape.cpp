#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "../include/Strata.h"
#include "support.hpp"

namespace {
    using Strata::Test::expect;
    using Strata::Test::expect_throws;

    bool merge_is_total()
    {
        const Strata::Shape partial{10, Strata::Unknown};
        const Strata::Shape known{10, 7};
        const Strata::Shape other{Strata::Unknown, 7};

        bool ok = true;
        ok &= expect(Strata::merge_shapes(partial, known) == Strata::Shape{10, 7}, "known extent wins over unknown");
        ok &= expect(Strata::merge_shapes(partial, other) == Strata::Shape{10, 7}, "partials combine");
        ok &= expect(Strata::merge_shapes(partial, Strata::Shape{Strata::Unknown, Strata::Unknown}) == partial,
                     "unknown against unknown stays unknown");
        ok &= expect(!Strata::merge_shapes(known, Strata::Shape{10, 5}).has_value(), "known extents must agree");
        ok &= expect(!Strata::merge_shapes(known, Strata::Shape{10}).has_value(), "ranks must agree");
        return ok;
    }

    bool resolution_reports_each_failure()
    {
        const Strata::Shape declared{10, Strata::Unknown};

        bool ok = true;
        ok &= expect(Strata::resolve_shape(declared, {10, 7}, "w") == Strata::Shape{10, 7}, "unknown filled in");
        ok &= expect_throws<Strata::Error::ShapeConflict>(
            [&] { static_cast<void>(Strata::resolve_shape(declared, {9, 7}, "w")); }, "fixed extent cannot change");
        ok &= expect_throws<Strata::Error::InferenceError>(
            [&] { static_cast<void>(Strata::resolve_shape(declared, {10}, "w")); }, "rank mismatch");
        ok &= expect_throws<Strata::Error::InferenceError>(
            [&] { static_cast<void>(Strata::resolve_shape(declared, {10, 0}, "w")); }, "zero cannot fill an unknown");
        return ok;
    }

    bool formatting()
    {
        bool ok = true;
        ok &= expect(Strata::format_shape({10, Strata::Unknown}) == "(10, ?)", "partial shape text");
        ok &= expect(Strata::format_shape({5}) == "(5,)", "single dimension keeps a trailing comma");
        ok &= expect(Strata::format_sizes({}) == "()", "scalar shape text");
        return ok;
    }

    bool reshape_codes()
    {
        const std::vector<std::int64_t> input{2, 3, 4};

        bool ok = true;
        ok &= expect(Strata::Ops::Details::resolve_reshape({0, -1}, input) == std::vector<std::int64_t>{2, 12},
                     "0 copies and -1 absorbs");
        ok &= expect(Strata::Ops::Details::resolve_reshape({-1}, input) == std::vector<std::int64_t>{24}, "full flatten");
        ok &= expect(Strata::Ops::Details::resolve_reshape({4, 0, 2}, input) == std::vector<std::int64_t>{4, 3, 2},
                     "positional copy");
        ok &= expect_throws<Strata::Error::ShapeConflict>(
            [&] { static_cast<void>(Strata::Ops::Details::resolve_reshape({5, -1}, input)); }, "indivisible target");
        ok &= expect_throws<std::invalid_argument>(
            [&] { static_cast<void>(Strata::Ops::Details::resolve_reshape({-1, -1}, input)); }, "two inferred axes");
        ok &= expect_throws<Strata::Error::RankError>(
            [&] { static_cast<void>(Strata::Ops::Details::resolve_reshape({0, 0, 0, 0}, input)); },
            "0 beyond the input rank");
        return ok;
    }
}

int main()
{
    bool ok = true;
    ok &= merge_is_total();
    ok &= resolution_reports_each_failure();
    ok &= formatting();
    ok &= reshape_codes();
    if (!ok) {
        return 1;
    }
    std::cout << "Shape tests passed." << std::endl;
    return 0;
}
