#ifndef STRATA_OPS_ATTRIBUTES_HPP
#define STRATA_OPS_ATTRIBUTES_HPP

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "../../activation/activation.hpp"
#include "../../common/overloaded.hpp"

namespace Strata::Ops {
    struct FullyConnectedAttributes {
        std::int64_t units{};
        bool no_bias{false};
    };

    struct ActivationAttributes {
        Activation::Type type{Activation::Type::Identity};
    };

    struct LeakyReLUAttributes {
        double slope{0.01};
    };

    struct DropoutAttributes {
        double rate{0.5};
    };

    // `momentum` follows the running = momentum * running + (1 - momentum) * batch convention.
    struct BatchNormAttributes {
        std::int64_t axis{1};
        double epsilon{1e-3};
        double momentum{0.9};
        bool center{true};
        bool scale{true};
        bool use_global_stats{false};
    };

    struct EmbeddingAttributes {
        std::int64_t input_dim{};
        std::int64_t output_dim{};
    };

    // Target extents; 0 copies the input extent at that position and a single
    // -1 absorbs whatever is left.
    struct ReshapeAttributes {
        std::vector<std::int64_t> shape{};
    };

    struct ElementwiseAttributes {
        enum class Kind {
            Add,
            Subtract,
            Multiply,
        };
        Kind kind{Kind::Add};
    };

    struct DotAttributes {};

    using Attributes = std::variant<FullyConnectedAttributes,
                                    ActivationAttributes,
                                    LeakyReLUAttributes,
                                    DropoutAttributes,
                                    BatchNormAttributes,
                                    EmbeddingAttributes,
                                    ReshapeAttributes,
                                    ElementwiseAttributes,
                                    DotAttributes>;

    [[nodiscard]] inline std::string_view op_name(const Attributes& attributes)
    {
        return std::visit(Overloaded{
            [](const FullyConnectedAttributes&) -> std::string_view { return "FullyConnected"; },
            [](const ActivationAttributes&) -> std::string_view { return "Activation"; },
            [](const LeakyReLUAttributes&) -> std::string_view { return "LeakyReLU"; },
            [](const DropoutAttributes&) -> std::string_view { return "Dropout"; },
            [](const BatchNormAttributes&) -> std::string_view { return "BatchNorm"; },
            [](const EmbeddingAttributes&) -> std::string_view { return "Embedding"; },
            [](const ReshapeAttributes&) -> std::string_view { return "Reshape"; },
            [](const ElementwiseAttributes& op) -> std::string_view {
                switch (op.kind) {
                    case ElementwiseAttributes::Kind::Subtract: return "Subtract";
                    case ElementwiseAttributes::Kind::Multiply: return "Multiply";
                    case ElementwiseAttributes::Kind::Add:
                    default: return "Add";
                }
            },
            [](const DotAttributes&) -> std::string_view { return "Dot"; },
        }, attributes);
    }

    [[nodiscard]] inline std::string describe(const Attributes& attributes)
    {
        std::ostringstream stream;
        stream << op_name(attributes);
        std::visit(Overloaded{
            [&](const FullyConnectedAttributes& op) {
                stream << "(units=" << op.units << (op.no_bias ? ", no_bias" : "") << ')';
            },
            [&](const ActivationAttributes& op) { stream << '(' << Activation::name(op.type) << ')'; },
            [&](const LeakyReLUAttributes& op) { stream << "(slope=" << op.slope << ')'; },
            [&](const DropoutAttributes& op) { stream << "(p=" << op.rate << ')'; },
            [&](const BatchNormAttributes& op) {
                stream << "(axis=" << op.axis << ", eps=" << op.epsilon << ", momentum=" << op.momentum << ')';
            },
            [&](const EmbeddingAttributes& op) { stream << '(' << op.input_dim << " -> " << op.output_dim << ')'; },
            [&](const ReshapeAttributes& op) {
                stream << '(';
                for (std::size_t index = 0; index < op.shape.size(); ++index) {
                    stream << (index > 0 ? ", " : "") << op.shape[index];
                }
                stream << ')';
            },
            [](const ElementwiseAttributes&) {},
            [](const DotAttributes&) {},
        }, attributes);
        return stream.str();
    }
}

#endif // STRATA_OPS_ATTRIBUTES_HPP
