#ifndef STRATA_OPS_SYMBOLIC_HPP
#define STRATA_OPS_SYMBOLIC_HPP

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../common/context.hpp"
#include "../../common/graph.hpp"
#include "../../parameter/parameter.hpp"
#include "attributes.hpp"
#include "namespace.hpp"
#include "shape_rules.hpp"
#include "value.hpp"

namespace Strata::Ops {
    // Records every call as a graph node instead of computing it. Output
    // signatures come from the shared shape rules, so a trace fails with the
    // same error an eager call would raise.
    class SymbolicNamespace final : public Namespace {
    public:
        explicit SymbolicNamespace(ExecutionContext context = Inference) : Namespace(context) {}

        [[nodiscard]] bool is_symbolic() const noexcept override { return true; }

        [[nodiscard]] Value input(const TensorSignature& signature)
        {
            return Value::symbolic(graph_.add_input(signature), signature);
        }

        [[nodiscard]] Value parameter(const std::shared_ptr<Parameter>& parameter) override
        {
            const auto node = graph_.add_parameter(parameter);
            return Value::symbolic(node, graph_.nodes()[node].signature);
        }

        // Seals the trace. Leaves the namespace empty.
        [[nodiscard]] Graph finish(const Value& output)
        {
            if (!output.defined()) {
                throw Error::TraceError("Traced computation returned an undefined value.");
            }
            const auto node = output.is_symbolic() ? output.node() : graph_.add_constant(output.tensor());
            graph_.set_output(node);
            return std::exchange(graph_, Graph{});
        }

    protected:
        [[nodiscard]] Value apply(const Attributes& attributes, const std::vector<Value>& inputs) override
        {
            std::vector<std::size_t> nodes;
            std::vector<TensorSignature> signatures;
            nodes.reserve(inputs.size());
            signatures.reserve(inputs.size());
            for (const auto& input : inputs) {
                if (!input.defined()) {
                    throw std::invalid_argument(std::string(op_name(attributes)) + " received an undefined operand.");
                }
                nodes.push_back(input.is_symbolic() ? input.node() : graph_.add_constant(input.tensor()));
                signatures.push_back(input.signature());
            }
            auto signature = Details::infer(attributes, signatures);
            const auto node = graph_.add_operation(attributes, std::move(nodes), signature);
            return Value::symbolic(node, std::move(signature));
        }

    private:
        Graph graph_{};
    };
}

#endif // STRATA_OPS_SYMBOLIC_HPP
