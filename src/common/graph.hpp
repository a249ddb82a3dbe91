#ifndef STRATA_COMMON_GRAPH_HPP
#define STRATA_COMMON_GRAPH_HPP

#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../ops/details/attributes.hpp"
#include "../ops/details/kernels.hpp"
#include "../parameter/parameter.hpp"
#include "context.hpp"
#include "error.hpp"
#include "shape.hpp"

namespace Strata {
    struct CompiledNode {
        enum class Kind {
            Input,
            Parameter,
            Constant,
            Operation
        };

        Kind kind{Kind::Operation};
        std::string label{};
        std::vector<std::size_t> inputs{};
        std::optional<Ops::Attributes> attributes{};
        std::shared_ptr<Parameter> parameter{};
        torch::Tensor constant{};
        TensorSignature signature{};
    };

    struct GraphExecutionWorkspace {
        std::vector<torch::Tensor> node_buffers{};
        std::vector<torch::Tensor> arguments{};

        void ensure_node_capacity(std::size_t count)
        {
            if (node_buffers.size() != count) {
                node_buffers.resize(count);
            }
        }
    };

    // Straight-line computation recorded by tracing a HybridBlock. Nodes are
    // stored in topological order; Parameters are referenced, never copied,
    // so replay always reads their current values.
    class Graph {
    public:
        static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

        std::size_t add_input(TensorSignature signature)
        {
            if (input_ != npos) {
                throw std::logic_error("A traced graph accepts a single input.");
            }
            CompiledNode node{};
            node.kind = CompiledNode::Kind::Input;
            node.label = "input";
            node.signature = std::move(signature);
            input_ = push(std::move(node));
            return input_;
        }

        std::size_t add_parameter(const std::shared_ptr<Parameter>& parameter)
        {
            if (!parameter) {
                throw std::invalid_argument("Cannot bind a null Parameter into a graph.");
            }
            if (const auto it = parameter_nodes_.find(parameter.get()); it != parameter_nodes_.end()) {
                return it->second;
            }
            CompiledNode node{};
            node.kind = CompiledNode::Kind::Parameter;
            node.label = parameter->name();
            node.parameter = parameter;
            node.signature = describe_tensor(parameter->data());
            const auto index = push(std::move(node));
            parameter_nodes_.emplace(parameter.get(), index);
            return index;
        }

        std::size_t add_constant(torch::Tensor value)
        {
            CompiledNode node{};
            node.kind = CompiledNode::Kind::Constant;
            node.label = "constant";
            node.signature = describe_tensor(value);
            node.constant = value.detach();
            return push(std::move(node));
        }

        std::size_t add_operation(Ops::Attributes attributes, std::vector<std::size_t> inputs, TensorSignature signature)
        {
            for (const auto input : inputs) {
                if (input >= nodes_.size()) {
                    throw std::out_of_range("Operation refers to node " + std::to_string(input)
                                            + " which has not been recorded yet.");
                }
            }
            CompiledNode node{};
            node.kind = CompiledNode::Kind::Operation;
            node.label = Ops::describe(attributes);
            node.inputs = std::move(inputs);
            node.attributes = std::move(attributes);
            node.signature = std::move(signature);
            return push(std::move(node));
        }

        void set_output(std::size_t index)
        {
            if (index >= nodes_.size()) {
                throw std::out_of_range("Graph output refers to unknown node " + std::to_string(index) + ".");
            }
            output_ = index;
        }

        [[nodiscard]] const std::vector<CompiledNode>& nodes() const noexcept { return nodes_; }
        [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }
        [[nodiscard]] bool has_output() const noexcept { return output_ != npos; }

        [[nodiscard]] std::size_t operation_count() const noexcept
        {
            std::size_t count = 0;
            for (const auto& node : nodes_) {
                count += node.kind == CompiledNode::Kind::Operation ? 1 : 0;
            }
            return count;
        }

        [[nodiscard]] const TensorSignature& input_signature() const
        {
            if (input_ == npos) {
                throw std::logic_error("Graph has no input node.");
            }
            return nodes_[input_].signature;
        }

        [[nodiscard]] const TensorSignature& output_signature() const
        {
            if (output_ == npos) {
                throw std::logic_error("Graph has no output node.");
            }
            return nodes_[output_].signature;
        }

        // Replays every node with the kernels the eager path uses.
        [[nodiscard]] torch::Tensor execute(const torch::Tensor& input, const ExecutionContext& context) const
        {
            if (output_ == npos) {
                throw std::logic_error("Cannot execute a graph without an output node.");
            }
            const auto observed = describe_tensor(input);
            if (observed != input_signature()) {
                throw std::invalid_argument("Graph was traced for " + format_signature(input_signature())
                                            + " but received " + format_signature(observed) + ".");
            }

            GraphExecutionWorkspace workspace{};
            workspace.ensure_node_capacity(nodes_.size());
            for (std::size_t index = 0; index < nodes_.size(); ++index) {
                const auto& node = nodes_[index];
                auto& slot = workspace.node_buffers[index];
                switch (node.kind) {
                    case CompiledNode::Kind::Input:
                        slot = input;
                        break;
                    case CompiledNode::Kind::Parameter:
                        slot = node.parameter->data();
                        break;
                    case CompiledNode::Kind::Constant:
                        slot = node.constant;
                        break;
                    case CompiledNode::Kind::Operation:
                        workspace.arguments.clear();
                        for (const auto producer : node.inputs) {
                            workspace.arguments.push_back(workspace.node_buffers[producer]);
                        }
                        slot = Ops::Details::run(*node.attributes, workspace.arguments, context);
                        break;
                }
            }
            return workspace.node_buffers[output_];
        }

        [[nodiscard]] std::string describe() const
        {
            std::ostringstream stream;
            for (std::size_t index = 0; index < nodes_.size(); ++index) {
                const auto& node = nodes_[index];
                stream << '%' << index << " = ";
                switch (node.kind) {
                    case CompiledNode::Kind::Input: stream << "input"; break;
                    case CompiledNode::Kind::Parameter: stream << "parameter " << node.label; break;
                    case CompiledNode::Kind::Constant: stream << "constant"; break;
                    case CompiledNode::Kind::Operation:
                        stream << node.label << '(';
                        for (std::size_t position = 0; position < node.inputs.size(); ++position) {
                            stream << (position > 0 ? ", " : "") << '%' << node.inputs[position];
                        }
                        stream << ')';
                        break;
                }
                stream << " : " << format_sizes(node.signature.shape) << ' ' << scalar_type_name(node.signature.dtype)
                       << '\n';
            }
            if (output_ != npos) {
                stream << "return %" << output_ << '\n';
            }
            return stream.str();
        }

    private:
        std::size_t push(CompiledNode node)
        {
            nodes_.push_back(std::move(node));
            return nodes_.size() - 1;
        }

        std::vector<CompiledNode> nodes_{};
        std::unordered_map<const Parameter*, std::size_t> parameter_nodes_{};
        std::size_t input_{npos};
        std::size_t output_{npos};
    };
}

#endif // STRATA_COMMON_GRAPH_HPP
