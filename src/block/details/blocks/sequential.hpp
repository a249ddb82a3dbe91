#ifndef STRATA_BLOCK_DETAILS_SEQUENTIAL_HPP
#define STRATA_BLOCK_DETAILS_SEQUENTIAL_HPP

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../../common/context.hpp"
#include "../../../ops/ops.hpp"
#include "../block.hpp"
#include "../hybrid.hpp"

namespace Strata::Blocks::Details {
    class SequentialImpl : public Block {
    public:
        explicit SequentialImpl(BlockOptions options = {}) : Block("Sequential", std::move(options)) {}

        template <class Derived>
        std::shared_ptr<Derived> add(std::shared_ptr<Derived> block)
        {
            return register_child(std::move(block));
        }

        [[nodiscard]] std::size_t size() const noexcept { return children().size(); }

        [[nodiscard]] const std::shared_ptr<Block>& at(std::size_t index) const
        {
            if (index >= children().size()) {
                throw std::out_of_range("Sequential '" + name() + "' has " + std::to_string(children().size())
                                        + " children, index " + std::to_string(index) + " is out of range.");
            }
            return children()[index].second;
        }

        torch::Tensor forward(const torch::Tensor& input, const ExecutionContext& context) override
        {
            auto output = input;
            for (const auto& [key, child] : children()) {
                output = child->forward(output, context);
            }
            return output;
        }
    };

    class HybridSequentialImpl : public HybridBlock {
    public:
        explicit HybridSequentialImpl(BlockOptions options = {}) : HybridBlock("HybridSequential", std::move(options)) {}

        template <class Derived>
        std::shared_ptr<Derived> add(std::shared_ptr<Derived> block)
        {
            return register_child(std::move(block));
        }

        [[nodiscard]] std::size_t size() const noexcept { return children().size(); }

        [[nodiscard]] std::shared_ptr<HybridBlock> at(std::size_t index) const
        {
            if (index >= children().size()) {
                throw std::out_of_range("HybridSequential '" + name() + "' has " + std::to_string(children().size())
                                        + " children, index " + std::to_string(index) + " is out of range.");
            }
            return std::static_pointer_cast<HybridBlock>(children()[index].second);
        }

    protected:
        Ops::Value hybrid_forward(Ops::Namespace& F, const Ops::Value& x, const ParameterValues&) override
        {
            auto output = x;
            for (const auto& [key, child] : children()) {
                output = static_cast<HybridBlock&>(*child).invoke(F, output);
            }
            return output;
        }
    };
}

#endif // STRATA_BLOCK_DETAILS_SEQUENTIAL_HPP
