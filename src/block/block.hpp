#ifndef STRATA_BLOCK_HPP
#define STRATA_BLOCK_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <utility>

#include "details/block.hpp"
#include "details/blocks/sequential.hpp"
#include "details/hybrid.hpp"

namespace Strata::Blocks {
    using SequentialImpl = Details::SequentialImpl;
    using HybridSequentialImpl = Details::HybridSequentialImpl;

    [[nodiscard]] inline auto Sequential(BlockOptions options = {}) -> std::shared_ptr<SequentialImpl> {
        return std::make_shared<SequentialImpl>(std::move(options));
    }

    [[nodiscard]] inline auto HybridSequential(BlockOptions options = {}) -> std::shared_ptr<HybridSequentialImpl> {
        return std::make_shared<HybridSequentialImpl>(std::move(options));
    }
}

#endif // STRATA_BLOCK_HPP
