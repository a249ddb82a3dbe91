#ifndef STRATA_BLOCK_DETAILS_HYBRID_HPP
#define STRATA_BLOCK_DETAILS_HYBRID_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/context.hpp"
#include "../../common/error.hpp"
#include "../../common/graph.hpp"
#include "../../common/shape.hpp"
#include "../../initialization/initialization.hpp"
#include "../../ops/ops.hpp"
#include "../../utils/log.hpp"
#include "block.hpp"

namespace Strata {
    // Own Parameters of a HybridBlock bound into the active namespace, by short name.
    class ParameterValues {
    public:
        void bind(std::string short_name, Ops::Value value)
        {
            entries_.emplace_back(std::move(short_name), std::move(value));
        }

        [[nodiscard]] bool contains(const std::string& short_name) const noexcept
        {
            for (const auto& [key, value] : entries_) {
                if (key == short_name) {
                    return true;
                }
            }
            return false;
        }

        [[nodiscard]] const Ops::Value& operator[](const std::string& short_name) const
        {
            for (const auto& [key, value] : entries_) {
                if (key == short_name) {
                    return value;
                }
            }
            throw std::out_of_range("No Parameter '" + short_name + "' is bound for this Block.");
        }

        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    private:
        std::vector<std::pair<std::string, Ops::Value>> entries_{};
    };

    // A Block whose computation is written once against Ops::Namespace and
    // can therefore run eagerly or be traced into a cached Graph.
    class HybridBlock : public Block {
    public:
        using TraceObserver = std::function<void(const HybridBlock&, const TensorSignature&)>;

        [[nodiscard]] bool is_hybridized() const noexcept { return hybridized_; }

        void hybridize(bool active = true) override
        {
            {
                std::lock_guard<std::mutex> lock{mutex_};
                hybridized_ = active;
                cache_.reset();
            }
            Block::hybridize(active);
        }

        torch::Tensor forward(const torch::Tensor& input, const ExecutionContext& context) override
        {
            if (!hybridized_) {
                Ops::EagerNamespace F{context};
                return evaluate(F, Ops::Value::concrete(input)).tensor();
            }

            std::unique_lock<std::mutex> lock{mutex_};
            auto signature = describe_tensor(input);
            if (cache_ && cache_->signature == signature) {
                if (Utils::Log::enabled(Utils::Log::Level::Debug)) {
                    Utils::Log::debug("Replaying cached graph of '" + name() + "' for " + format_signature(signature) + ".");
                }
                return cache_->graph->execute(input, context);
            }

            Ops::SymbolicNamespace F{context};
            const auto output = evaluate(F, F.input(signature));
            auto graph = F.finish(output);
            if (Utils::Log::enabled(Utils::Log::Level::Info)) {
                Utils::Log::info(std::string(cache_ ? "Retracing '" : "Tracing '") + name() + "' for "
                                 + format_signature(signature) + " (" + std::to_string(graph.operation_count())
                                 + " operations).");
            }
            cache_.emplace(CacheEntry{signature, std::make_shared<const Graph>(std::move(graph))});
            ++trace_count_;
            const auto fresh = cache_->graph;
            lock.unlock();

            if (observer_) {
                observer_(*this, signature);
            }
            return fresh->execute(input, context);
        }

        // Entry point for a parent's hybrid_forward. A symbolic namespace
        // inlines this Block into the parent's trace; an eager one goes
        // through forward() and therefore through this Block's own cache.
        [[nodiscard]] Ops::Value invoke(Ops::Namespace& F, const Ops::Value& x)
        {
            if (F.is_symbolic()) {
                return evaluate(F, x);
            }
            return Ops::Value::concrete(forward(x.tensor(), F.context()));
        }

        void clear_cache()
        {
            std::lock_guard<std::mutex> lock{mutex_};
            cache_.reset();
        }

        [[nodiscard]] std::optional<TensorSignature> cached_signature() const
        {
            std::lock_guard<std::mutex> lock{mutex_};
            if (!cache_) {
                return std::nullopt;
            }
            return cache_->signature;
        }

        [[nodiscard]] std::size_t trace_count() const
        {
            std::lock_guard<std::mutex> lock{mutex_};
            return trace_count_;
        }

        void set_trace_observer(TraceObserver observer) { observer_ = std::move(observer); }

        // Text dump of the cached graph, empty when nothing has been traced.
        [[nodiscard]] std::string export_graph() const
        {
            std::lock_guard<std::mutex> lock{mutex_};
            return cache_ ? cache_->graph->describe() : std::string{};
        }

    protected:
        HybridBlock(std::string type_name, BlockOptions options) : Block(std::move(type_name), std::move(options)) {}
        HybridBlock(std::string type_name, std::string alias, BlockOptions options)
            : Block(std::move(type_name), std::move(alias), std::move(options)) {}

        virtual Ops::Value hybrid_forward(Ops::Namespace& F, const Ops::Value& x, const ParameterValues& params) = 0;

        // Resolves deferred dimensions of own Parameters from the input's
        // shape. Runs in both modes since shapes are known either way.
        virtual void infer_shape(const Ops::Value&) {}

        void child_registered(Block& child) override
        {
            if (hybridized_) {
                child.hybridize(true);
            }
        }

        void subtree_changed() override { clear_cache(); }

        void validate_child(const Block& child) const override
        {
            if (dynamic_cast<const HybridBlock*>(&child) == nullptr) {
                throw std::invalid_argument("HybridBlock '" + name() + "' can only register HybridBlock children, got "
                                            + child.type_name() + " '" + child.name() + "'.");
            }
        }

    private:
        struct CacheEntry {
            TensorSignature signature;
            std::shared_ptr<const Graph> graph;
        };

        Ops::Value evaluate(Ops::Namespace& F, const Ops::Value& x)
        {
            infer_shape(x);

            ParameterValues values{};
            for (const auto& [short_name, parameter] : own_parameters()) {
                parameter->materialize();
                if (!parameter->is_initialized()) {
                    throw Error::InferenceError("Block '" + name() + "' could not infer the shape "
                                                + format_shape(parameter->shape()) + " of Parameter '"
                                                + parameter->name() + "' from input " + format_sizes(x.shape()) + ".");
                }
                values.bind(short_name, F.parameter(parameter));
            }
            return hybrid_forward(F, x, values);
        }

        bool hybridized_{false};
        std::optional<CacheEntry> cache_{};
        std::size_t trace_count_{0};
        TraceObserver observer_{};
        mutable std::mutex mutex_{};
    };
}

#endif // STRATA_BLOCK_DETAILS_HYBRID_HPP
