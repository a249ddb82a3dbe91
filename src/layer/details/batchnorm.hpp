#ifndef STRATA_LAYER_BATCHNORM_HPP
#define STRATA_LAYER_BATCHNORM_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../block/details/hybrid.hpp"
#include "../../common/error.hpp"
#include "../../common/shape.hpp"
#include "../../initialization/initialization.hpp"
#include "../../ops/ops.hpp"
#include "../../parameter/parameter.hpp"

namespace Strata::Layer::Details {
    struct BatchNormOptions {
        std::int64_t axis{1};
        // Weight of the previous running statistic in each update.
        double momentum{0.9};
        double epsilon{1e-3};
        bool center{true};
        bool scale{true};
        bool use_global_stats{false};
        std::optional<std::int64_t> in_channels{};
        torch::ScalarType dtype{torch::kFloat32};
        ::Strata::Initialization::Descriptor beta_initializer{::Strata::Initialization::Zeros};
        ::Strata::Initialization::Descriptor gamma_initializer{::Strata::Initialization::Ones};
        ::Strata::Initialization::Descriptor running_mean_initializer{::Strata::Initialization::Zeros};
        ::Strata::Initialization::Descriptor running_variance_initializer{::Strata::Initialization::Ones};
    };

    class BatchNormImpl : public HybridBlock {
    public:
        explicit BatchNormImpl(BatchNormOptions options = {}, BlockOptions block = {})
            : HybridBlock("BatchNorm", std::move(block)), options_(options)
        {
            if (!(options_.momentum >= 0.0 && options_.momentum <= 1.0)) {
                throw std::invalid_argument("BatchNorm momentum must lie in [0, 1].");
            }
            if (!(options_.epsilon > 0.0)) {
                throw std::invalid_argument("BatchNorm epsilon must be positive.");
            }
            if (options_.in_channels && *options_.in_channels <= 0) {
                throw std::invalid_argument("BatchNorm requires positive in_channels when given.");
            }

            const Shape channels{options_.in_channels ? Dim{*options_.in_channels} : Dim{Unknown}};
            const auto declare = [&](const char* short_name, ::Strata::Initialization::Descriptor initializer,
                                     GradMode grad_mode) {
                return declare_parameter(short_name, ParameterOptions{
                    .shape = channels,
                    .dtype = options_.dtype,
                    .initializer = initializer,
                    .grad_mode = grad_mode,
                    .allow_deferred_init = true,
                });
            };
            gamma_ = declare("gamma", options_.gamma_initializer,
                             options_.scale ? GradMode::Trainable : GradMode::Frozen);
            beta_ = declare("beta", options_.beta_initializer,
                            options_.center ? GradMode::Trainable : GradMode::Frozen);
            running_mean_ = declare("running_mean", options_.running_mean_initializer, GradMode::Frozen);
            running_var_ = declare("running_var", options_.running_variance_initializer, GradMode::Frozen);
        }

        [[nodiscard]] const BatchNormOptions& options() const noexcept { return options_; }
        [[nodiscard]] const std::shared_ptr<Parameter>& gamma() const noexcept { return gamma_; }
        [[nodiscard]] const std::shared_ptr<Parameter>& beta() const noexcept { return beta_; }
        [[nodiscard]] const std::shared_ptr<Parameter>& running_mean() const noexcept { return running_mean_; }
        [[nodiscard]] const std::shared_ptr<Parameter>& running_var() const noexcept { return running_var_; }

    protected:
        void infer_shape(const Ops::Value& x) override
        {
            if (x.dim() < 2) {
                throw Error::RankError("BatchNorm '" + name() + "' expects an input of rank at least 2, got "
                                       + format_sizes(x.shape()) + ".");
            }
            const std::vector<std::int64_t> channels{x.size(options_.axis)};
            gamma_->resolve_shape(channels);
            beta_->resolve_shape(channels);
            running_mean_->resolve_shape(channels);
            running_var_->resolve_shape(channels);
        }

        Ops::Value hybrid_forward(Ops::Namespace& F, const Ops::Value& x, const ParameterValues& params) override
        {
            Ops::BatchNormAttributes attributes{};
            attributes.axis = options_.axis;
            attributes.epsilon = options_.epsilon;
            attributes.momentum = options_.momentum;
            attributes.center = options_.center;
            attributes.scale = options_.scale;
            attributes.use_global_stats = options_.use_global_stats;
            return F.batch_norm(x, params["gamma"], params["beta"], params["running_mean"], params["running_var"],
                                attributes);
        }

        [[nodiscard]] std::string extra_repr() const override
        {
            const auto& channels = gamma_->shape()[0];
            std::ostringstream stream;
            stream << "axis=" << options_.axis << ", eps=" << options_.epsilon << ", momentum=" << options_.momentum
                   << ", fix_gamma=" << (options_.scale ? "False" : "True")
                   << ", use_global_stats=" << (options_.use_global_stats ? "True" : "False")
                   << ", in_channels=" << (channels ? std::to_string(*channels) : std::string{"None"});
            return stream.str();
        }

    private:
        BatchNormOptions options_{};
        std::shared_ptr<Parameter> gamma_{};
        std::shared_ptr<Parameter> beta_{};
        std::shared_ptr<Parameter> running_mean_{};
        std::shared_ptr<Parameter> running_var_{};
    };
}

#endif // STRATA_LAYER_BATCHNORM_HPP
