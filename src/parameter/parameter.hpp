#ifndef STRATA_PARAMETER_HPP
#define STRATA_PARAMETER_HPP

#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "../common/shape.hpp"
#include "../initialization/apply.hpp"
#include "../initialization/initialization.hpp"
#include "../utils/log.hpp"

namespace Strata {
    enum class GradMode {
        Trainable,
        Frozen,
    };

    struct ParameterOptions {
        Shape shape{};
        torch::ScalarType dtype{torch::kFloat32};
        Initialization::Descriptor initializer{Initialization::Default};
        GradMode grad_mode{GradMode::Trainable};
        bool allow_deferred_init{false};
    };

    class ParameterDict;

    class Parameter {
    public:
        Parameter(std::string short_name, std::string name, ParameterOptions options)
            : short_name_(std::move(short_name)), name_(std::move(name)), options_(std::move(options))
        {
            if (short_name_.empty()) {
                throw std::invalid_argument("Parameters require a non-empty name.");
            }
            for (const auto& dim : options_.shape) {
                if (dim && *dim <= 0) {
                    throw std::invalid_argument("Parameter '" + name_ + "' declares non-positive dimension in "
                                                + format_shape(options_.shape) + "; use Unknown to defer it.");
                }
            }
        }

        Parameter(const Parameter&) = delete;
        Parameter& operator=(const Parameter&) = delete;

        [[nodiscard]] const std::string& name() const noexcept { return name_; }
        [[nodiscard]] const std::string& short_name() const noexcept { return short_name_; }
        [[nodiscard]] const Shape& shape() const noexcept { return options_.shape; }
        [[nodiscard]] torch::ScalarType dtype() const noexcept { return options_.dtype; }
        [[nodiscard]] GradMode grad_mode() const noexcept { return options_.grad_mode; }
        [[nodiscard]] bool is_trainable() const noexcept { return options_.grad_mode == GradMode::Trainable; }
        [[nodiscard]] bool allow_deferred_init() const noexcept { return options_.allow_deferred_init; }
        [[nodiscard]] const Initialization::Descriptor& initializer() const noexcept { return options_.initializer; }

        [[nodiscard]] bool is_initialized() const noexcept { return data_.defined(); }
        [[nodiscard]] bool is_deferred() const noexcept { return !is_complete(options_.shape); }

        void set_initializer(Initialization::Descriptor initializer) noexcept { options_.initializer = initializer; }

        // Refines the declared shape with another partial declaration.
        void merge_shape(const Shape& other)
        {
            auto merged = merge_shapes(options_.shape, other);
            if (!merged) {
                throw Error::ShapeConflict("Parameter '" + name_ + "' is declared with shape "
                                           + format_shape(options_.shape) + " which conflicts with "
                                           + format_shape(other) + ".");
            }
            options_.shape = std::move(*merged);
        }

        // Resolves unknown dimensions from an observed concrete shape. On a
        // fully known Parameter this only verifies the observation.
        void resolve_shape(const std::vector<std::int64_t>& observed)
        {
            const bool was_deferred = is_deferred();
            options_.shape = ::Strata::resolve_shape(options_.shape, observed, name_);
            if (was_deferred && Utils::Log::enabled(Utils::Log::Level::Debug)) {
                Utils::Log::debug("Inferred shape of '" + name_ + "' as " + format_shape(options_.shape) + ".");
            }
        }

        // Returns true when data was created by this call.
        bool materialize(const Initialization::Descriptor& fallback = Initialization::Default)
        {
            if (is_initialized()) {
                return false;
            }
            if (is_deferred()) {
                if (!options_.allow_deferred_init) {
                    throw Error::NotDeferrable("Cannot initialize Parameter '" + name_ + "' because its shape "
                                               + format_shape(options_.shape)
                                               + " is unknown and deferred initialization is not allowed.");
                }
                if (fallback.type != Initialization::Type::Default
                    && options_.initializer.type == Initialization::Type::Default) {
                    options_.initializer = fallback;
                }
                return false;
            }

            const auto descriptor = Initialization::Details::resolve(options_.initializer, fallback);
            adopt(Initialization::Details::create(descriptor, to_sizes(options_.shape), options_.dtype));
            if (Utils::Log::enabled(Utils::Log::Level::Debug)) {
                Utils::Log::debug("Initialized '" + name_ + "' with shape " + format_shape(options_.shape) + ".");
            }
            return true;
        }

        [[nodiscard]] const torch::Tensor& data() const
        {
            if (!is_initialized()) {
                throw Error::Uninitialized("Parameter '" + name_ + "' with shape " + format_shape(options_.shape)
                                           + " has not been initialized yet.");
            }
            return data_;
        }

        // Replaces the values; the shape must agree with the declaration.
        void set_data(const torch::Tensor& value)
        {
            if (!value.defined()) {
                throw std::invalid_argument("Parameter '" + name_ + "' cannot be assigned an undefined tensor.");
            }
            const auto sizes = tensor_sizes(value);
            auto merged = merge_shapes(options_.shape, to_shape(sizes));
            if (!merged) {
                throw Error::ShapeConflict("Parameter '" + name_ + "' has shape " + format_shape(options_.shape)
                                           + " and cannot be assigned a tensor of shape " + format_sizes(sizes) + ".");
            }
            options_.shape = std::move(*merged);

            if (is_initialized()) {
                torch::NoGradGuard no_grad{};
                data_.copy_(value);
                return;
            }
            adopt(value.detach().to(options_.dtype).clone());
        }

        [[nodiscard]] torch::Tensor grad() const
        {
            return is_initialized() ? data_.grad() : torch::Tensor{};
        }

        void zero_grad()
        {
            if (!is_initialized()) {
                return;
            }
            auto& gradient = data_.mutable_grad();
            if (gradient.defined()) {
                gradient.detach_();
                gradient.zero_();
            }
        }

        // Drops data so the next materialize() runs the initializer again.
        void reset() noexcept { data_ = torch::Tensor{}; }

        [[nodiscard]] std::string repr() const
        {
            std::ostringstream stream;
            stream << "Parameter " << name_ << " (shape=" << format_shape(options_.shape)
                   << ", dtype=" << scalar_type_name(options_.dtype) << ')';
            return stream.str();
        }

    private:
        friend class ParameterDict;

        void rename(std::string name) { name_ = std::move(name); }

        void adopt(torch::Tensor tensor)
        {
            data_ = std::move(tensor);
            if (options_.grad_mode == GradMode::Trainable && data_.is_floating_point()) {
                data_.requires_grad_(true);
            }
        }

        std::string short_name_;
        std::string name_;
        ParameterOptions options_;
        torch::Tensor data_{};
    };
}

#endif // STRATA_PARAMETER_HPP
