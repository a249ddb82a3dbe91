#ifndef STRATA_PARAMETER_DICT_HPP
#define STRATA_PARAMETER_DICT_HPP

#include <cstddef>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../common/error.hpp"
#include "../common/shape.hpp"
#include "../initialization/initialization.hpp"
#include "../utils/log.hpp"
#include "parameter.hpp"

namespace Strata {
    // Insertion-ordered Parameters under one name prefix. A dict either owns
    // its members exclusively or is shared between Blocks that tie weights.
    class ParameterDict {
    public:
        using Entry = std::shared_ptr<Parameter>;
        using Storage = std::vector<Entry>;

        explicit ParameterDict(std::string prefix = {}) : prefix_(std::move(prefix)) {}

        ParameterDict(const ParameterDict&) = delete;
        ParameterDict& operator=(const ParameterDict&) = delete;
        ParameterDict(ParameterDict&&) noexcept = default;
        ParameterDict& operator=(ParameterDict&&) noexcept = default;

        [[nodiscard]] const std::string& prefix() const noexcept { return prefix_; }
        [[nodiscard]] std::size_t size() const noexcept { return parameters_.size(); }
        [[nodiscard]] bool empty() const noexcept { return parameters_.empty(); }

        [[nodiscard]] Storage::const_iterator begin() const noexcept { return parameters_.begin(); }
        [[nodiscard]] Storage::const_iterator end() const noexcept { return parameters_.end(); }

        // Idempotent lookup by short name. A second declaration must agree with
        // the first on every dimension both of them know.
        Entry get(const std::string& name, const ParameterOptions& options = {})
        {
            const auto full_name = prefix_ + name;
            if (auto existing = find(full_name)) {
                if (existing->dtype() != options.dtype) {
                    throw Error::ShapeConflict("Parameter '" + full_name + "' was declared with dtype "
                                               + scalar_type_name(existing->dtype()) + " and cannot be re-declared as "
                                               + scalar_type_name(options.dtype) + ".");
                }
                require_compatible(*existing, options);
                if (!options.shape.empty()) {
                    if (existing->is_initialized()) {
                        if (!merge_shapes(existing->shape(), options.shape)) {
                            throw Error::ShapeConflict("Parameter '" + full_name + "' is initialized with shape "
                                                       + format_shape(existing->shape()) + " and cannot be re-declared as "
                                                       + format_shape(options.shape) + ".");
                        }
                    } else {
                        existing->merge_shape(options.shape);
                    }
                }
                return existing;
            }

            auto parameter = std::make_shared<Parameter>(name, full_name, options);
            insert(parameter);
            return parameter;
        }

        [[nodiscard]] bool contains(const std::string& full_name) const
        {
            return index_.find(full_name) != index_.end();
        }

        [[nodiscard]] Entry find(const std::string& full_name) const
        {
            const auto it = index_.find(full_name);
            return it == index_.end() ? nullptr : parameters_[it->second];
        }

        [[nodiscard]] const Entry& at(const std::string& full_name) const
        {
            const auto it = index_.find(full_name);
            if (it == index_.end()) {
                throw std::out_of_range("No Parameter named '" + full_name + "' in dict with prefix '" + prefix_ + "'.");
            }
            return parameters_[it->second];
        }

        // Appends the members of `other`. The same object twice is fine, two
        // different objects under one name are not.
        void merge(const ParameterDict& other)
        {
            for (const auto& parameter : other) {
                if (auto existing = find(parameter->name())) {
                    if (existing != parameter) {
                        throw Error::DuplicateName("Two different Parameters are named '" + parameter->name()
                                                   + "'. Give the colliding Blocks distinct prefixes.");
                    }
                    continue;
                }
                insert(parameter);
            }
        }

        // Moves every member under a new prefix, keeping short names.
        void rescope(std::string prefix)
        {
            prefix_ = std::move(prefix);
            index_.clear();
            for (std::size_t position = 0; position < parameters_.size(); ++position) {
                auto& parameter = parameters_[position];
                parameter->rename(prefix_ + parameter->short_name());
                if (!index_.emplace(parameter->name(), position).second) {
                    throw Error::DuplicateName("Rescoping to prefix '" + prefix_ + "' makes Parameter name '"
                                               + parameter->name() + "' ambiguous.");
                }
            }
        }

        // Flattened, ordered list consumed by optimizers and the gradient engine.
        [[nodiscard]] std::vector<Entry> trainable() const
        {
            std::vector<Entry> selected;
            selected.reserve(parameters_.size());
            for (const auto& parameter : parameters_) {
                if (parameter->is_trainable()) {
                    selected.push_back(parameter);
                }
            }
            return selected;
        }

        // Materializes what can be materialized; deferred members remember
        // `initializer` for their first forward call.
        void initialize(const Initialization::Descriptor& initializer = Initialization::Default,
                        bool force_reinit = false)
        {
            for (const auto& parameter : parameters_) {
                if (parameter->is_initialized()) {
                    if (!force_reinit) {
                        Utils::Log::warning("Parameter '" + parameter->name()
                                            + "' is already initialized, ignoring. Pass force_reinit to reset it.");
                        continue;
                    }
                    parameter->reset();
                }
                parameter->materialize(initializer);
            }
        }

        void zero_grad()
        {
            for (const auto& parameter : parameters_) {
                parameter->zero_grad();
            }
        }

        [[nodiscard]] std::string repr() const
        {
            std::ostringstream stream;
            stream << (prefix_.empty() ? std::string{"ParameterDict"} : prefix_ + " ParameterDict") << " (\n";
            for (const auto& parameter : parameters_) {
                stream << "  " << parameter->repr() << '\n';
            }
            stream << ')';
            return stream.str();
        }

    private:
        // Attributes left at their defaults are unspecified; stated ones must match.
        static void require_compatible(const Parameter& existing, const ParameterOptions& options)
        {
            const auto& requested = options.initializer;
            if (requested.type != Initialization::Type::Default
                && (requested.type != existing.initializer().type || requested.value != existing.initializer().value)) {
                throw std::invalid_argument("Parameter '" + existing.name()
                                            + "' is re-declared with a different initializer.");
            }
            if (options.grad_mode == GradMode::Frozen && existing.grad_mode() != GradMode::Frozen) {
                throw std::invalid_argument("Parameter '" + existing.name()
                                            + "' is trainable and cannot be re-declared as frozen.");
            }
            if (options.allow_deferred_init && !existing.allow_deferred_init()) {
                throw std::invalid_argument("Parameter '" + existing.name()
                                            + "' does not allow deferred initialization and cannot be re-declared with it.");
            }
        }

        void insert(Entry parameter)
        {
            index_.emplace(parameter->name(), parameters_.size());
            parameters_.push_back(std::move(parameter));
        }

        std::string prefix_;
        Storage parameters_{};
        std::unordered_map<std::string, std::size_t> index_{};
    };
}

#endif // STRATA_PARAMETER_DICT_HPP
