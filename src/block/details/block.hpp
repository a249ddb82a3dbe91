#ifndef STRATA_BLOCK_DETAILS_BLOCK_HPP
#define STRATA_BLOCK_DETAILS_BLOCK_HPP

#include <cctype>
#include <cstddef>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/context.hpp"
#include "../../common/error.hpp"
#include "../../initialization/initialization.hpp"
#include "../../parameter/dict.hpp"
#include "../../parameter/parameter.hpp"

namespace Strata {
    struct BlockOptions {
        // Local prefix; empty means `<alias><n>_` chosen by the parent.
        std::string prefix{};
        // Supplying a dict shares it (weight tying) and exempts it from rescoping.
        std::shared_ptr<ParameterDict> params{};
    };

    class Block {
    public:
        using Child = std::pair<std::string, std::shared_ptr<Block>>;
        using Children = std::vector<Child>;
        using OwnParameter = std::pair<std::string, std::shared_ptr<Parameter>>;

        virtual ~Block()
        {
            for (auto& [key, child] : children_) {
                child->parent_ = nullptr;
            }
        }

        Block(const Block&) = delete;
        Block& operator=(const Block&) = delete;

        [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }
        [[nodiscard]] const std::string& alias() const noexcept { return alias_; }
        [[nodiscard]] const std::string& prefix() const noexcept { return prefix_; }

        [[nodiscard]] std::string name() const
        {
            if (!prefix_.empty() && prefix_.back() == '_') {
                return prefix_.substr(0, prefix_.size() - 1);
            }
            return prefix_;
        }

        [[nodiscard]] ParameterDict& params() noexcept { return *params_; }
        [[nodiscard]] const ParameterDict& params() const noexcept { return *params_; }
        [[nodiscard]] const std::shared_ptr<ParameterDict>& shared_params() const noexcept { return params_; }

        [[nodiscard]] const Children& children() const noexcept { return children_; }
        [[nodiscard]] Block* parent() const noexcept { return parent_; }
        [[nodiscard]] const std::vector<OwnParameter>& own_parameters() const noexcept { return own_; }

        template <class Derived>
        std::shared_ptr<Derived> register_child(std::shared_ptr<Derived> child, std::string key = {})
        {
            attach(child, std::move(key));
            return child;
        }

        // Every Parameter of the subtree under one name each, in registration order.
        [[nodiscard]] ParameterDict collect_params() const
        {
            ParameterDict collected{prefix_};
            collected.merge(*params_);
            for (const auto& [key, child] : children_) {
                collected.merge(child->collect_params());
            }
            return collected;
        }

        void initialize(const Initialization::Descriptor& initializer = Initialization::Default,
                        bool force_reinit = false)
        {
            collect_params().initialize(initializer, force_reinit);
        }

        virtual void hybridize(bool active = true)
        {
            for (auto& [key, child] : children_) {
                child->hybridize(active);
            }
        }

        virtual torch::Tensor forward(const torch::Tensor& input, const ExecutionContext& context) = 0;

        torch::Tensor operator()(const torch::Tensor& input, const ExecutionContext& context = Inference)
        {
            return forward(input, context);
        }

        [[nodiscard]] virtual std::string repr() const
        {
            if (children_.empty()) {
                return type_name_ + '(' + extra_repr() + ')';
            }
            std::ostringstream stream;
            stream << type_name_ << "(\n";
            for (const auto& [key, child] : children_) {
                stream << "  (" << key << "): " << indent(child->repr(), 2) << '\n';
            }
            stream << ')';
            return stream.str();
        }

        friend std::ostream& operator<<(std::ostream& stream, const Block& block)
        {
            return stream << block.repr();
        }

    protected:
        Block(std::string type_name, BlockOptions options) : Block(type_name, lowercase(type_name), std::move(options)) {}

        // `alias` names the default local prefix in place of the lowercased type name.
        Block(std::string type_name, std::string alias, BlockOptions options)
            : type_name_(std::move(type_name)),
              alias_(std::move(alias)),
              local_prefix_(options.prefix),
              explicit_prefix_(!options.prefix.empty()),
              explicit_params_(options.params != nullptr)
        {
            if (!explicit_prefix_) {
                local_prefix_ = alias_ + "0_";
            }
            prefix_ = local_prefix_;
            params_ = explicit_params_ ? std::move(options.params) : std::make_shared<ParameterDict>(prefix_);
        }

        // Declares a Parameter in this Block's dict and lists it as owned by
        // this Block for its own forward computation.
        std::shared_ptr<Parameter> declare_parameter(const std::string& short_name, const ParameterOptions& options)
        {
            auto parameter = params_->get(short_name, options);
            own_.emplace_back(short_name, parameter);
            return parameter;
        }

        // Rejects children this Block cannot drive.
        virtual void validate_child(const Block&) const {}

        // Runs on the parent once `child` is attached and named.
        virtual void child_registered(Block&) {}

        // Runs on every ancestor after a Block joins the subtree.
        virtual void subtree_changed() {}

        [[nodiscard]] virtual std::string extra_repr() const { return {}; }

        [[nodiscard]] static std::string indent(const std::string& text, std::size_t spaces)
        {
            std::string result;
            result.reserve(text.size());
            for (const auto character : text) {
                result.push_back(character);
                if (character == '\n') {
                    result.append(spaces, ' ');
                }
            }
            return result;
        }

    private:
        void attach(const std::shared_ptr<Block>& child, std::string key)
        {
            if (!child) {
                throw std::invalid_argument("Cannot register a null Block under '" + name() + "'.");
            }
            if (child->parent_ != nullptr) {
                throw std::invalid_argument("Block '" + child->name() + "' is already registered under '"
                                            + child->parent_->name() + "'.");
            }
            for (const Block* ancestor = this; ancestor != nullptr; ancestor = ancestor->parent_) {
                if (ancestor == child.get()) {
                    throw std::invalid_argument("Registering Block '" + child->name()
                                                + "' under its own descendant would create a cycle.");
                }
            }
            validate_child(*child);

            if (key.empty()) {
                key = std::to_string(children_.size());
            }
            for (const auto& entry : children_) {
                if (entry.first == key) {
                    throw std::invalid_argument("Block '" + name() + "' already has a child registered as '" + key
                                                + "'.");
                }
            }

            const auto previous_local = child->local_prefix_;
            const auto local = child->explicit_prefix_ ? child->local_prefix_
                                                       : child->alias_ + std::to_string(alias_counts_[child->alias_]) + '_';

            children_.emplace_back(std::move(key), child);
            child->parent_ = this;
            child->local_prefix_ = local;
            try {
                child->rescope(prefix_);
                static_cast<void>(root().collect_params());
            } catch (...) {
                children_.pop_back();
                child->parent_ = nullptr;
                child->local_prefix_ = previous_local;
                child->rescope({});
                throw;
            }
            if (!child->explicit_prefix_) {
                ++alias_counts_[child->alias_];
            }
            child_registered(*child);
            for (Block* ancestor = this; ancestor != nullptr; ancestor = ancestor->parent_) {
                ancestor->subtree_changed();
            }
        }

        void rescope(const std::string& scope)
        {
            prefix_ = scope + local_prefix_;
            if (!explicit_params_) {
                params_->rescope(prefix_);
            }
            for (auto& [key, child] : children_) {
                child->rescope(prefix_);
            }
        }

        [[nodiscard]] const Block& root() const noexcept
        {
            const Block* current = this;
            while (current->parent_ != nullptr) {
                current = current->parent_;
            }
            return *current;
        }

        [[nodiscard]] static std::string lowercase(const std::string& text)
        {
            std::string result = text;
            for (auto& character : result) {
                character = static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
            }
            return result;
        }

        std::string type_name_;
        std::string alias_;
        std::string local_prefix_;
        std::string prefix_{};
        bool explicit_prefix_;
        bool explicit_params_;
        std::shared_ptr<ParameterDict> params_{};
        std::vector<OwnParameter> own_{};
        Children children_{};
        std::unordered_map<std::string, std::size_t> alias_counts_{};
        Block* parent_{nullptr};
    };
}

#endif // STRATA_BLOCK_DETAILS_BLOCK_HPP
