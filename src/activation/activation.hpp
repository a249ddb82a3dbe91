#ifndef STRATA_ACTIVATION_HPP
#define STRATA_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Strata::Activation {
    enum class Type {
        Identity,
        ReLU,
        Sigmoid,
        Tanh,
        SoftReLU,
        SoftSign,
    };

    struct Descriptor {
        Type type{Type::Identity};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor Tanh{Type::Tanh};
    inline constexpr Descriptor SoftReLU{Type::SoftReLU};
    inline constexpr Descriptor SoftSign{Type::SoftSign};

    [[nodiscard]] constexpr std::string_view name(Type type) noexcept
    {
        switch (type) {
            case Type::ReLU: return "relu";
            case Type::Sigmoid: return "sigmoid";
            case Type::Tanh: return "tanh";
            case Type::SoftReLU: return "softrelu";
            case Type::SoftSign: return "softsign";
            case Type::Identity:
            default: return "identity";
        }
    }

    [[nodiscard]] inline Descriptor parse(std::string_view text)
    {
        constexpr std::array kTypes{Type::Identity, Type::ReLU, Type::Sigmoid,
                                    Type::Tanh, Type::SoftReLU, Type::SoftSign};
        for (const auto type : kTypes) {
            if (name(type) == text) {
                return Descriptor{type};
            }
        }
        throw std::invalid_argument("Unknown activation '" + std::string(text) + "'.");
    }
}

#endif //STRATA_ACTIVATION_HPP
