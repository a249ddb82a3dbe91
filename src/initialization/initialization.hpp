#ifndef STRATA_INITIALIZATION_HPP
#define STRATA_INITIALIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

namespace Strata::Initialization {
    enum class Type {
        Default,
        Zeros,
        Ones,
        Constant,
        Uniform,
        Normal,
        XavierNormal,
        XavierUniform,
        HeNormal,
        HeUniform,
    };

    // `value` is the fill value for Constant, the bound for Uniform and the
    // standard deviation for Normal.
    struct Descriptor {
        Type type{Type::Default};
        double value{0.0};
    };

    inline constexpr Descriptor Default{Type::Default};
    inline constexpr Descriptor Zeros{Type::Zeros};
    inline constexpr Descriptor Ones{Type::Ones};
    inline constexpr Descriptor XavierNormal{Type::XavierNormal};
    inline constexpr Descriptor XavierUniform{Type::XavierUniform};
    inline constexpr Descriptor HeNormal{Type::HeNormal};
    inline constexpr Descriptor HeUniform{Type::HeUniform};

    [[nodiscard]] constexpr Descriptor Constant(double value) noexcept { return {Type::Constant, value}; }
    [[nodiscard]] constexpr Descriptor Uniform(double scale = 0.07) noexcept { return {Type::Uniform, scale}; }
    [[nodiscard]] constexpr Descriptor Normal(double sigma = 0.01) noexcept { return {Type::Normal, sigma}; }

    // Used when neither the Parameter nor the initialize() call names one.
    inline constexpr Descriptor Fallback{Type::Uniform, 0.07};
}

#endif //STRATA_INITIALIZATION_HPP
