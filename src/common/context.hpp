#ifndef STRATA_COMMON_CONTEXT_HPP
#define STRATA_COMMON_CONTEXT_HPP

namespace Strata {
    enum class Mode {
        Inference,
        Training,
    };

    // Threaded through every forward call; layers never store it.
    struct ExecutionContext {
        Mode mode{Mode::Inference};

        [[nodiscard]] constexpr bool is_training() const noexcept { return mode == Mode::Training; }
    };

    inline constexpr ExecutionContext Inference{Mode::Inference};
    inline constexpr ExecutionContext Training{Mode::Training};
}

#endif // STRATA_COMMON_CONTEXT_HPP
