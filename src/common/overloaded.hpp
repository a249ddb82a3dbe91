#ifndef STRATA_COMMON_OVERLOADED_HPP
#define STRATA_COMMON_OVERLOADED_HPP

namespace Strata {
    template <class... Ts>
    struct Overloaded : Ts... {
        using Ts::operator()...;
    };

    template <class... Ts>
    Overloaded(Ts...) -> Overloaded<Ts...>;
}

#endif // STRATA_COMMON_OVERLOADED_HPP
