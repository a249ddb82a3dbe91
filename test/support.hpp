#ifndef STRATA_TEST_SUPPORT_HPP
#define STRATA_TEST_SUPPORT_HPP

#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace Strata::Test {
    inline bool expect(bool condition, const std::string& message)
    {
        if (!condition) {
            std::cerr << "Expectation failed: " << message << '\n';
        }
        return condition;
    }

    template <class Exception, class Callable>
    bool expect_throws(Callable&& callable, const std::string& message)
    {
        try {
            std::forward<Callable>(callable)();
        } catch (const Exception&) {
            return true;
        } catch (const std::exception& error) {
            std::cerr << "Expectation failed: " << message << " (unexpected exception: " << error.what() << ")\n";
            return false;
        }
        std::cerr << "Expectation failed: " << message << " (nothing was thrown)\n";
        return false;
    }
}

#endif // STRATA_TEST_SUPPORT_HPP
