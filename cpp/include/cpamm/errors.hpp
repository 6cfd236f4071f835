#ifndef CPAMM_ERRORS_HPP
#define CPAMM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace cpamm {

// add/sub/mul/div/sqrt or narrowing that has no exact in-range result
class ArithmeticError : public std::overflow_error {
public:
    explicit ArithmeticError(const std::string& what) : std::overflow_error(what) {}
};

// offered or requested asset matches neither side of the pair
class InvalidAsset : public std::invalid_argument {
public:
    explicit InvalidAsset(const std::string& what) : std::invalid_argument(what) {}
};

// zero reserve, zero share supply or any other zero divisor
class DegenerateState : public std::runtime_error {
public:
    explicit DegenerateState(const std::string& what) : std::runtime_error(what) {}
};

// Economic guard rejections. Expected under normal volatility; surfaced to the
// caller verbatim.
class GuardViolation : public std::runtime_error {
public:
    explicit GuardViolation(const std::string& what) : std::runtime_error(what) {}
};

class SlippageExceeded : public GuardViolation {
public:
    explicit SlippageExceeded(const std::string& what) : GuardViolation(what) {}
};

class SpreadExceeded : public GuardViolation {
public:
    explicit SpreadExceeded(const std::string& what) : GuardViolation(what) {}
};

class ReturnBelowExpected : public GuardViolation {
public:
    explicit ReturnBelowExpected(const std::string& what) : GuardViolation(what) {}
};

} // namespace cpamm

#endif // CPAMM_ERRORS_HPP
