#pragma once
#include <stdexcept>
#include <string>

namespace scbfa {

// Base for failures raised by the fitting engines. Configuration mistakes
// (bad maxiter, tol, ...) are reported as std::invalid_argument instead.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Shapes of D / X / W / K disagree.
class DimensionError : public Error {
public:
  explicit DimensionError(const std::string& what) : Error(what) {}
};

// Constant gene or cell in the detection matrix (zero variance).
class DegenerateInputError : public Error {
public:
  explicit DegenerateInputError(const std::string& what) : Error(what) {}
};

// Normal equations unsolvable within the ridge cap, rank-deficient
// covariates, or a non-finite objective.
class NumericalError : public Error {
public:
  explicit NumericalError(const std::string& what) : Error(what) {}
};

} // namespace scbfa
