#pragma once
#include "scbfa_types.hpp"
#include <optional>
#include <vector>

namespace scbfa {

struct ConvergenceDecision {
  bool       stop{false};
  StopReason reason{StopReason::None};
  double     rel_change{0.0};   // (ll[t] - ll[t-1]) / |ll[t-1]|, 0 before iteration 2
};

// Termination policy over the per-sweep objective history. `iteration` is
// 1-based and normally equals history.size().
class ConvergenceController {
public:
  ConvergenceController(int maxiter, double tol, double noise_tol);

  ConvergenceDecision check(const std::vector<double>& history, int iteration) const;
  bool should_stop(const std::vector<double>& history, int iteration) const {
    return check(history, iteration).stop;
  }

  // Non-fatal stops (MaxIterations, LikelihoodDecrease) become a warning
  // to attach to the result; Converged and "keep going" give nothing.
  std::optional<ConvergenceWarning> warning(const ConvergenceDecision& d, int iteration) const;

private:
  int    maxiter_;
  double tol_;
  double noise_tol_;
};

} // namespace scbfa
