#include "convergence.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

namespace scbfa {

const char* to_string(StopReason r) {
  switch (r) {
    case StopReason::None:               return "none";
    case StopReason::Converged:          return "converged";
    case StopReason::MaxIterations:      return "max_iterations";
    case StopReason::LikelihoodDecrease: return "likelihood_decrease";
  }
  return "unknown";
}

ConvergenceController::ConvergenceController(int maxiter, double tol, double noise_tol)
  : maxiter_(maxiter), tol_(tol), noise_tol_(noise_tol)
{
  if (maxiter_ < 1) throw std::invalid_argument("maxiter must be >= 1");
  if (!(tol_ > 0.0)) throw std::invalid_argument("tol must be > 0");
  if (noise_tol_ < 0.0) throw std::invalid_argument("noise_tol must be >= 0");
}

ConvergenceDecision ConvergenceController::check(const std::vector<double>& ll,
                                                 int iteration) const {
  ConvergenceDecision d;

  if (iteration >= 2 && ll.size() >= 2) {
    const double cur  = ll[ll.size() - 1];
    const double prev = ll[ll.size() - 2];
    // absolute change when the previous value is exactly zero
    const double den = (prev != 0.0) ? std::fabs(prev) : 1.0;
    d.rel_change = (cur - prev) / den;

    if (d.rel_change < -noise_tol_) {
      d.stop = true;
      d.reason = StopReason::LikelihoodDecrease;
      return d;
    }
    if (d.rel_change < tol_) {
      d.stop = true;
      d.reason = StopReason::Converged;
      return d;
    }
  }

  if (iteration >= maxiter_) {
    d.stop = true;
    d.reason = StopReason::MaxIterations;
  }
  return d;
}

std::optional<ConvergenceWarning>
ConvergenceController::warning(const ConvergenceDecision& d, int iteration) const {
  if (!d.stop) return std::nullopt;

  std::ostringstream oss;
  switch (d.reason) {
    case StopReason::MaxIterations:
      oss << "reached maxiter=" << maxiter_ << " without relative improvement < " << tol_;
      break;
    case StopReason::LikelihoodDecrease:
      oss << "objective decreased at sweep " << iteration
          << " (relative change " << d.rel_change << ", allowance " << noise_tol_ << ")";
      break;
    default:
      return std::nullopt;
  }
  return ConvergenceWarning{d.reason, iteration, oss.str()};
}

} // namespace scbfa
