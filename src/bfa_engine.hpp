#pragma once
#include "gauge.hpp"
#include "scbfa_types.hpp"
#include <armadillo>

namespace scbfa {

// ======= BfaEngine =======
//
// Binary factor analysis of a genes x cells detection matrix D:
//
//   D(g,n) ~ Bernoulli(sigmoid(Theta(n,g))),  Theta = Z A' + X beta + gamma W'
//
// fitted by block-coordinate IRLS on the penalized log-likelihood
//   sum log p(D | Theta) - l2_penalty/2 * (||Z||^2 + ||A||^2).
//
// The engine keeps only its configuration, so one instance can serve
// concurrent fits.
class BfaEngine {
public:
  explicit BfaEngine(const BfaConfig& cfg);

  // D: G x N, X: N x P (empty = intercept), W: G x Q (empty = intercept).
  // Throws DimensionError / DegenerateInputError / std::invalid_argument
  // before any optimization, NumericalError if a block update cannot be
  // solved. Hitting maxiter is reported through result.warnings.
  BfaResult fit(const arma::mat& D,
                const arma::mat& X = arma::mat(),
                const arma::mat& W = arma::mat()) const;


private:
  BfaConfig cfg_;
};

BfaResult fit_bfa(const arma::mat& D,
                  const arma::mat& X,
                  const arma::mat& W,
                  const BfaConfig& cfg);

// Objective tracked in BfaResult::objective_trace. Dt is the cells x genes
// transpose of D; X and W are the full (intercept-expanded) designs.
double penalized_loglik(const arma::mat& Dt,
                        const FactorParams& p,
                        const arma::mat& X,
                        const arma::mat& W,
                        double l2_penalty);

} // namespace scbfa
