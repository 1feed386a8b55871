#pragma once
#include <armadillo>
#include <string>

namespace scbfa {

// ---------- Logistic family pieces ----------

arma::vec sigmoid_stable(const arma::vec& eta);

// sum_i y_i*eta_i - log(1 + exp(eta_i)), overflow-safe
double bernoulli_loglik(const arma::vec& eta, const arma::vec& y);
double bernoulli_loglik(const arma::mat& eta, const arma::mat& y);

// Working weights and response for one IRLS step of a logit model with a
// fixed offset:
//   mu = sigmoid(eta_lin + offset)
//   W  = mu*(1-mu) + eps
//   Y  = eta_lin + (y - mu) / W
void irls_binary_build(const arma::vec& eta_lin,
                       const arma::vec& offset,
                       const arma::vec& y,
                       double eps,
                       arma::vec& mu,
                       arma::vec& W,
                       arma::vec& Y);

// ---------- Penalized weighted normal equations ----------

struct RidgePolicy {
  double ridge{1e-10};      // first diagonal jitter tried
  double cap{1e-2};         // largest jitter tolerated before failing
  double rcond_min{1e-12};  // reciprocal condition number threshold
};

struct WlsSolution {
  arma::vec coef;
  double    ridge_used{0.0};
};

// Solves (M' diag(w) M + diag(penalty) + ridge*I) b = M' diag(w) r.
// The ridge grows tenfold while the Cholesky fails or rcond < rcond_min;
// past policy.cap a NumericalError naming `what` is thrown.
WlsSolution solve_penalized_wls(const arma::mat& M,
                                const arma::vec& w,
                                const arma::vec& r,
                                const arma::vec& penalty,
                                const RidgePolicy& policy,
                                const std::string& what);

} // namespace scbfa
