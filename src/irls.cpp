// irls.cpp
// ------------------------------------------------------------
// IRLS scaffolding for the logit link: stable sigmoid, Bernoulli
// log-likelihood, working response/weights and the penalized
// weighted least-squares solve used by every BFA block update.
// ------------------------------------------------------------

#include "irls.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace scbfa {

arma::vec sigmoid_stable(const arma::vec& eta) {
  // clamp to avoid exp overflow/underflow
  const arma::vec e = arma::clamp(eta, -40.0, 40.0);
  return 1.0 / (1.0 + arma::exp(-e));
}

static inline double softplus(double x) {
  return std::max(x, 0.0) + std::log1p(std::exp(-std::fabs(x)));
}

double bernoulli_loglik(const arma::vec& eta, const arma::vec& y) {
  double ll = 0.0;
  for (arma::uword i = 0; i < eta.n_elem; ++i) ll += y[i] * eta[i] - softplus(eta[i]);
  return ll;
}

double bernoulli_loglik(const arma::mat& eta, const arma::mat& y) {
  double ll = 0.0;
  for (arma::uword i = 0; i < eta.n_elem; ++i) ll += y[i] * eta[i] - softplus(eta[i]);
  return ll;
}

void irls_binary_build(const arma::vec& eta_lin,
                       const arma::vec& offset,
                       const arma::vec& y,
                       double eps,
                       arma::vec& mu,
                       arma::vec& W,
                       arma::vec& Y) {
  mu = sigmoid_stable(eta_lin + offset);
  W  = mu % (1.0 - mu) + eps;
  Y  = eta_lin + (y - mu) / W;
}

WlsSolution solve_penalized_wls(const arma::mat& M,
                                const arma::vec& w,
                                const arma::vec& r,
                                const arma::vec& penalty,
                                const RidgePolicy& policy,
                                const std::string& what) {
  const arma::uword p = M.n_cols;
  const arma::mat Mw = M.each_col() % w;
  arma::mat H = arma::symmatu(M.t() * Mw);
  H.diag() += penalty;
  const arma::vec rhs = Mw.t() * r;

  double ridge = std::max(policy.ridge, 0.0);
  double last_rcond = 0.0;
  while (ridge <= policy.cap) {
    arma::mat Hr = H;
    Hr.diag() += ridge;

    arma::mat R;
    if (arma::chol(R, Hr)) {
      last_rcond = arma::rcond(Hr);
      if (last_rcond >= policy.rcond_min) {
        // H = R'R
        const arma::vec t = arma::solve(arma::trimatl(R.t()), rhs);
        WlsSolution out;
        out.coef = arma::solve(arma::trimatu(R), t);
        out.ridge_used = ridge;
        return out;
      }
    }
    ridge = (ridge > 0.0) ? ridge * 10.0 : 1e-12;
  }

  std::ostringstream oss;
  oss << what << ": weighted normal equations (" << p << " x " << p
      << ") are singular beyond ridge cap " << policy.cap
      << " (rcond=" << last_rcond << ")";
  throw NumericalError(oss.str());
}

} // namespace scbfa
