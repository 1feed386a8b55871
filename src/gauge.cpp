#include "gauge.hpp"
#include "errors.hpp"

namespace scbfa {

arma::mat linear_predictor(const FactorParams& p, const arma::mat& X, const arma::mat& W) {
  return p.Z * p.A.t() + X * p.beta + p.gamma * W.t();
}

FactorParams normalize_gauge(const FactorParams& in,
                             const CovariateBasis& cells,
                             const CovariateBasis& genes) {
  FactorParams out = in;

  // (1) Z <- Z - X Dz, X Dz A' moves into X beta
  const arma::mat Dz = cells.coefficients(out.Z);      // P x K
  out.Z    -= cells.design() * Dz;
  out.beta += Dz * out.A.t();

  // (2) A <- A - W Ca, Z Ca' W' moves into gamma W'
  const arma::mat Ca = genes.coefficients(out.A);      // Q x K
  out.A     -= genes.design() * Ca;
  out.gamma += out.Z * Ca.t();

  // (3) balanced split of Z A' through the K x K core
  const arma::uword K = out.Z.n_cols;
  arma::mat Qz, Rz, Qa, Ra;
  if (!arma::qr_econ(Qz, Rz, out.Z) || !arma::qr_econ(Qa, Ra, out.A)) {
    throw NumericalError("normalize_gauge: QR of factors failed");
  }
  arma::mat U, V;
  arma::vec s;
  if (!arma::svd(U, s, V, Rz * Ra.t())) {
    throw NumericalError("normalize_gauge: SVD of factor core failed");
  }

  const arma::vec root = arma::sqrt(arma::clamp(s, 0.0, arma::datum::inf));
  out.Z = Qz * U;
  out.A = Qa * V;
  out.Z.each_row() %= root.t();
  out.A.each_row() %= root.t();

  for (arma::uword k = 0; k < K; ++k) {
    const arma::uword i = arma::index_max(arma::abs(out.A.col(k)));
    if (out.A(i, k) < 0.0) {
      out.A.col(k) *= -1.0;
      out.Z.col(k) *= -1.0;
    }
  }
  return out;
}

} // namespace scbfa
