// binary_pca.cpp
// ------------------------------------------------------------
// Binary PCA: closed-form approximation of the BFA embedding.
// Detection frequencies -> Bernoulli Pearson residuals -> optional
// covariate regression -> centered truncated SVD.
// ------------------------------------------------------------

#include "binary_pca.hpp"
#include "covariates.hpp"
#include "detection_matrix.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace scbfa {

arma::mat transform_detection(const arma::mat& D,
                              const arma::mat& X,
                              double variance_floor,
                              arma::vec& center,
                              std::vector<std::string>& warnings) {
  const arma::mat Dt = D.t();                          // N x G
  const arma::rowvec p = arma::mean(Dt, 0);
  arma::rowvec var = p % (1.0 - p);

  for (arma::uword g = 0; g < var.n_elem; ++g) {
    if (var(g) < variance_floor) {
      std::ostringstream oss;
      oss << "gene " << g << " has near-zero detection variance (p=" << p(g)
          << "); clipped to " << variance_floor;
      warnings.push_back(oss.str());
      var(g) = variance_floor;
    }
  }

  arma::mat T = Dt.each_row() - p;
  T.each_row() /= arma::sqrt(var);

  if (!X.is_empty()) {
    const CovariateBasis cells(X, Dt.n_rows, "cell covariates X");
    T = cells.residualize(T);
  }
  T.each_row() -= arma::mean(T, 0);

  center = p.t();
  return T;
}

BinaryPcaEngine::BinaryPcaEngine(const BinaryPcaConfig& cfg) : cfg_(cfg) {
  if (cfg_.num_components < 1) throw std::invalid_argument("num_components must be >= 1");
  if (!(cfg_.variance_floor > 0.0)) throw std::invalid_argument("variance_floor must be > 0");
}

BinaryPcaResult BinaryPcaEngine::fit(const arma::mat& D, const arma::mat& X) const {
  static const char* kTag = "BinaryPcaEngine";

  check_detection_matrix(D, kTag);
  const arma::uword G = D.n_rows, N = D.n_cols;
  const arma::uword lim = std::min(N, G);
  if (static_cast<arma::uword>(cfg_.num_components) >= lim) {
    throw DimensionError("num_components K=" + std::to_string(cfg_.num_components) +
                         " must satisfy 1 <= K < min(N, G) = " + std::to_string(lim));
  }
  if (!X.is_empty() && X.n_rows != N) {
    throw DimensionError("cell covariates X has " + std::to_string(X.n_rows) +
                         " rows, expected " + std::to_string(N));
  }

  BinaryPcaResult out;
  const arma::mat T = transform_detection(D, X, cfg_.variance_floor, out.center, out.warnings);
  for (const auto& w : out.warnings) log_warn(kTag, w);

  arma::mat U, V;
  arma::vec s;
  if (!arma::svd_econ(U, s, V, T)) {
    throw NumericalError("BinaryPcaEngine: SVD of transformed matrix failed");
  }

  const arma::uword K = static_cast<arma::uword>(cfg_.num_components);
  out.x        = U.cols(0, K - 1);
  out.loadings = V.cols(0, K - 1);
  out.x.each_row() %= s.head(K).t();

  // deterministic sign: largest |loading| positive
  for (arma::uword k = 0; k < K; ++k) {
    const arma::uword i = arma::index_max(arma::abs(out.loadings.col(k)));
    if (out.loadings(i, k) < 0.0) {
      out.loadings.col(k) *= -1.0;
      out.x.col(k) *= -1.0;
    }
  }

  out.sdev = s.head(K) / std::sqrt(static_cast<double>(N - 1));
  out.explained_variance = arma::square(out.sdev);
  const double total = arma::accu(arma::square(s));
  out.explained_variance_ratio = (total > 0.0)
    ? arma::vec(arma::square(s.head(K)) / total)
    : arma::vec(K, arma::fill::zeros);

  std::ostringstream oss;
  oss << "G=" << G << " N=" << N << " K=" << K
      << " variance explained=" << arma::accu(out.explained_variance_ratio);
  log_info(cfg_.verbose, kTag, oss.str());
  return out;
}

BinaryPcaResult fit_binary_pca(const arma::mat& D,
                               const arma::mat& X,
                               const BinaryPcaConfig& cfg) {
  return BinaryPcaEngine(cfg).fit(D, X);
}

} // namespace scbfa
