#pragma once
#include "scbfa_types.hpp"
#include <armadillo>
#include <string>
#include <vector>

namespace scbfa {

// Variance-stabilized surrogate of D in cells x genes orientation:
//   T(n,g) = (D(g,n) - p_g) / sqrt(max(p_g (1 - p_g), variance_floor))
// with X regressed out when it carries more than an intercept, then
// column-centered. Genes hitting the floor are reported in `warnings`.
// `center` receives the gene detection frequencies p_g.
arma::mat transform_detection(const arma::mat& D,
                              const arma::mat& X,
                              double variance_floor,
                              arma::vec& center,
                              std::vector<std::string>& warnings);

// ======= BinaryPcaEngine =======
// One truncated SVD of the transformed detection matrix; no iterations.
class BinaryPcaEngine {
public:
  explicit BinaryPcaEngine(const BinaryPcaConfig& cfg);

  // D: G x N, X: N x P optional cell covariates to regress out.
  BinaryPcaResult fit(const arma::mat& D, const arma::mat& X = arma::mat()) const;


private:
  BinaryPcaConfig cfg_;
};

BinaryPcaResult fit_binary_pca(const arma::mat& D,
                               const arma::mat& X,
                               const BinaryPcaConfig& cfg);

} // namespace scbfa
