#pragma once
#include "covariates.hpp"
#include <armadillo>

namespace scbfa {

// Parameters of the BFA linear predictor (cells x genes):
//   Theta = Z A' + X beta + gamma W'
struct FactorParams {
  arma::mat Z;      // N x K
  arma::mat A;      // G x K
  arma::mat beta;   // P x G
  arma::mat gamma;  // N x Q
};

// Theta for the given covariate designs (N x G).
arma::mat linear_predictor(const FactorParams& p, const arma::mat& X, const arma::mat& W);

// Removes the non-identifiable directions of Z A' without changing Theta:
//  1. the part of Z in span(X) is folded into beta
//  2. the part of A in span(W) is folded into gamma
//  3. Z A' is re-split as U S^1/2, V S^1/2 (orthogonal columns, equal norms,
//     descending S, largest |A| entry of each column positive)
// Steps 1-3 never increase ||Z||^2 + ||A||^2.
FactorParams normalize_gauge(const FactorParams& p,
                             const CovariateBasis& cells,
                             const CovariateBasis& genes);

} // namespace scbfa
