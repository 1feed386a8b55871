#pragma once
#include <armadillo>
#include <Eigen/Dense>
#include <Eigen/QR>
#include <string>

namespace scbfa {

// Covariate design for one axis (cells: X, genes: W) with its column-pivoted
// QR kept for least-squares projections.
//
//  - an empty matrix means intercept-only (a single column of ones)
//  - row count must match the axis length       -> DimensionError
//  - non-finite entries                          -> std::invalid_argument
//  - rank-deficient columns                      -> NumericalError
class CovariateBasis {
public:
  CovariateBasis(const arma::mat& C, arma::uword n_rows, const std::string& name);

  const arma::mat& design() const { return design_; }
  arma::uword n_rows() const { return design_.n_rows; }
  arma::uword n_cols() const { return design_.n_cols; }
  bool intercept_only() const { return intercept_only_; }

  // (C'C)^{-1} C'Y  (n_cols x Y.n_cols)
  arma::mat coefficients(const arma::mat& Y) const;

  // Y - C (C'C)^{-1} C'Y
  arma::mat residualize(const arma::mat& Y) const;

private:
  arma::mat   design_;
  Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr_;
  bool        intercept_only_{false};
  std::string name_;
};

} // namespace scbfa
