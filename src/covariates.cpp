// covariates.cpp
// ------------------------------------------------------------
// CovariateBasis: validation of cell/gene covariate matrices and
// QR-based least-squares projections used by the gauge step and
// by Binary PCA's covariate regression.
//
// Depends: Eigen3 (QR), Armadillo (storage).
// ------------------------------------------------------------

#include "covariates.hpp"
#include "errors.hpp"

#include <stdexcept>
#include <string>

namespace scbfa {

// ======= Utility: view Armadillo storage as Eigen without copying =======
// Both are column-major doubles.
static inline Eigen::Map<const Eigen::MatrixXd> map_mat(const arma::mat& M) {
  return Eigen::Map<const Eigen::MatrixXd>(M.memptr(),
                                           static_cast<Eigen::Index>(M.n_rows),
                                           static_cast<Eigen::Index>(M.n_cols));
}

static inline arma::mat to_arma(const Eigen::MatrixXd& M) {
  return arma::mat(M.data(), static_cast<arma::uword>(M.rows()),
                   static_cast<arma::uword>(M.cols()));
}

CovariateBasis::CovariateBasis(const arma::mat& C, arma::uword n_rows,
                               const std::string& name)
  : name_(name)
{
  if (n_rows == 0) throw DimensionError(name_ + ": axis length must be > 0");

  if (C.is_empty()) {
    design_.ones(n_rows, 1);
    intercept_only_ = true;
  } else {
    if (C.n_rows != n_rows) {
      throw DimensionError(name_ + ": covariate matrix has " + std::to_string(C.n_rows) +
                           " rows, expected " + std::to_string(n_rows));
    }
    if (!C.is_finite()) {
      throw std::invalid_argument(name_ + ": covariate matrix has non-finite entries");
    }
    if (C.n_cols > n_rows) {
      throw DimensionError(name_ + ": more covariates (" + std::to_string(C.n_cols) +
                           ") than rows (" + std::to_string(n_rows) + ")");
    }
    design_ = C;
  }

  qr_.compute(map_mat(design_));
  const Eigen::Index rank = qr_.rank();
  if (rank < static_cast<Eigen::Index>(design_.n_cols)) {
    throw NumericalError(name_ + ": covariate matrix is rank deficient (rank " +
                         std::to_string(rank) + " < " +
                         std::to_string(design_.n_cols) + " columns)");
  }
}

arma::mat CovariateBasis::coefficients(const arma::mat& Y) const {
  if (Y.n_rows != design_.n_rows) {
    throw DimensionError(name_ + ": projection input has " + std::to_string(Y.n_rows) +
                         " rows, expected " + std::to_string(design_.n_rows));
  }
  if (Y.n_cols == 0) return arma::mat(design_.n_cols, 0);
  const Eigen::MatrixXd b = qr_.solve(map_mat(Y));
  return to_arma(b);
}

arma::mat CovariateBasis::residualize(const arma::mat& Y) const {
  return Y - design_ * coefficients(Y);
}

} // namespace scbfa
