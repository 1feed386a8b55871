#pragma once
#include "scbfa_types.hpp"
#include <armadillo>

namespace scbfa {

class DetectionMatrixBuilder {
public:
  // D(i,j) = 1 if counts(i,j) > 0 else 0. Rows are genes, columns cells.
  // Throws std::invalid_argument on negative or non-finite counts and
  // DimensionError on an empty matrix.
  static arma::mat build(const arma::mat& counts);
  static arma::mat build(const arma::sp_mat& counts);
};

// Checks that D is non-empty, strictly 0/1 and has no constant row or
// column. `where` prefixes the error messages.
void check_detection_matrix(const arma::mat& D, const char* where);

// Drops genes/cells below the detection thresholds or detected everywhere,
// repeating until no row or column changes.
FilteredDetection filter_detection(const arma::mat& D, const DetectionFilter& f);

} // namespace scbfa
