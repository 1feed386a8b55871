// detection_matrix.cpp
// ------------------------------------------------------------
// Counts -> binary detection matrix, validation of degenerate
// genes/cells, and the upstream filter that removes them.
// ------------------------------------------------------------

#include "detection_matrix.hpp"
#include "errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace scbfa {

// ---------- small helpers ----------

static inline void check_counts_shape(arma::uword n_rows, arma::uword n_cols) {
  if (n_rows == 0 || n_cols == 0) {
    throw DimensionError("count matrix is empty (" + std::to_string(n_rows) +
                         " x " + std::to_string(n_cols) + ")");
  }
}

static inline void check_count_value(double v, arma::uword i, arma::uword j) {
  if (!std::isfinite(v) || v < 0.0) {
    throw std::invalid_argument("count matrix entry (" + std::to_string(i) + "," +
                                std::to_string(j) + ") is negative or not finite");
  }
}

// ---------- builder ----------

arma::mat DetectionMatrixBuilder::build(const arma::mat& counts) {
  check_counts_shape(counts.n_rows, counts.n_cols);
  arma::mat D(counts.n_rows, counts.n_cols, arma::fill::zeros);
  for (arma::uword j = 0; j < counts.n_cols; ++j) {
    for (arma::uword i = 0; i < counts.n_rows; ++i) {
      const double v = counts(i, j);
      check_count_value(v, i, j);
      if (v > 0.0) D(i, j) = 1.0;
    }
  }
  return D;
}

arma::mat DetectionMatrixBuilder::build(const arma::sp_mat& counts) {
  check_counts_shape(counts.n_rows, counts.n_cols);
  arma::mat D(counts.n_rows, counts.n_cols, arma::fill::zeros);
  // Only stored entries can be nonzero.
  for (arma::sp_mat::const_iterator it = counts.begin(); it != counts.end(); ++it) {
    const double v = *it;
    check_count_value(v, it.row(), it.col());
    if (v > 0.0) D(it.row(), it.col()) = 1.0;
  }
  return D;
}

// ---------- validation ----------

void check_detection_matrix(const arma::mat& D, const char* where) {
  const std::string w(where);
  if (D.n_rows == 0 || D.n_cols == 0) {
    throw DimensionError(w + ": detection matrix is empty");
  }
  if (!D.is_finite()) {
    throw std::invalid_argument(w + ": detection matrix has non-finite entries");
  }
  if (arma::any(arma::vectorise((D != 0.0) % (D != 1.0)))) {
    throw std::invalid_argument(w + ": detection matrix must contain only 0/1");
  }

  const arma::vec per_gene = arma::sum(D, 1);
  const arma::rowvec per_cell = arma::sum(D, 0);
  const double n = static_cast<double>(D.n_cols);
  const double g = static_cast<double>(D.n_rows);

  for (arma::uword i = 0; i < D.n_rows; ++i) {
    if (per_gene(i) == 0.0 || per_gene(i) == n) {
      throw DegenerateInputError(w + ": gene (row) " + std::to_string(i) +
                                 " is constant (detected in " +
                                 std::to_string(static_cast<long>(per_gene(i))) +
                                 " of " + std::to_string(D.n_cols) + " cells)");
    }
  }
  for (arma::uword j = 0; j < D.n_cols; ++j) {
    if (per_cell(j) == 0.0 || per_cell(j) == g) {
      throw DegenerateInputError(w + ": cell (column) " + std::to_string(j) +
                                 " is constant (detects " +
                                 std::to_string(static_cast<long>(per_cell(j))) +
                                 " of " + std::to_string(D.n_rows) + " genes)");
    }
  }
}

// ---------- filter ----------

FilteredDetection filter_detection(const arma::mat& D, const DetectionFilter& f) {
  if (D.n_rows == 0 || D.n_cols == 0) {
    throw DimensionError("filter_detection: detection matrix is empty");
  }

  arma::uvec genes = arma::regspace<arma::uvec>(0, D.n_rows - 1);
  arma::uvec cells = arma::regspace<arma::uvec>(0, D.n_cols - 1);

  // Removing genes can make a cell constant and vice versa.
  bool changed = true;
  while (changed && !genes.is_empty() && !cells.is_empty()) {
    changed = false;
    const arma::mat sub = D.submat(genes, cells);

    const arma::vec per_gene = arma::sum(sub, 1);
    const arma::uvec keep_g = arma::find(per_gene >= static_cast<double>(f.min_cells_per_gene) &&
                                         per_gene > 0.0 &&
                                         per_gene < static_cast<double>(cells.n_elem));
    if (keep_g.n_elem != genes.n_elem) {
      genes = arma::uvec(genes.elem(keep_g));
      changed = true;
      continue;
    }

    const arma::vec per_cell = arma::sum(sub, 0).t();
    const arma::uvec keep_c = arma::find(per_cell >= static_cast<double>(f.min_genes_per_cell) &&
                                         per_cell > 0.0 &&
                                         per_cell < static_cast<double>(genes.n_elem));
    if (keep_c.n_elem != cells.n_elem) {
      cells = arma::uvec(cells.elem(keep_c));
      changed = true;
    }
  }

  if (genes.is_empty() || cells.is_empty()) {
    throw DegenerateInputError("filter_detection: no genes or cells left after filtering");
  }

  FilteredDetection out;
  out.detection  = D.submat(genes, cells);
  out.kept_genes = std::move(genes);
  out.kept_cells = std::move(cells);
  return out;
}

} // namespace scbfa
