#pragma once
#include <armadillo>
#include <string>

namespace scbfa {

// Matrix Market coordinate file (real, integer or pattern; general) as a
// rows x cols sparse matrix. Duplicate entries are summed.
arma::sp_mat load_matrix_market(const std::string& path);

// Any dense format Armadillo auto-detects (csv, raw ascii, arma binary).
arma::mat load_dense(const std::string& path, const std::string& what);

// true for a ".mtx" suffix or a "%%MatrixMarket" banner
bool is_matrix_market(const std::string& path);

void ensure_parent_dir(const std::string& path);

void write_csv(const arma::mat& M, const std::string& path);
void write_column(const arma::vec& v, const std::string& path);
void write_indices(const arma::uvec& idx, const std::string& path);

} // namespace scbfa
