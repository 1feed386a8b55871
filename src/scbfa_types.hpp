#pragma once
#include <armadillo>
#include <cstdint>
#include <string>
#include <vector>

namespace scbfa {

// -------- Configuration --------

enum class InitMethod { Svd, Random };

struct BfaConfig {
  int    num_factors{2};          // K, 1 <= K < min(N, G)

  // Convergence / runtime
  int    maxiter{300};
  double tol{1e-5};               // relative objective improvement
  double noise_tol{1e-8};         // allowed relative decrease before warning

  // Model
  double l2_penalty{1.0};         // lambda on Z and A (standard-normal prior at 1.0)
  double weight_eps{1e-6};        // floor added to mu*(1-mu)

  // Initialization
  InitMethod init{InitMethod::Svd};
  double init_clip{0.1};          // D clipped to [delta, 1-delta] before logit
  double init_scale{0.1};         // sd of random init
  std::uint64_t seed{1};

  // Normal-equation stabilization
  double ridge{1e-10};
  double ridge_cap{1e-2};
  double rcond_min{1e-12};
  int    max_halvings{10};

  bool verbose{false};
};

struct BinaryPcaConfig {
  int    num_components{2};
  double variance_floor{1e-8};    // clip for p*(1-p) of near-constant genes
  bool   verbose{false};
};

// Genes/cells kept for fitting.
struct DetectionFilter {
  arma::uword min_cells_per_gene{1};
  arma::uword min_genes_per_cell{1};
};

// -------- Results --------

enum class StopReason { None, Converged, MaxIterations, LikelihoodDecrease };

const char* to_string(StopReason r);

// Non-fatal: attached to the result, never thrown.
struct ConvergenceWarning {
  StopReason  reason{StopReason::None};
  int         iteration{0};
  std::string message;
};

struct BfaResult {
  arma::mat Z;                       // N x K embedding
  arma::mat A;                       // G x K loadings
  arma::mat beta;                    // P x G, gene-wise coefficients of cell covariates
  arma::mat gamma;                   // N x Q, cell-wise coefficients of gene covariates
  std::vector<double> objective_trace;  // penalized log-likelihood after each sweep
  std::vector<double> loglik_trace;     // Bernoulli log-likelihood after each sweep
  bool converged{false};
  int  iterations{0};
  StopReason stop_reason{StopReason::None};
  std::vector<ConvergenceWarning> warnings;
};

struct BinaryPcaResult {
  arma::mat x;                          // N x K scores
  arma::mat loadings;                   // G x K
  arma::vec sdev;                       // K
  arma::vec explained_variance;         // K, sdev^2
  arma::vec explained_variance_ratio;   // K, fraction of total variance
  arma::vec center;                     // G, gene detection frequencies
  std::vector<std::string> warnings;
};

struct FilteredDetection {
  arma::mat  detection;   // G' x N'
  arma::uvec kept_genes;  // indices into the input rows
  arma::uvec kept_cells;  // indices into the input columns
};

} // namespace scbfa
