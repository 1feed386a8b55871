// bfa_engine.cpp
// ------------------------------------------------------------
// BfaEngine: binary factor analysis by alternating IRLS.
//
//   InitBlock -> UpdateZ -> UpdateA -> CheckConvergence -> UpdateZ ...
//                                                       \-> Done
//
// UpdateZ solves one small penalized IRLS problem per cell for
// [Z_n, gamma_n] with A, beta fixed; UpdateA does the same per gene
// for [A_g, beta_g] with Z, gamma fixed. Every unit step is
// safeguarded by step-halving so the objective cannot go down.
// ------------------------------------------------------------

#include "bfa_engine.hpp"
#include "convergence.hpp"
#include "covariates.hpp"
#include "detection_matrix.hpp"
#include "errors.hpp"
#include "irls.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace scbfa {

namespace {

enum class FitState { InitBlock, UpdateZ, UpdateA, CheckConvergence, Done };

// One cell or gene: design rows M, response y, fixed offset, and the
// number of leading coefficients that are latent (penalized).
struct UnitProblem {
  const arma::mat& M;
  arma::vec        y;
  arma::vec        offset;
  arma::uword      n_latent;
};

} // namespace

// ---------- small helpers ----------

static inline void validate_config(const BfaConfig& c) {
  if (c.num_factors < 1) throw std::invalid_argument("num_factors must be >= 1");
  if (c.maxiter < 1) throw std::invalid_argument("maxiter must be >= 1");
  if (!(c.tol > 0.0)) throw std::invalid_argument("tol must be > 0");
  if (c.noise_tol < 0.0) throw std::invalid_argument("noise_tol must be >= 0");
  if (c.l2_penalty < 0.0) throw std::invalid_argument("l2_penalty must be >= 0");
  if (!(c.weight_eps > 0.0)) throw std::invalid_argument("weight_eps must be > 0");
  if (!(c.init_clip > 0.0 && c.init_clip < 0.5))
    throw std::invalid_argument("init_clip must lie in (0, 0.5)");
  if (!(c.init_scale > 0.0)) throw std::invalid_argument("init_scale must be > 0");
  if (c.ridge < 0.0 || c.ridge > c.ridge_cap)
    throw std::invalid_argument("ridge must lie in [0, ridge_cap]");
  if (c.max_halvings < 0) throw std::invalid_argument("max_halvings must be >= 0");
}

static inline void check_rank(int K, arma::uword n_cells, arma::uword n_genes) {
  const arma::uword lim = std::min(n_cells, n_genes);
  if (K < 1 || static_cast<arma::uword>(K) >= lim) {
    throw DimensionError("num_factors K=" + std::to_string(K) +
                         " must satisfy 1 <= K < min(N, G) = " + std::to_string(lim));
  }
}

static inline double unit_objective(const UnitProblem& u, const arma::vec& theta,
                                    double lambda) {
  const arma::vec eta = u.M * theta + u.offset;
  const double pen = (u.n_latent > 0)
    ? 0.5 * lambda * arma::dot(theta.head(u.n_latent), theta.head(u.n_latent))
    : 0.0;
  return bernoulli_loglik(eta, u.y) - pen;
}

// One safeguarded IRLS step for a single unit.
static arma::vec update_unit(const UnitProblem& u,
                             const arma::vec& theta_old,
                             const BfaConfig& cfg,
                             const RidgePolicy& policy,
                             const std::string& what) {
  arma::vec mu, w, r;
  const arma::vec eta_lin = u.M * theta_old;
  irls_binary_build(eta_lin, u.offset, u.y, cfg.weight_eps, mu, w, r);

  arma::vec penalty(theta_old.n_elem, arma::fill::zeros);
  penalty.head(u.n_latent).fill(cfg.l2_penalty);

  const WlsSolution sol = solve_penalized_wls(u.M, w, r, penalty, policy, what);
  if (!sol.coef.is_finite()) throw NumericalError(what + ": non-finite IRLS solution");

  const double old_obj = unit_objective(u, theta_old, cfg.l2_penalty);
  const arma::vec delta = sol.coef - theta_old;
  double step = 1.0;
  for (int h = 0; h <= cfg.max_halvings; ++h) {
    const arma::vec cand = theta_old + step * delta;
    if (unit_objective(u, cand, cfg.l2_penalty) >= old_obj) return cand;
    step *= 0.5;
  }
  return theta_old;
}

// ---------- initialization ----------

static FactorParams init_svd(const arma::mat& Dt, const BfaConfig& cfg,
                             arma::uword P, arma::uword Q) {
  const arma::uword K = static_cast<arma::uword>(cfg.num_factors);
  const double delta = cfg.init_clip;

  const arma::mat clipped = arma::clamp(Dt, delta, 1.0 - delta);
  arma::mat L = arma::log(clipped / (1.0 - clipped));
  L.each_row() -= arma::mean(L, 0);

  arma::mat U, V;
  arma::vec s;
  if (!arma::svd_econ(U, s, V, L)) {
    throw NumericalError("BfaEngine: SVD initialization failed");
  }
  const arma::rowvec root = arma::sqrt(s.head(K)).t();

  FactorParams p;
  p.Z = U.cols(0, K - 1);
  p.A = V.cols(0, K - 1);
  p.Z.each_row() %= root;
  p.A.each_row() %= root;
  p.beta.zeros(P, Dt.n_cols);
  p.gamma.zeros(Dt.n_rows, Q);
  return p;
}

static FactorParams init_random(const arma::mat& Dt, const BfaConfig& cfg,
                                arma::uword P, arma::uword Q) {
  const arma::uword K = static_cast<arma::uword>(cfg.num_factors);
  std::mt19937_64 rng(cfg.seed);
  std::normal_distribution<double> nd(0.0, cfg.init_scale);

  FactorParams p;
  p.Z.set_size(Dt.n_rows, K);
  p.A.set_size(Dt.n_cols, K);
  for (arma::uword i = 0; i < p.Z.n_elem; ++i) p.Z[i] = nd(rng);
  for (arma::uword i = 0; i < p.A.n_elem; ++i) p.A[i] = nd(rng);
  p.beta.zeros(P, Dt.n_cols);
  p.gamma.zeros(Dt.n_rows, Q);
  return p;
}

// ---------- block sweeps ----------

// Cells: theta_n = [Z_n, gamma_n], design [A, W], offset (X beta)_n.
static void update_cells(const arma::mat& Dt, FactorParams& p,
                         const arma::mat& X, const arma::mat& W,
                         const BfaConfig& cfg, const RidgePolicy& policy) {
  const arma::uword K = p.Z.n_cols;
  const arma::mat M = arma::join_rows(p.A, W);
  const arma::mat XB = X * p.beta;                 // N x G

  for (arma::uword n = 0; n < Dt.n_rows; ++n) {
    const UnitProblem u{M, arma::vec(Dt.row(n).t()), arma::vec(XB.row(n).t()), K};
    const arma::vec theta = arma::join_cols(p.Z.row(n).t(), p.gamma.row(n).t());
    const arma::vec next = update_unit(u, theta, cfg, policy,
                                       "UpdateZ cell " + std::to_string(n));
    p.Z.row(n)     = next.head(K).t();
    p.gamma.row(n) = next.tail(next.n_elem - K).t();
  }
}

// Genes: theta_g = [A_g, beta_g], design [Z, X], offset (gamma W')_g.
static void update_genes(const arma::mat& Dt, FactorParams& p,
                         const arma::mat& X, const arma::mat& W,
                         const BfaConfig& cfg, const RidgePolicy& policy) {
  const arma::uword K = p.A.n_cols;
  const arma::mat M = arma::join_rows(p.Z, X);
  const arma::mat GW = p.gamma * W.t();            // N x G

  for (arma::uword g = 0; g < Dt.n_cols; ++g) {
    const UnitProblem u{M, arma::vec(Dt.col(g)), arma::vec(GW.col(g)), K};
    const arma::vec theta = arma::join_cols(p.A.row(g).t(), p.beta.col(g));
    const arma::vec next = update_unit(u, theta, cfg, policy,
                                       "UpdateA gene " + std::to_string(g));
    p.A.row(g)    = next.head(K).t();
    p.beta.col(g) = next.tail(next.n_elem - K);
  }
}

// ======= public =======

double penalized_loglik(const arma::mat& Dt,
                        const FactorParams& p,
                        const arma::mat& X,
                        const arma::mat& W,
                        double l2_penalty) {
  const arma::mat eta = linear_predictor(p, X, W);
  const double pen = 0.5 * l2_penalty *
                     (arma::accu(arma::square(p.Z)) + arma::accu(arma::square(p.A)));
  return bernoulli_loglik(eta, Dt) - pen;
}

BfaEngine::BfaEngine(const BfaConfig& cfg) : cfg_(cfg) {
  validate_config(cfg_);
}

BfaResult BfaEngine::fit(const arma::mat& D, const arma::mat& X_in,
                         const arma::mat& W_in) const {
  static const char* kTag = "BfaEngine";

  // --- Fail fast: nothing below runs on invalid input ---
  check_detection_matrix(D, kTag);
  const arma::uword G = D.n_rows, N = D.n_cols;
  check_rank(cfg_.num_factors, N, G);
  const CovariateBasis cells(X_in, N, "cell covariates X");
  const CovariateBasis genes(W_in, G, "gene covariates W");

  const arma::mat Dt = D.t();                      // N x G
  const arma::mat& X = cells.design();
  const arma::mat& W = genes.design();
  const RidgePolicy policy{cfg_.ridge, cfg_.ridge_cap, cfg_.rcond_min};
  const ConvergenceController ctl(cfg_.maxiter, cfg_.tol, cfg_.noise_tol);

  BfaResult out;
  FactorParams p;
  int iter = 0;
  FitState state = FitState::InitBlock;

  while (state != FitState::Done) {
    switch (state) {
      case FitState::InitBlock: {
        p = (cfg_.init == InitMethod::Random)
          ? init_random(Dt, cfg_, X.n_cols, W.n_cols)
          : init_svd(Dt, cfg_, X.n_cols, W.n_cols);
        p = normalize_gauge(p, cells, genes);
        log_info(cfg_.verbose, kTag,
                 "G=" + std::to_string(G) + " N=" + std::to_string(N) +
                 " K=" + std::to_string(cfg_.num_factors) +
                 " P=" + std::to_string(X.n_cols) + " Q=" + std::to_string(W.n_cols));
        state = FitState::UpdateZ;
        break;
      }
      case FitState::UpdateZ: {
        ++iter;
        update_cells(Dt, p, X, W, cfg_, policy);
        state = FitState::UpdateA;
        break;
      }
      case FitState::UpdateA: {
        update_genes(Dt, p, X, W, cfg_, policy);
        p = normalize_gauge(p, cells, genes);
        state = FitState::CheckConvergence;
        break;
      }
      case FitState::CheckConvergence: {
        const double obj = penalized_loglik(Dt, p, X, W, cfg_.l2_penalty);
        if (!std::isfinite(obj)) {
          throw NumericalError("BfaEngine: objective is not finite at sweep " +
                               std::to_string(iter));
        }
        const double ll = bernoulli_loglik(linear_predictor(p, X, W), Dt);
        out.objective_trace.push_back(obj);
        out.loglik_trace.push_back(ll);
        const ConvergenceDecision dec = ctl.check(out.objective_trace, iter);

        std::ostringstream oss;
        oss << "sweep " << iter << ": objective=" << std::setprecision(10) << obj
            << " loglik=" << ll
            << " rel=" << std::setprecision(3) << dec.rel_change;
        log_info(cfg_.verbose, kTag, oss.str());

        if (dec.stop) {
          out.stop_reason = dec.reason;
          out.converged = (dec.reason == StopReason::Converged);
          if (auto cw = ctl.warning(dec, iter)) {
            log_warn(kTag, cw->message);
            out.warnings.push_back(std::move(*cw));
          }
          state = FitState::Done;
        } else {
          state = FitState::UpdateZ;
        }
        break;
      }
      case FitState::Done:
        break;
    }
  }

  out.Z     = std::move(p.Z);
  out.A     = std::move(p.A);
  out.beta  = std::move(p.beta);
  out.gamma = std::move(p.gamma);
  out.iterations = iter;
  return out;
}

BfaResult fit_bfa(const arma::mat& D,
                  const arma::mat& X,
                  const arma::mat& W,
                  const BfaConfig& cfg) {
  return BfaEngine(cfg).fit(D, X, W);
}

} // namespace scbfa
