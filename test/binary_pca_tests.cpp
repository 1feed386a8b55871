//
//  binary_pca_tests.cpp
//

#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include <armadillo>

#include "binary_pca.hpp"
#include "errors.hpp"
#include "test_utils.hpp"

using namespace scbfa;

namespace {

BinaryPcaConfig one_component()
{
    BinaryPcaConfig cfg;
    cfg.num_components = 1;
    return cfg;
}

} // namespace

BOOST_AUTO_TEST_SUITE(binary_pca)

BOOST_AUTO_TEST_CASE(example_returns_scores_and_loadings_of_the_right_shape)
{
    const BinaryPcaResult r = BinaryPcaEngine(one_component()).fit(test::example_detection());
    
    BOOST_CHECK_EQUAL(r.x.n_rows, 3u);
    BOOST_CHECK_EQUAL(r.x.n_cols, 1u);
    BOOST_CHECK_EQUAL(r.loadings.n_rows, 4u);
    BOOST_CHECK_EQUAL(r.loadings.n_cols, 1u);
    BOOST_REQUIRE_EQUAL(r.sdev.n_elem, 1u);
    BOOST_REQUIRE_EQUAL(r.center.n_elem, 4u);
    BOOST_CHECK(r.warnings.empty());
    
    // squared singular values of the transformed example are 7.5 and 4.5
    BOOST_CHECK_CLOSE(r.sdev(0), std::sqrt(7.5 / 2.0), 1e-8);
    BOOST_CHECK_CLOSE(r.explained_variance(0), 7.5 / 2.0, 1e-8);
    BOOST_CHECK_CLOSE(r.explained_variance_ratio(0), 0.625, 1e-8);
    BOOST_CHECK_CLOSE(r.center(0), 2.0 / 3.0, 1e-10);
    BOOST_CHECK_CLOSE(r.center(3), 1.0 / 3.0, 1e-10);
}

BOOST_AUTO_TEST_CASE(rank_one_reconstruction_error_is_optimal)
{
    const arma::mat D = test::example_detection();
    const BinaryPcaResult r = BinaryPcaEngine(one_component()).fit(D);
    
    arma::vec center;
    std::vector<std::string> warnings;
    const arma::mat T = transform_detection(D, arma::mat(), 1e-8, center, warnings);
    
    const double rel = arma::norm(T - r.x * r.loadings.t(), "fro") / arma::norm(T, "fro");
    BOOST_CHECK_LT(rel, 0.65);
    BOOST_CHECK_CLOSE(rel, std::sqrt(1.0 - r.explained_variance_ratio(0)), 1e-6);
}

BOOST_AUTO_TEST_CASE(scores_follow_the_leading_left_singular_vector)
{
    const arma::mat D = test::example_detection();
    const BinaryPcaResult r = BinaryPcaEngine(one_component()).fit(D);
    
    arma::vec center;
    std::vector<std::string> warnings;
    const arma::mat T = transform_detection(D, arma::mat(), 1e-8, center, warnings);
    arma::mat U, V;
    arma::vec s;
    BOOST_REQUIRE(arma::svd_econ(U, s, V, T));
    
    const arma::vec x = r.x.col(0) / arma::norm(r.x.col(0));
    BOOST_CHECK_CLOSE(std::fabs(arma::dot(x, U.col(0))), 1.0, 1e-8);
    BOOST_CHECK_SMALL(test::max_abs(r.x - T * r.loadings), 1e-10);
}

BOOST_AUTO_TEST_CASE(transform_is_centered_and_scaled_per_gene)
{
    arma::vec center;
    std::vector<std::string> warnings;
    const arma::mat T = transform_detection(test::example_detection(), arma::mat(), 1e-8,
                                            center, warnings);
    BOOST_CHECK_EQUAL(T.n_rows, 3u);
    BOOST_CHECK_EQUAL(T.n_cols, 4u);
    BOOST_CHECK_SMALL(test::max_abs(arma::mean(T, 0)), 1e-12);
    // p = 2/3, detected: (1 - 2/3) / sqrt(2/9)
    BOOST_CHECK_CLOSE(T(0, 0), (1.0 / 3.0) / std::sqrt(2.0 / 9.0), 1e-10);
    BOOST_CHECK(warnings.empty());
}

BOOST_AUTO_TEST_CASE(near_constant_genes_are_clipped_with_a_warning)
{
    arma::vec center;
    std::vector<std::string> warnings;
    const arma::mat T = transform_detection(test::example_detection(), arma::mat(), 0.3,
                                            center, warnings);
    BOOST_CHECK(T.is_finite());
    BOOST_CHECK_EQUAL(warnings.size(), 4u);
    BOOST_CHECK_CLOSE(T(0, 0), (1.0 / 3.0) / std::sqrt(0.3), 1e-10);
}

BOOST_AUTO_TEST_CASE(cell_covariates_are_regressed_out)
{
    const arma::mat D = test::simulate_detection(25, 30, 2, 9);
    const arma::uword N = D.n_cols;
    arma::mat X(N, 2);
    X.col(0).ones();
    for (arma::uword n = 0; n < N; ++n) X(n, 1) = (n < N / 2) ? 0.0 : 1.0;
    
    arma::vec center;
    std::vector<std::string> warnings;
    const arma::mat T = transform_detection(D, X, 1e-8, center, warnings);
    BOOST_CHECK_SMALL(test::max_abs(X.t() * T), 1e-9);
    
    BinaryPcaConfig cfg;
    cfg.num_components = 3;
    const BinaryPcaResult r = BinaryPcaEngine(cfg).fit(D, X);
    BOOST_CHECK_SMALL(test::max_abs(X.t() * r.x), 1e-9);
    for (arma::uword k = 1; k < r.sdev.n_elem; ++k) {
        BOOST_CHECK_GE(r.sdev(k - 1), r.sdev(k));
    }
}

BOOST_AUTO_TEST_CASE(fit_is_deterministic)
{
    const arma::mat D = test::simulate_detection(25, 30, 2, 13);
    const BinaryPcaEngine engine {BinaryPcaConfig {}};
    const BinaryPcaResult a = engine.fit(D);
    const BinaryPcaResult b = engine.fit(D);
    BOOST_CHECK(arma::approx_equal(a.x, b.x, "absdiff", 0.0));
    BOOST_CHECK(arma::approx_equal(a.loadings, b.loadings, "absdiff", 0.0));
    for (arma::uword k = 0; k < a.loadings.n_cols; ++k) {
        const arma::uword i = arma::index_max(arma::abs(a.loadings.col(k)));
        BOOST_CHECK_GT(a.loadings(i, k), 0.0);
    }
}

BOOST_AUTO_TEST_CASE(invalid_inputs_are_rejected)
{
    const BinaryPcaEngine engine {one_component()};
    
    arma::mat D = test::example_detection();
    D.col(0).ones();
    BOOST_CHECK_THROW(engine.fit(D), DegenerateInputError);
    
    D = test::example_detection();
    BOOST_CHECK_THROW(engine.fit(D, arma::ones<arma::mat>(2, 1)), DimensionError);
    
    BinaryPcaConfig too_many;
    too_many.num_components = 3;
    BOOST_CHECK_THROW(BinaryPcaEngine(too_many).fit(D), DimensionError);
    
    BinaryPcaConfig bad;
    bad.variance_floor = 0.0;
    BOOST_CHECK_THROW(BinaryPcaEngine {bad}, std::invalid_argument);
    bad = BinaryPcaConfig {};
    bad.num_components = 0;
    BOOST_CHECK_THROW(BinaryPcaEngine {bad}, std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
