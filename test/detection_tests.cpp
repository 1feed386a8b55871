//
//  detection_tests.cpp
//

#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>

#include <limits>
#include <stdexcept>

#include <armadillo>

#include "detection_matrix.hpp"
#include "errors.hpp"
#include "test_utils.hpp"

using namespace scbfa;

BOOST_AUTO_TEST_SUITE(detection)

BOOST_AUTO_TEST_CASE(build_marks_positive_counts_as_detected)
{
    const arma::mat counts {{0, 3, 0.5},
                            {7, 0, 0}};
    const arma::mat D = DetectionMatrixBuilder::build(counts);
    const arma::mat expected {{0, 1, 1},
                              {1, 0, 0}};
    BOOST_REQUIRE_EQUAL(D.n_rows, 2u);
    BOOST_REQUIRE_EQUAL(D.n_cols, 3u);
    BOOST_CHECK(arma::approx_equal(D, expected, "absdiff", 0.0));
}

BOOST_AUTO_TEST_CASE(sparse_and_dense_counts_give_the_same_detection_matrix)
{
    arma::mat counts(5, 4, arma::fill::zeros);
    counts(0, 1) = 2; counts(3, 0) = 1; counts(4, 3) = 12; counts(2, 2) = 1;
    const arma::sp_mat sparse(counts);
    
    const arma::mat a = DetectionMatrixBuilder::build(counts);
    const arma::mat b = DetectionMatrixBuilder::build(sparse);
    BOOST_CHECK(arma::approx_equal(a, b, "absdiff", 0.0));
    BOOST_CHECK_EQUAL(arma::accu(b), 4.0);
}

BOOST_AUTO_TEST_CASE(build_rejects_negative_non_finite_and_empty_counts)
{
    arma::mat counts(2, 2, arma::fill::ones);
    counts(1, 0) = -1;
    BOOST_CHECK_THROW(DetectionMatrixBuilder::build(counts), std::invalid_argument);
    counts(1, 0) = std::numeric_limits<double>::quiet_NaN();
    BOOST_CHECK_THROW(DetectionMatrixBuilder::build(counts), std::invalid_argument);
    BOOST_CHECK_THROW(DetectionMatrixBuilder::build(arma::mat()), DimensionError);
    BOOST_CHECK_THROW(DetectionMatrixBuilder::build(arma::sp_mat(0, 3)), DimensionError);
}

BOOST_AUTO_TEST_CASE(check_detection_matrix_accepts_the_example)
{
    BOOST_CHECK_NO_THROW(check_detection_matrix(test::example_detection(), "test"));
}

BOOST_AUTO_TEST_CASE(check_detection_matrix_rejects_constant_genes_and_cells)
{
    arma::mat D = test::example_detection();
    D.row(1).fill(1.0);
    BOOST_CHECK_THROW(check_detection_matrix(D, "test"), DegenerateInputError);
    
    D = test::example_detection();
    D.col(2).zeros();
    BOOST_CHECK_THROW(check_detection_matrix(D, "test"), DegenerateInputError);
}

BOOST_AUTO_TEST_CASE(check_detection_matrix_rejects_non_binary_entries)
{
    arma::mat D = test::example_detection();
    D(0, 0) = 0.5;
    BOOST_CHECK_THROW(check_detection_matrix(D, "test"), std::invalid_argument);
    BOOST_CHECK_THROW(check_detection_matrix(arma::mat(), "test"), DimensionError);
}

BOOST_AUTO_TEST_CASE(filter_removes_ubiquitous_genes_and_cascades_to_cells)
{
    // gene 0 is everywhere; once it is gone cell 2 detects nothing
    const arma::mat D {{1, 1, 1},
                       {1, 0, 0},
                       {0, 1, 0}};
    const FilteredDetection fd = filter_detection(D, DetectionFilter {});
    
    BOOST_REQUIRE_EQUAL(fd.kept_genes.n_elem, 2u);
    BOOST_REQUIRE_EQUAL(fd.kept_cells.n_elem, 2u);
    BOOST_CHECK_EQUAL(fd.kept_genes(0), 1u);
    BOOST_CHECK_EQUAL(fd.kept_genes(1), 2u);
    BOOST_CHECK_EQUAL(fd.kept_cells(0), 0u);
    BOOST_CHECK_EQUAL(fd.kept_cells(1), 1u);
    BOOST_CHECK_NO_THROW(check_detection_matrix(fd.detection, "filtered"));
}

BOOST_AUTO_TEST_CASE(filter_keeps_an_already_valid_matrix_intact)
{
    const arma::mat D = test::example_detection();
    const FilteredDetection fd = filter_detection(D, DetectionFilter {});
    BOOST_CHECK_EQUAL(fd.kept_genes.n_elem, D.n_rows);
    BOOST_CHECK_EQUAL(fd.kept_cells.n_elem, D.n_cols);
    BOOST_CHECK(arma::approx_equal(fd.detection, D, "absdiff", 0.0));
}

BOOST_AUTO_TEST_CASE(filter_throws_when_nothing_survives)
{
    const arma::mat D = arma::eye(2, 2);
    DetectionFilter f;
    f.min_cells_per_gene = 2;
    BOOST_CHECK_THROW(filter_detection(D, f), DegenerateInputError);
}

BOOST_AUTO_TEST_SUITE_END()
