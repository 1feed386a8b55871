#include "matrix_io.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace scbfa {

static std::string lower_copy(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool is_matrix_market(const std::string& path) {
  const std::string low = lower_copy(path);
  if (low.size() >= 4 && low.compare(low.size() - 4, 4, ".mtx") == 0) return true;
  std::ifstream in(path);
  std::string line;
  if (!in || !std::getline(in, line)) return false;
  return line.rfind("%%MatrixMarket", 0) == 0;
}

arma::sp_mat load_matrix_market(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Failed to open " + path);

  std::string line;
  if (!std::getline(in, line)) throw std::runtime_error("Empty MM file: " + path);
  const std::string banner = lower_copy(line);
  if (banner.rfind("%%matrixmarket", 0) != 0 || banner.find("coordinate") == std::string::npos) {
    throw std::runtime_error("Not a Matrix Market coordinate file: " + path);
  }
  if (banner.find("complex") != std::string::npos) {
    throw std::runtime_error("Complex Matrix Market files are not supported: " + path);
  }
  if (banner.find("general") == std::string::npos) {
    throw std::runtime_error("Only 'general' Matrix Market files are supported: " + path);
  }
  const bool pattern = banner.find("pattern") != std::string::npos;

  // size line, skipping comments
  long long nr = -1, nc = -1, nnz = -1;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '%') continue;
    std::istringstream iss(line);
    if (!(iss >> nr >> nc >> nnz) || nr < 0 || nc < 0 || nnz < 0) {
      throw std::runtime_error("Bad size line in " + path);
    }
    break;
  }
  if (nnz < 0) throw std::runtime_error("Missing size line in " + path);

  arma::umat loc(2, static_cast<arma::uword>(nnz));
  arma::vec  val(static_cast<arma::uword>(nnz));
  const arma::uword n_entries = static_cast<arma::uword>(nnz);
  arma::uword k = 0;
  while (k < n_entries && std::getline(in, line)) {
    if (line.empty() || line[0] == '%') continue;
    std::istringstream iss(line);
    long long i, j;
    double v = 1.0;
    if (!(iss >> i >> j) || (!pattern && !(iss >> v))) {
      throw std::runtime_error("Bad entry line " + std::to_string(k + 1) + " in " + path);
    }
    if (i < 1 || i > nr || j < 1 || j > nc) {
      throw std::runtime_error("Entry (" + std::to_string(i) + "," + std::to_string(j) +
                               ") out of range in " + path);
    }
    loc(0, k) = static_cast<arma::uword>(i - 1);
    loc(1, k) = static_cast<arma::uword>(j - 1);
    val(k)    = v;
    ++k;
  }
  if (k != n_entries) throw std::runtime_error("Unexpected EOF while reading entries from " + path);

  return arma::sp_mat(true, loc, val,
                      static_cast<arma::uword>(nr), static_cast<arma::uword>(nc));
}

arma::mat load_dense(const std::string& path, const std::string& what) {
  arma::mat M;
  if (!M.load(path)) {
    throw std::runtime_error("Failed to load " + what + " from " + path);
  }
  return M;
}

void ensure_parent_dir(const std::string& path) {
  fs::path p(path);
  auto dir = p.parent_path();
  if (!dir.empty()) fs::create_directories(dir);
}

void write_csv(const arma::mat& M, const std::string& path) {
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Failed to write " + path);
  out << std::setprecision(10);
  for (arma::uword i = 0; i < M.n_rows; ++i) {
    for (arma::uword j = 0; j < M.n_cols; ++j) {
      if (j) out << ',';
      out << M(i, j);
    }
    out << '\n';
  }
}

void write_column(const arma::vec& v, const std::string& path) {
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Failed to write " + path);
  out << std::setprecision(12);
  for (arma::uword i = 0; i < v.n_elem; ++i) out << v(i) << '\n';
}

void write_indices(const arma::uvec& idx, const std::string& path) {
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Failed to write " + path);
  for (arma::uword i = 0; i < idx.n_elem; ++i) out << idx(i) << '\n';
}

} // namespace scbfa
