#ifndef SPARSEMATRIX_H
#define SPARSEMATRIX_H

#include <cstddef>
#include <map>
#include <stdexcept>
#include <vector>

/** Collection of useful data classes. */
namespace model {

/**
 * A sparse matrix in compressed-row layout.
 *
 * Rows are appended one at a time; within a row entries are stored in
 * ascending column order. Zero entries are not stored.
 */
template <typename T>
struct SparseMatrix {
  /** Number of columns. */
  size_t n_cols;
  /** Offsets into col_idx/values; row i occupies [row_ptr[i], row_ptr[i+1]). */
  std::vector<size_t> row_ptr;
  /** Column index of each stored entry. */
  std::vector<size_t> col_idx;
  /** Value of each stored entry. */
  std::vector<T> values;

  /** Create empty matrix with a fixed number of columns. */
  SparseMatrix (size_t n_cols = 0) : n_cols(n_cols), row_ptr(1, 0) {}

  /** Number of rows. */
  size_t numRows () const { return row_ptr.size() - 1; }
  /** Number of stored (non-zero) entries. */
  size_t numNonZero () const { return values.size(); }
  /** Number of stored entries in a row. */
  size_t rowSize (size_t i) const { return row_ptr[i+1] - row_ptr[i]; }

  /** Append a row given as (column -> value) map. */
  void appendRow (const std::map<size_t, T>& row) {
    for (auto const & kv : row) {
      if (kv.first >= n_cols)
        throw std::out_of_range("SparseMatrix::appendRow: column index out of range");
      if (kv.second != T(0)) {
        col_idx.push_back(kv.first);
        values.push_back(kv.second);
      }
    }
    row_ptr.push_back(values.size());
  }

  /** Access element by index (zero if not stored). */
  T at (size_t i, size_t j) const {
    if (i >= numRows() || j >= n_cols)
      throw std::out_of_range("SparseMatrix::at: index out of range");
    for (size_t k=row_ptr[i]; k<row_ptr[i+1]; ++k)
      if (col_idx[k] == j)
        return values[k];
    return T(0);
  }

  /** Dot product of row i with a dense vector. */
  template <typename V>
  double dot (size_t i, const std::vector<V>& dense) const {
    double res = 0.0;
    for (size_t k=row_ptr[i]; k<row_ptr[i+1]; ++k)
      res += values[k] * dense[col_idx[k]];
    return res;
  }

  /** Sum of all values in row i. */
  T rowSum (size_t i) const {
    T res = T(0);
    for (size_t k=row_ptr[i]; k<row_ptr[i+1]; ++k)
      res += values[k];
    return res;
  }
};

} // namespace model

#endif // SPARSEMATRIX_H
