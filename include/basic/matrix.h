#ifndef UMB_INCLUDE_BASIC_MATRIX_H
#define UMB_INCLUDE_BASIC_MATRIX_H

#include <basic/error.h>
#include <basic/math.h>
#include <basic/tuple.h>
#include <initializer_list>
#include <ostream>
#include <stdexcept>

namespace umb {

// Dense square matrix of size N x N, stored row-major. Only 2x2, 3x3 and
// 4x4 are used: the smaller sizes exist for the submatrices of cofactor
// expansion.
template <int N>
class Matrix {
	static_assert(N >= 2, "matrix must be at least 2x2");

private:
	double m_[N][N];

public:
	static constexpr int Size = N;

	// Constructors
	Matrix() {
		for (int r = 0; r < N; ++r) {
			for (int c = 0; c < N; ++c) {
				m_[r][c] = 0.0;
			}
		}
	}

	// Construct from nested rows, throws std::invalid_argument if the shape is not N x N.
	Matrix(std::initializer_list<std::initializer_list<double>> rows) {
		if (static_cast<int>(rows.size()) != N) {
			throw std::invalid_argument("Matrix row count does not match its size");
		}
		int r = 0;
		for (const auto &row : rows) {
			if (static_cast<int>(row.size()) != N) {
				throw std::invalid_argument("Matrix column count does not match its size");
			}
			int c = 0;
			for (double value : row) {
				m_[r][c++] = value;
			}
			++r;
		}
	}

	static Matrix identity() {
		Matrix result;
		for (int i = 0; i < N; ++i) {
			result.m_[i][i] = 1.0;
		}
		return result;
	}

	// Unchecked element access
	double operator()(int row, int col) const {
		return m_[row][col];
	}

	double &operator()(int row, int col) {
		return m_[row][col];
	}

	// Bounds checked element access, throws std::out_of_range.
	double at(int row, int col) const {
		if (row < 0 || row >= N || col < 0 || col >= N) {
			throw std::out_of_range("Matrix index out of range");
		}
		return m_[row][col];
	}

	Matrix transpose() const {
		Matrix result;
		for (int r = 0; r < N; ++r) {
			for (int c = 0; c < N; ++c) {
				result.m_[c][r] = m_[r][c];
			}
		}
		return result;
	}

	// Copy of this matrix with the given row and column removed. Only
	// defined for N >= 3, there is no 1x1 matrix.
	Matrix<N - 1> submatrix(int row, int col) const {
		static_assert(N > 2, "a 2x2 matrix has no submatrix");
		if (row < 0 || row >= N || col < 0 || col >= N) {
			throw std::out_of_range("Submatrix index out of range");
		}
		Matrix<N - 1> result;
		int dst_r = 0;
		for (int r = 0; r < N; ++r) {
			if (r == row) {
				continue;
			}
			int dst_c = 0;
			for (int c = 0; c < N; ++c) {
				if (c == col) {
					continue;
				}
				result(dst_r, dst_c++) = m_[r][c];
			}
			++dst_r;
		}
		return result;
	}

	// Determinant of the submatrix at (row, col).
	double minor(int row, int col) const {
		if constexpr (N == 2) {
			// The remaining 1x1 submatrix is the opposite element.
			return at(1 - row, 1 - col);
		} else {
			return submatrix(row, col).determinant();
		}
	}

	// Minor with the sign flipped when row + col is odd.
	double cofactor(int row, int col) const {
		double m = minor(row, col);
		return (row + col) % 2 == 0 ? m : -m;
	}

	double determinant() const {
		if constexpr (N == 2) {
			return m_[0][0] * m_[1][1] - m_[1][0] * m_[0][1];
		} else {
			// Cofactor expansion along row 0
			double det = 0.0;
			for (int c = 0; c < N; ++c) {
				det += m_[0][c] * cofactor(0, c);
			}
			return det;
		}
	}

	bool is_invertible(double epsilon = EPSILON) const {
		return !equal(determinant(), 0.0, epsilon);
	}

	// Inverse through the adjugate, throws NotInvertibleError when the
	// determinant is exactly zero. Use is_invertible() for a tolerant check.
	Matrix inverse() const {
		double det = determinant();
		if (det == 0.0) {
			throw NotInvertibleError("Cannot invert a singular matrix");
		}
		Matrix result;
		for (int r = 0; r < N; ++r) {
			for (int c = 0; c < N; ++c) {
				// Writing to [c][r] transposes the cofactor matrix.
				result.m_[c][r] = cofactor(r, c) / det;
			}
		}
		return result;
	}

	bool approx_equal(const Matrix &other, double epsilon = EPSILON) const {
		for (int r = 0; r < N; ++r) {
			for (int c = 0; c < N; ++c) {
				if (!equal(m_[r][c], other.m_[r][c], epsilon)) {
					return false;
				}
			}
		}
		return true;
	}
};

template <int N>
Matrix<N> operator*(const Matrix<N> &a, const Matrix<N> &b) {
	Matrix<N> result;
	for (int r = 0; r < N; ++r) {
		for (int c = 0; c < N; ++c) {
			double value = 0.0;
			for (int i = 0; i < N; ++i) {
				value += a(r, i) * b(i, c);
			}
			result(r, c) = value;
		}
	}
	return result;
}

template <int N>
bool operator==(const Matrix<N> &a, const Matrix<N> &b) {
	return a.approx_equal(b);
}

template <int N>
bool operator!=(const Matrix<N> &a, const Matrix<N> &b) {
	return !(a == b);
}

template <int N>
std::ostream &operator<<(std::ostream &os, const Matrix<N> &m) {
	os << "[";
	for (int r = 0; r < N; ++r) {
		os << (r == 0 ? "[" : ", [");
		for (int c = 0; c < N; ++c) {
			os << (c == 0 ? "" : ", ") << m(r, c);
		}
		os << "]";
	}
	return os << "]";
}

using Matrix2 = Matrix<2>;
using Matrix3 = Matrix<3>;
using Matrix4 = Matrix<4>;

// Transform a tuple, treating it as a column vector.
Tuple operator*(const Matrix4 &m, const Tuple &t);

}

#endif
