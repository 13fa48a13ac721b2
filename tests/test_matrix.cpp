#include <basic/error.h>
#include <basic/matrix.h>
#include <basic/tuple.h>
#include <catch2/catch.hpp>
#include <stdexcept>

using namespace umb;
using Catch::Matchers::WithinAbs;

TEST_CASE("Matrix construction and access", "[basic][matrix]") {
	Matrix4 m{ { 1, 2, 3, 4 }, { 5.5, 6.5, 7.5, 8.5 }, { 9, 10, 11, 12 }, { 13.5, 14.5, 15.5, 16.5 } };
	REQUIRE(m(0, 0) == 1);
	REQUIRE(m(0, 3) == 4);
	REQUIRE(m(1, 0) == 5.5);
	REQUIRE(m(1, 2) == 7.5);
	REQUIRE(m(2, 2) == 11);
	REQUIRE(m(3, 0) == 13.5);
	REQUIRE(m(3, 2) == 15.5);

	SECTION("smaller sizes") {
		Matrix2 a{ { -3, 5 }, { 1, -2 } };
		REQUIRE(a(0, 1) == 5);
		REQUIRE(a(1, 1) == -2);

		Matrix3 b{ { -3, 5, 0 }, { 1, -2, -7 }, { 0, 1, 1 } };
		REQUIRE(b(1, 2) == -7);
		REQUIRE(b(2, 2) == 1);
	}

	SECTION("checked access throws outside the matrix") {
		REQUIRE(m.at(3, 3) == 16.5);
		REQUIRE_THROWS_AS(m.at(4, 0), std::out_of_range);
		REQUIRE_THROWS_AS(m.at(0, -1), std::out_of_range);
	}

	SECTION("wrong shape is rejected") {
		REQUIRE_THROWS_AS((Matrix2{ { 1, 2, 3 }, { 4, 5, 6 } }), std::invalid_argument);
		REQUIRE_THROWS_AS((Matrix3{ { 1, 2, 3 }, { 4, 5, 6 } }), std::invalid_argument);
	}
}

TEST_CASE("Matrix equality is approximate", "[basic][matrix]") {
	Matrix4 a{ { 1, 2, 3, 4 }, { 5, 6, 7, 8 }, { 9, 8, 7, 6 }, { 5, 4, 3, 2 } };
	Matrix4 b{ { 1, 2, 3, 4 }, { 5, 6, 7, 8 }, { 9, 8, 7, 6 }, { 5, 4, 3, 2.000001 } };
	Matrix4 c{ { 2, 3, 4, 5 }, { 6, 7, 8, 9 }, { 8, 7, 6, 5 }, { 4, 3, 2, 1 } };
	REQUIRE(a == b);
	REQUIRE(a != c);
}

TEST_CASE("Matrix multiplication", "[basic][matrix]") {
	Matrix4 a{ { 1, 2, 3, 4 }, { 5, 6, 7, 8 }, { 9, 8, 7, 6 }, { 5, 4, 3, 2 } };
	Matrix4 b{ { -2, 1, 2, 3 }, { 3, 2, 1, -1 }, { 4, 3, 6, 5 }, { 1, 2, 7, 8 } };
	Matrix4 expected{ { 20, 22, 50, 48 }, { 44, 54, 114, 108 }, { 40, 58, 110, 102 }, { 16, 26, 46, 42 } };
	REQUIRE(a * b == expected);

	SECTION("by a tuple") {
		Matrix4 m{ { 1, 2, 3, 4 }, { 2, 4, 4, 2 }, { 8, 6, 4, 1 }, { 0, 0, 0, 1 } };
		REQUIRE(m * Tuple(1, 2, 3, 1) == Tuple(18, 24, 33, 1));
	}

	SECTION("by the identity") {
		REQUIRE(a * Matrix4::identity() == a);
		Tuple t(1, 2, 3, 4);
		REQUIRE(Matrix4::identity() * t == t);
	}
}

TEST_CASE("Matrix transpose", "[basic][matrix]") {
	Matrix4 a{ { 0, 9, 3, 0 }, { 9, 8, 0, 8 }, { 1, 8, 5, 3 }, { 0, 0, 5, 8 } };
	Matrix4 expected{ { 0, 9, 1, 0 }, { 9, 8, 8, 0 }, { 3, 0, 5, 5 }, { 0, 8, 3, 8 } };
	REQUIRE(a.transpose() == expected);
	REQUIRE(Matrix4::identity().transpose() == Matrix4::identity());
}

TEST_CASE("Determinants, minors and cofactors", "[basic][matrix]") {
	SECTION("2x2") {
		Matrix2 a{ { 1, 5 }, { -3, 2 } };
		REQUIRE(a.determinant() == 17);
	}

	SECTION("submatrices") {
		Matrix3 a{ { 1, 5, 0 }, { -3, 2, 7 }, { 0, 6, -3 } };
		REQUIRE(a.submatrix(0, 2) == Matrix2({ { -3, 2 }, { 0, 6 } }));

		Matrix4 b{ { -6, 1, 1, 6 }, { -8, 5, 8, 6 }, { -1, 0, 8, 2 }, { -7, 1, -1, 1 } };
		REQUIRE(b.submatrix(2, 1) == Matrix3({ { -6, 1, 6 }, { -8, 8, 6 }, { -7, -1, 1 } }));
		REQUIRE_THROWS_AS(b.submatrix(4, 0), std::out_of_range);
	}

	SECTION("3x3 minor and cofactor") {
		Matrix3 a{ { 3, 5, 0 }, { 2, -1, -7 }, { 6, -1, 5 } };
		REQUIRE(a.minor(1, 0) == 25);
		REQUIRE(a.minor(0, 0) == -12);
		REQUIRE(a.cofactor(0, 0) == -12);
		REQUIRE(a.cofactor(1, 0) == -25);
	}

	SECTION("3x3 determinant") {
		Matrix3 a{ { 1, 2, 6 }, { -5, 8, -4 }, { 2, 6, 4 } };
		REQUIRE(a.cofactor(0, 0) == 56);
		REQUIRE(a.cofactor(0, 1) == 12);
		REQUIRE(a.cofactor(0, 2) == -46);
		REQUIRE(a.determinant() == -196);
	}

	SECTION("4x4 determinant") {
		Matrix4 a{ { -2, -8, 3, 5 }, { -3, 1, 7, 3 }, { 1, 2, -9, 6 }, { -6, 7, 7, -9 } };
		REQUIRE(a.cofactor(0, 0) == 690);
		REQUIRE(a.cofactor(0, 1) == 447);
		REQUIRE(a.cofactor(0, 2) == 210);
		REQUIRE(a.cofactor(0, 3) == 51);
		REQUIRE(a.determinant() == -4071);
	}
}

TEST_CASE("Matrix inversion", "[basic][matrix]") {
	SECTION("invertibility follows the determinant") {
		Matrix4 a{ { 6, 4, 4, 4 }, { 5, 5, 7, 6 }, { 4, -9, 3, -7 }, { 9, 1, 7, -6 } };
		REQUIRE(a.determinant() == -2120);
		REQUIRE(a.is_invertible());

		Matrix4 b{ { -4, 2, -2, -3 }, { 9, 6, 2, 6 }, { 0, -5, 1, -5 }, { 0, 0, 0, 0 } };
		REQUIRE(b.determinant() == 0);
		REQUIRE_FALSE(b.is_invertible());
		REQUIRE_THROWS_AS(b.inverse(), NotInvertibleError);
	}

	SECTION("inverse through the adjugate") {
		Matrix4 a{ { -5, 2, 6, -8 }, { 1, -5, 1, 8 }, { 7, 7, -6, -7 }, { 1, -3, 7, 4 } };
		Matrix4 b = a.inverse();
		REQUIRE(a.determinant() == 532);
		REQUIRE(a.cofactor(2, 3) == -160);
		REQUIRE_THAT(b(3, 2), WithinAbs(-160.0 / 532, 1e-12));
		REQUIRE(a.cofactor(3, 2) == 105);
		REQUIRE_THAT(b(2, 3), WithinAbs(105.0 / 532, 1e-12));

		Matrix4 expected{ { 0.21805, 0.45113, 0.24060, -0.04511 },
			{ -0.80827, -1.45677, -0.44361, 0.52068 },
			{ -0.07895, -0.22368, -0.05263, 0.19737 },
			{ -0.52256, -0.81391, -0.30075, 0.30639 } };
		REQUIRE(b == expected);
	}

	SECTION("2x2 inverse") {
		Matrix2 a{ { 1, 5 }, { -3, 2 } };
		REQUIRE(a.minor(0, 1) == -3);
		REQUIRE(a.cofactor(0, 1) == 3);
		REQUIRE(a.inverse() == Matrix2({ { 2.0 / 17, -5.0 / 17 }, { 3.0 / 17, 1.0 / 17 } }));
		REQUIRE(a * a.inverse() == Matrix2::identity());
		REQUIRE_THROWS_AS(a.minor(2, 0), std::out_of_range);
	}

	SECTION("tiny determinants are still inverted") {
		Matrix4 a{ { 0.02, 0, 0, 0 }, { 0, 0.02, 0, 0 }, { 0, 0, 0.02, 0 }, { 0, 0, 0, 1 } };
		REQUIRE_FALSE(a.is_invertible());
		REQUIRE(a.is_invertible(1e-9));
		REQUIRE(a * a.inverse() == Matrix4::identity());
	}

	SECTION("more inverses") {
		Matrix4 a{ { 8, -5, 9, 2 }, { 7, 5, 6, 1 }, { -6, 0, 9, 6 }, { -3, 0, -9, -4 } };
		Matrix4 a_inv{ { -0.15385, -0.15385, -0.28205, -0.53846 },
			{ -0.07692, 0.12308, 0.02564, 0.03077 },
			{ 0.35897, 0.35897, 0.43590, 0.92308 },
			{ -0.69231, -0.69231, -0.76923, -1.92308 } };
		REQUIRE(a.inverse() == a_inv);

		Matrix4 b{ { 9, 3, 0, 9 }, { -5, -2, -6, -3 }, { -4, 9, 6, 4 }, { -7, 6, 6, 2 } };
		Matrix4 b_inv{ { -0.04074, -0.07778, 0.14444, -0.22222 },
			{ -0.07778, 0.03333, 0.36667, -0.33333 },
			{ -0.02901, -0.14630, -0.10926, 0.12963 },
			{ 0.17778, 0.06667, -0.26667, 0.33333 } };
		REQUIRE(b.inverse() == b_inv);
	}

	SECTION("multiplying a product by an inverse restores the first factor") {
		Matrix4 a{ { 3, -9, 7, 3 }, { 3, -8, 2, -9 }, { -4, 4, 4, 1 }, { -6, 5, -1, 1 } };
		Matrix4 b{ { 8, 2, 2, 2 }, { 3, -1, 7, 0 }, { 7, 0, 5, 4 }, { 6, -2, 0, 5 } };
		REQUIRE(a * b * b.inverse() == a);
		REQUIRE(a * a.inverse() == Matrix4::identity());
		REQUIRE(a.inverse().inverse() == a);
		REQUIRE(a.transpose().inverse() == a.inverse().transpose());
	}
}
