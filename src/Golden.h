#ifndef GOLDEN_H
#define GOLDEN_H

#include <vector>
#include <cstdint>
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <random>

#include "Config.h"

using namespace std;

// Dense row-major matrix of signed elements
struct Matrix
{
    int rows;
    int cols;
    vector<int64_t> data;

    Matrix() : rows(0), cols(0) {}
    Matrix(int rows, int cols, int64_t fill = 0) : rows(rows), cols(cols), data(rows * cols, fill) {}

    int64_t& at(int r, int c) { return data[r * cols + c]; }
    int64_t at(int r, int c) const { return data[r * cols + c]; }
};

// Fill a matrix with values over the full signed IN_DATA_WIDTH range
inline Matrix random_matrix(mt19937& rng, int rows, int cols)
{
    uniform_int_distribution<int64_t> dist(-(int64_t(1) << (IN_DATA_WIDTH - 1)),
                                           (int64_t(1) << (IN_DATA_WIDTH - 1)) - 1);
    Matrix matrix(rows, cols);
    for (size_t i = 0; i < matrix.data.size(); i++) matrix.data[i] = dist(rng);
    return matrix;
}

// Reference GEMM: C[m][n] = sum_k A[m][k] * B[k][n], exact in 64 bits.
// Independent of tiling and of the cycle model.
inline Matrix golden_gemm(const Matrix& A, const Matrix& B)
{
    Matrix C(A.rows, B.cols);
    for (int m = 0; m < A.rows; m++) {
        for (int n = 0; n < B.cols; n++) {
            int64_t sum = 0;
            for (int k = 0; k < A.cols; k++) {
                sum += A.at(m, k) * B.at(k, n);
            }
            C.at(m, n) = sum;
        }
    }
    return C;
}

// Print the top-left corner of a matrix
inline void print_matrix_truncated(const char* name, const Matrix& matrix)
{
    cout << name << " (" << matrix.rows << "x" << matrix.cols << "):" << endl;
    int max_rows = min(matrix.rows, 5);
    int max_cols = min(matrix.cols, 10);

    for (int i = 0; i < max_rows; i++) {
        cout << "  ";
        for (int j = 0; j < max_cols; j++) {
            cout << setw(8) << matrix.at(i, j) << " ";
        }
        if (matrix.cols > 10) cout << "...";
        cout << endl;
    }
    if (matrix.rows > 5) cout << "  ..." << endl;
    cout << endl;
}

#endif // GOLDEN_H
