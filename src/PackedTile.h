#ifndef PACKED_TILE_H
#define PACKED_TILE_H

#include <systemc.h>
#include <vector>
#include <string>
#include <cstdint>

#include "Config.h"

using namespace std;

// Shape of one packed tile word.
// Element (outer, inner) lives at bit offset (outer * inner_count + inner) * elem_width.
//   A tile: outer = PE row,    inner = K lane
//   B tile: outer = PE column, inner = K lane
//   C tile: outer = PE row,    inner = PE column
struct TileShape
{
    int outer_count;
    int inner_count;
    int elem_width;

    int num_elements() const { return outer_count * inner_count; }
    int bit_offset(int outer, int inner) const { return (outer * inner_count + inner) * elem_width; }
};

inline TileShape a_tile_shape() { return TileShape{NUM_PE_M, NUM_IP_K, IN_DATA_WIDTH}; }
inline TileShape b_tile_shape() { return TileShape{NUM_PE_N, NUM_IP_K, IN_DATA_WIDTH}; }
inline TileShape c_tile_shape() { return TileShape{NUM_PE_M, NUM_PE_N, OUT_DATA_WIDTH}; }

// Keep the low `width` bits of value and sign-extend from bit width-1
inline int64_t wrap_to_width(int64_t value, int width)
{
    if (width >= 64) return value;
    uint64_t bits = static_cast<uint64_t>(value) & ((uint64_t(1) << width) - 1);
    if ((bits >> (width - 1)) & 1) bits |= ~uint64_t(0) << width;
    return static_cast<int64_t>(bits);
}

// Write one element into a word; bits above elem_width are dropped
template <int W>
void set_element(sc_bv<W>& word, const TileShape& shape, int outer, int inner, int64_t value)
{
    int lo = shape.bit_offset(outer, inner);
    uint64_t bits = static_cast<uint64_t>(value);
    for (int b = 0; b < shape.elem_width; b++) {
        word[lo + b] = ((bits >> b) & 1) != 0;
    }
}

// Read one element from a word, sign-extended
template <int W>
int64_t get_element(const sc_bv<W>& word, const TileShape& shape, int outer, int inner)
{
    int lo = shape.bit_offset(outer, inner);
    uint64_t bits = 0;
    for (int b = 0; b < shape.elem_width; b++) {
        if (word[lo + b].to_bool()) bits |= uint64_t(1) << b;
    }
    return wrap_to_width(static_cast<int64_t>(bits), shape.elem_width);
}

// Pack elements (ordered outer-major) into one word
template <int W>
sc_bv<W> pack_tile(const vector<int64_t>& elements, const TileShape& shape)
{
    if (shape.num_elements() * shape.elem_width > W) {
        SC_REPORT_ERROR("/gemm/config", ("tile shape needs " +
            to_string(shape.num_elements() * shape.elem_width) + " bits, word has " +
            to_string(W)).c_str());
    }
    if ((int)elements.size() != shape.num_elements()) {
        SC_REPORT_ERROR("/gemm/config", ("pack_tile expects " + to_string(shape.num_elements()) +
            " elements, got " + to_string(elements.size())).c_str());
    }

    sc_bv<W> word;
    for (int o = 0; o < shape.outer_count; o++) {
        for (int i = 0; i < shape.inner_count; i++) {
            set_element(word, shape, o, i, elements[o * shape.inner_count + i]);
        }
    }
    return word;
}

template <int W>
vector<int64_t> unpack_tile(const sc_bv<W>& word, const TileShape& shape)
{
    if (shape.num_elements() * shape.elem_width > W) {
        SC_REPORT_ERROR("/gemm/config", ("tile shape needs " +
            to_string(shape.num_elements() * shape.elem_width) + " bits, word has " +
            to_string(W)).c_str());
    }

    vector<int64_t> elements(shape.num_elements());
    for (int o = 0; o < shape.outer_count; o++) {
        for (int i = 0; i < shape.inner_count; i++) {
            elements[o * shape.inner_count + i] = get_element(word, shape, o, i);
        }
    }
    return elements;
}

#endif // PACKED_TILE_H
