#ifndef CONFIG_H
#define CONFIG_H

// Build-time configuration of the GEMM accelerator.
// Every value can be overridden with a -D compile definition.

// Element widths (signed two's complement)
#ifndef IN_DATA_WIDTH
#define IN_DATA_WIDTH 8
#endif

#ifndef OUT_DATA_WIDTH
#define OUT_DATA_WIDTH 32
#endif

// PE grid shape: NUM_PE_M rows x NUM_PE_N columns, NUM_IP_K lanes per PE
#ifndef NUM_PE_M
#define NUM_PE_M 4
#endif

#ifndef NUM_PE_N
#define NUM_PE_N 4
#endif

#ifndef NUM_IP_K
#define NUM_IP_K 4
#endif

// Memory depth is 2^MEM_ADDR_WIDTH words
#ifndef MEM_ADDR_WIDTH
#define MEM_ADDR_WIDTH 10
#endif

// Width of the M_size / K_size / N_size tile-count fields
#ifndef DIM_WIDTH
#define DIM_WIDTH 11
#endif

#ifndef TIMEOUT_CYCLES
#define TIMEOUT_CYCLES 100000
#endif

#ifndef CLOCK_PERIOD_NS
#define CLOCK_PERIOD_NS 10
#endif

constexpr int clog2(int value, int bits = 0)
{
    return (1 << bits) >= value ? bits : clog2(value, bits + 1);
}

// Accumulator must hold a full K reduction: K <= (2^DIM_WIDTH - 1) * NUM_IP_K
#ifndef ACC_WIDTH
#define ACC_WIDTH (2 * IN_DATA_WIDTH + DIM_WIDTH + clog2(NUM_IP_K))
#endif

// Packed word widths
const int A_WORD_WIDTH = NUM_PE_M * NUM_IP_K * IN_DATA_WIDTH;
const int B_WORD_WIDTH = NUM_PE_N * NUM_IP_K * IN_DATA_WIDTH;
const int C_WORD_WIDTH = NUM_PE_M * NUM_PE_N * OUT_DATA_WIDTH;

const int MEM_DEPTH = 1 << MEM_ADDR_WIDTH;
const int MAX_TILE_COUNT = (1 << DIM_WIDTH) - 1;

static_assert(IN_DATA_WIDTH > 0 && IN_DATA_WIDTH <= 32, "IN_DATA_WIDTH must be in [1, 32]");
static_assert(OUT_DATA_WIDTH > 0 && OUT_DATA_WIDTH <= 64, "OUT_DATA_WIDTH must be in [1, 64]");
static_assert(ACC_WIDTH <= 64, "accumulator wider than 64 bits");
static_assert(ACC_WIDTH >= 2 * IN_DATA_WIDTH + DIM_WIDTH + clog2(NUM_IP_K),
              "accumulator too narrow for a full K reduction");

#endif // CONFIG_H
