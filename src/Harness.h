#ifndef HARNESS_H
#define HARNESS_H

#include <systemc.h>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "Accelerator.h"
#include "Golden.h"
#include "PackedTile.h"

using namespace std;

struct RunResult
{
    long cycles;        // clock edges from the start edge until done was seen
    bool timed_out;
};

struct CompareResult
{
    bool passed;
    int mismatches;
    int first_mismatch;     // flat index, -1 if none
    int first_row;
    int first_col;
};

// Reject tile counts the accelerator cannot address, or whose run of
// M_t*N_t*K_t + 3 cycles would not finish within `budget`
inline bool check_capacity(int m_t, int k_t, int n_t, long budget = TIMEOUT_CYCLES)
{
    ostringstream err;
    if (m_t < 1 || k_t < 1 || n_t < 1) {
        err << "tile counts must be >= 1 (M_t=" << m_t << " K_t=" << k_t << " N_t=" << n_t << ")";
    } else if (m_t > MAX_TILE_COUNT || k_t > MAX_TILE_COUNT || n_t > MAX_TILE_COUNT) {
        err << "tile count exceeds the " << DIM_WIDTH << "-bit size field (max " << MAX_TILE_COUNT << ")";
    } else if ((long)m_t * k_t > MEM_DEPTH) {
        err << "A needs M_t*K_t=" << (long)m_t * k_t << " words, memory holds " << MEM_DEPTH;
    } else if ((long)k_t * n_t > MEM_DEPTH) {
        err << "B needs K_t*N_t=" << (long)k_t * n_t << " words, memory holds " << MEM_DEPTH;
    } else if ((long)m_t * n_t > MEM_DEPTH) {
        err << "C needs M_t*N_t=" << (long)m_t * n_t << " words, memory holds " << MEM_DEPTH;
    } else if ((long)m_t * n_t * k_t + 3 >= budget) {
        err << "run of " << (long)m_t * n_t * k_t + 3 << " cycles does not fit the "
            << budget << "-cycle timeout";
    } else {
        return true;
    }
    SC_REPORT_ERROR("/gemm/config", err.str().c_str());
    return false;
}

// Element-wise compare of `count` outputs (row-major, `cols` per row).
// Mismatches are always logged; matches only when verbose.
inline CompareResult compare(const vector<int64_t>& reference, const vector<int64_t>& actual,
                             int count, int cols, bool fatal_on_mismatch = false, bool verbose = false)
{
    CompareResult result = {true, 0, -1, -1, -1};

    ostringstream err;
    if (cols < 1) {
        err << "compare needs at least one output per row, got cols=" << cols;
    } else if ((int)reference.size() < count || (int)actual.size() < count) {
        err << "compare of " << count << " outputs, reference has " << reference.size()
            << ", actual has " << actual.size();
    }
    if (!err.str().empty()) {
        SC_REPORT_ERROR("/gemm/config", err.str().c_str());
        result.passed = false;
        return result;
    }

    for (int i = 0; i < count; i++) {
        int row = i / cols, col = i % cols;
        if (reference[i] != actual[i]) {
            if (result.mismatches == 0) {
                result.first_mismatch = i;
                result.first_row = row;
                result.first_col = col;
            }
            result.mismatches++;
            result.passed = false;

            ostringstream msg;
            msg << "C[" << row << "][" << col << "]: expected " << reference[i] << ", got " << actual[i];
            cout << "  Mismatch at " << msg.str() << endl;
            if (fatal_on_mismatch) {
                SC_REPORT_ERROR("/gemm/mismatch", msg.str().c_str());
                return result;
            }
        } else if (verbose) {
            cout << "  C[" << row << "][" << col << "] = " << actual[i] << " OK" << endl;
        }
    }
    return result;
}

// Verification harness: clock, reset and run-protocol signals around one
// GemmAccelerator, plus the driver side (packing, read-back, golden compare).
// The blocking calls (tick, reset_dut, run_and_wait, run_gemm) must be made
// from an SC_THREAD.
class GemmHarness : public sc_module
{
public:
    sc_clock clk;
    sc_signal<bool> reset;
    sc_signal<bool> start;
    sc_signal<bool> busy;
    sc_signal<bool> done;
    sc_signal<dim_t> m_size, k_size, n_size;

    GemmAccelerator* dut;
    sc_trace_file* vcd_file;

    bool verbose;
    RunResult last_run;
    CompareResult last_compare;

    GemmHarness(sc_module_name name, const char* vcd_name = 0)
        : sc_module(name), clk("clk", CLOCK_PERIOD_NS, SC_NS), vcd_file(0), verbose(false),
          m_t(0), k_t(0), n_t(0)
    {
        last_run.cycles = 0;
        last_run.timed_out = false;
        last_compare.passed = false;
        last_compare.mismatches = 0;
        last_compare.first_mismatch = -1;
        last_compare.first_row = -1;
        last_compare.first_col = -1;

        dut = new GemmAccelerator("dut");
        dut->clk(clk);
        dut->reset(reset);
        dut->start(start);
        dut->busy(busy);
        dut->done(done);
        dut->m_size(m_size);
        dut->k_size(k_size);
        dut->n_size(n_size);

        if (vcd_name) {
            vcd_file = sc_create_vcd_trace_file(vcd_name);
            vcd_file->set_time_unit(1, SC_NS);
            sc_trace(vcd_file, clk, "clk");
            sc_trace(vcd_file, reset, "reset");
            dut->trace(vcd_file);
        }
    }

    ~GemmHarness()
    {
        if (vcd_file) sc_close_vcd_trace_file(vcd_file);
        delete dut;
    }

    // Per-tile controller trace, per-element compare log and matrix printouts
    void set_verbose(bool on)
    {
        verbose = on;
        dut->ctrl->verbose = on;
    }

    void tick(int cycles = 1)
    {
        for (int i = 0; i < cycles; i++) wait(clk.posedge_event());
    }

    void reset_dut()
    {
        reset.write(true);
        start.write(false);
        tick(2);
        reset.write(false);
        tick();
    }

    // Set M_t, K_t, N_t. Throws (via the report handler) if out of capacity.
    bool configure(int m_tiles, int k_tiles, int n_tiles)
    {
        if (!check_capacity(m_tiles, k_tiles, n_tiles)) return false;
        m_t = m_tiles;
        k_t = k_tiles;
        n_t = n_tiles;
        m_size.write(m_t);
        k_size.write(k_t);
        n_size.write(n_t);
        return true;
    }

    // Pack dense A (M x K) and B (K x N) into the A/B memories and clear C.
    // Tile counts are taken from the matrix shapes.
    bool load_matrices(const Matrix& A, const Matrix& B)
    {
        ostringstream err;
        if (A.cols != B.rows) {
            err << "inner dimensions differ: A is " << A.rows << "x" << A.cols
                << ", B is " << B.rows << "x" << B.cols;
        } else if (A.rows % NUM_PE_M || A.cols % NUM_IP_K || B.cols % NUM_PE_N) {
            err << "matrix sizes must be tile multiples (M%" << NUM_PE_M << ", K%" << NUM_IP_K
                << ", N%" << NUM_PE_N << "): M=" << A.rows << " K=" << A.cols << " N=" << B.cols;
        }
        if (!err.str().empty()) {
            SC_REPORT_ERROR("/gemm/config", err.str().c_str());
            return false;
        }
        if (!configure(A.rows / NUM_PE_M, A.cols / NUM_IP_K, B.cols / NUM_PE_N)) return false;

        dut->mem_a->clear();
        dut->mem_b->clear();
        dut->mem_c->clear();

        TileShape a_shape = a_tile_shape();
        for (int mt = 0; mt < m_t; mt++) {
            for (int kt = 0; kt < k_t; kt++) {
                vector<int64_t> elems(a_shape.num_elements());
                for (int r = 0; r < NUM_PE_M; r++)
                    for (int c = 0; c < NUM_IP_K; c++)
                        elems[r * NUM_IP_K + c] = A.at(mt * NUM_PE_M + r, kt * NUM_IP_K + c);
                dut->mem_a->load(AddrGen::a_address(mt, kt, k_t), pack_tile<A_WORD_WIDTH>(elems, a_shape));
            }
        }

        TileShape b_shape = b_tile_shape();
        for (int kt = 0; kt < k_t; kt++) {
            for (int nt = 0; nt < n_t; nt++) {
                vector<int64_t> elems(b_shape.num_elements());
                for (int cc = 0; cc < NUM_PE_N; cc++)
                    for (int rr = 0; rr < NUM_IP_K; rr++)
                        elems[cc * NUM_IP_K + rr] = B.at(kt * NUM_IP_K + rr, nt * NUM_PE_N + cc);
                dut->mem_b->load(AddrGen::b_address(kt, nt, n_t), pack_tile<B_WORD_WIDTH>(elems, b_shape));
            }
        }

        cout << "[HARNESS] Loaded A " << A.rows << "x" << A.cols << " (" << m_t * k_t
             << " tiles), B " << B.rows << "x" << B.cols << " (" << k_t * n_t << " tiles)" << endl;
        return true;
    }

    // Unpack the C memory into a dense (M_t*NUM_PE_M) x (N_t*NUM_PE_N) matrix
    Matrix read_result()
    {
        Matrix C(m_t * NUM_PE_M, n_t * NUM_PE_N);
        TileShape c_shape = c_tile_shape();

        for (int mt = 0; mt < m_t; mt++) {
            for (int nt = 0; nt < n_t; nt++) {
                int addr = AddrGen::c_address(mt, nt, n_t);
                if (!dut->mem_c->is_written(addr)) {
                    ostringstream msg;
                    msg << "C tile (" << mt << "," << nt << ") at address " << addr << " was never written";
                    SC_REPORT_WARNING("/gemm/uninitialized", msg.str().c_str());
                    continue;
                }
                vector<int64_t> elems = unpack_tile(dut->mem_c->peek(addr), c_shape);
                for (int r = 0; r < NUM_PE_M; r++)
                    for (int cc = 0; cc < NUM_PE_N; cc++)
                        C.at(mt * NUM_PE_M + r, nt * NUM_PE_N + cc) = elems[r * NUM_PE_N + cc];
            }
        }
        return C;
    }

    // Pulse start and wait for done, at most `budget` cycles
    RunResult run_and_wait(long budget = TIMEOUT_CYCLES, bool fatal = true)
    {
        RunResult result = {0, false};

        start.write(true);
        tick();
        start.write(false);

        while (!done.read()) {
            if (result.cycles >= budget) {
                result.timed_out = true;
                ostringstream msg;
                msg << "done not asserted after " << result.cycles << " cycles (M_t=" << m_t
                    << " K_t=" << k_t << " N_t=" << n_t << ")";
                last_run = result;
                if (fatal)
                    SC_REPORT_ERROR("/gemm/timeout", msg.str().c_str());
                else
                    cout << "[HARNESS] @" << sc_time_stamp() << " TIMEOUT: " << msg.str() << endl;
                return result;
            }
            tick();
            result.cycles++;
        }

        cout << "[HARNESS] @" << sc_time_stamp() << " done after " << result.cycles << " cycles" << endl;
        last_run = result;
        return result;
    }

    // Full run: load, start, wait, read back and compare against golden_gemm.
    // The golden result is wrapped to OUT_DATA_WIDTH like the PE flush.
    bool run_gemm(const Matrix& A, const Matrix& B, bool fatal_on_mismatch = false)
    {
        if (!load_matrices(A, B)) return false;

        RunResult run = run_and_wait();
        if (run.timed_out) return false;

        Matrix expected = golden_gemm(A, B);
        for (size_t i = 0; i < expected.data.size(); i++)
            expected.data[i] = wrap_to_width(expected.data[i], OUT_DATA_WIDTH);

        Matrix actual = read_result();
        if (verbose) {
            print_matrix_truncated("Result C (from memory)", actual);
            print_matrix_truncated("Expected C", expected);
        }

        last_compare = compare(expected.data, actual.data, (int)expected.data.size(), expected.cols,
                               fatal_on_mismatch, verbose);
        return last_compare.passed;
    }

private:
    int m_t, k_t, n_t;
};

#endif // HARNESS_H
