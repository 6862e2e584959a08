#include <systemc.h>
#include "Harness.h"
#include <iostream>
#include <random>
#include <cstdlib>

using namespace std;

// Random tile counts with M_t*K_t, K_t*N_t and M_t*N_t within the memory depth
void random_tile_counts(mt19937& rng, int max_tiles, int& m_t, int& k_t, int& n_t)
{
    uniform_int_distribution<int> dist(1, max_tiles);
    do {
        m_t = dist(rng);
        k_t = dist(rng);
        n_t = dist(rng);
    } while ((long)m_t * k_t > MEM_DEPTH || (long)k_t * n_t > MEM_DEPTH || (long)m_t * n_t > MEM_DEPTH);
}

SC_MODULE(Testbench)
{
    GemmHarness harness;

    int runs;
    unsigned seed;
    int failures;

    SC_HAS_PROCESS(Testbench);

    Testbench(sc_module_name name, int runs, unsigned seed, bool vcd, bool verbose)
        : sc_module(name), harness("harness", vcd ? "waveform" : 0), runs(runs), seed(seed), failures(0)
    {
        harness.set_verbose(verbose);
        SC_THREAD(test_process);
    }

    void test_process()
    {
        mt19937 rng(seed);
        harness.reset_dut();

        for (int run = 0; run < runs; run++) {
            int m_t, k_t, n_t;
            random_tile_counts(rng, 16, m_t, k_t, n_t);

            cout << "\n╔════════════════════════════════════════════════╗" << endl;
            cout << "  RUN " << run << ": M_t=" << m_t << " K_t=" << k_t << " N_t=" << n_t
                 << " (M=" << m_t * NUM_PE_M << " K=" << k_t * NUM_IP_K << " N=" << n_t * NUM_PE_N << ")" << endl;
            cout << "╚════════════════════════════════════════════════╝" << endl;

            Matrix A = random_matrix(rng, m_t * NUM_PE_M, k_t * NUM_IP_K);
            Matrix B = random_matrix(rng, k_t * NUM_IP_K, n_t * NUM_PE_N);

            if (harness.run_gemm(A, B)) {
                cout << "✓ RUN " << run << " PASSED (" << harness.last_run.cycles << " cycles)" << endl;
            } else {
                cout << "✗ RUN " << run << " FAILED (" << harness.last_compare.mismatches << " mismatches)" << endl;
                failures++;
            }
        }

        harness.dut->mem_c->dump("memory_c.txt");

        cout << "\n╔════════════════════════════════════════════════╗" << endl;
        cout << "  " << runs - failures << "/" << runs << " runs passed (seed " << seed << ")" << endl;
        cout << "╚════════════════════════════════════════════════╝\n" << endl;

        sc_stop();
    }
};

// Usage: gemm_sim [runs] [seed] [vcd] [verbose]
int sc_main(int argc, char* argv[])
{
    int runs = argc > 1 ? atoi(argv[1]) : 10;
    unsigned seed = argc > 2 ? (unsigned)strtoul(argv[2], 0, 10) : 1;
    bool vcd = argc > 3 && atoi(argv[3]) != 0;
    bool verbose = argc > 4 && atoi(argv[4]) != 0;

    Testbench tb("tb", runs, seed, vcd, verbose);

    try {
        sc_start();
    } catch (const sc_report& report) {
        cout << "Simulation aborted: " << report.what() << endl;
        return 2;
    }

    return tb.failures == 0 ? 0 : 1;
}
