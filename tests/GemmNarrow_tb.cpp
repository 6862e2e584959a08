// Built with OUT_DATA_WIDTH=16: C elements are the full-K sums wrapped to 16 bits
#include <systemc.h>
#include "Harness.h"
#include <iostream>

using namespace std;

SC_MODULE(Testbench)
{
    GemmHarness harness;

    int failures;

    SC_CTOR(Testbench) : harness("harness"), failures(0)
    {
        SC_THREAD(test_process);
    }

    void check(bool passed, const string& name)
    {
        if (passed) {
            cout << "✓ " << name << " PASSED" << endl;
        } else {
            cout << "✗ " << name << " FAILED" << endl;
            failures++;
        }
    }

    void test_wrapped_output()
    {
        int64_t max_in = (int64_t(1) << (IN_DATA_WIDTH - 1)) - 1;
        int k = 4 * NUM_IP_K;
        Matrix A(NUM_PE_M, k, max_in);
        Matrix B(k, NUM_PE_N, max_in);

        bool passed = harness.run_gemm(A, B);
        Matrix C = harness.read_result();

        int64_t exact = max_in * max_in * k;
        int64_t wrapped = wrap_to_width(exact, OUT_DATA_WIDTH);
        bool all_wrapped = true;
        for (size_t i = 0; i < C.data.size(); i++) all_wrapped &= C.data[i] == wrapped;

        cout << "  exact sum " << exact << ", " << OUT_DATA_WIDTH << "-bit output " << wrapped << endl;
        check(exact != wrapped, "sum overflows the output width");
        check(passed && all_wrapped, "outputs truncated to OUT_DATA_WIDTH");
    }

    void test_mixed_signs()
    {
        Matrix A(2 * NUM_PE_M, 3 * NUM_IP_K);
        Matrix B(3 * NUM_IP_K, 2 * NUM_PE_N);
        for (size_t i = 0; i < A.data.size(); i++) A.data[i] = (i % 3 == 0) ? 120 : -97;
        for (size_t i = 0; i < B.data.size(); i++) B.data[i] = (i % 5 == 0) ? -128 : 113;
        check(harness.run_gemm(A, B), "mixed-sign run matches wrapped golden");
    }

    void test_process()
    {
        harness.reset_dut();

        test_wrapped_output();
        test_mixed_signs();

        sc_stop();
    }
};

int sc_main(int argc, char* argv[])
{
    cout << "\n--- Narrow Output GEMM Tests (OUT_DATA_WIDTH=" << OUT_DATA_WIDTH << ") ---" << endl;
    Testbench tb("tb");

    try {
        sc_start();
    } catch (const sc_report& report) {
        cout << "Simulation aborted: " << report.what() << endl;
        return 2;
    }

    if (tb.failures == 0) {
        cout << "\nAll narrow output tests passed!" << endl;
        return 0;
    }
    cout << "\n" << tb.failures << " narrow output test(s) failed." << endl;
    return 1;
}
