#include "PE.h"
#include "PackedTile.h"

using namespace std;

SC_MODULE(PE_tb)
{
    // Clock and reset
    sc_clock clk;
    sc_signal<bool> reset;

    // Lane valid / last K tile
    sc_signal<bool> valid;
    sc_signal<bool> last;

    sc_signal<lane_t> a_lane[NUM_IP_K];
    sc_signal<lane_t> b_lane[NUM_IP_K];
    sc_signal<out_t> result;

    // PE instance
    PE* pe;

    int failures;

    SC_CTOR(PE_tb) : clk("clk", 10, SC_NS), failures(0)
    {
        pe = new PE("PE");
        pe->clk(clk);
        pe->reset(reset);
        pe->valid(valid);
        pe->last(last);
        for (int k = 0; k < NUM_IP_K; k++) {
            pe->a_lane[k](a_lane[k]);
            pe->b_lane[k](b_lane[k]);
        }
        pe->result(result);

        SC_THREAD(testbench);
    }

    ~PE_tb()
    {
        delete pe;
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

    void tick(int cycles = 1)
    {
        for (int i = 0; i < cycles; i++) wait(clk.posedge_event());
    }

    // Drive one K tile for the next clock edge
    void drive(const int64_t a[], const int64_t b[], bool is_last)
    {
        for (int k = 0; k < NUM_IP_K; k++) {
            a_lane[k].write(k < 4 ? a[k] : 0);
            b_lane[k].write(k < 4 ? b[k] : 0);
        }
        valid.write(true);
        last.write(is_last);
        tick();
    }

    void idle(int cycles)
    {
        valid.write(false);
        last.write(false);
        tick(cycles);
    }

    void testbench()
    {
        // Reset sequence
        reset.write(true);
        valid.write(false);
        last.write(false);
        tick(2);
        reset.write(false);
        tick();

        cout << "@" << sc_time_stamp() << " Accumulating three K tiles..." << endl;

        int64_t a0[4] = {1, 2, 3, 4},      b0[4] = {5, 6, 7, 8};        //  70
        int64_t a1[4] = {-1, -2, -3, -4},  b1[4] = {1, 1, 1, 1};        // -10
        int64_t a2[4] = {127, -128, 0, 1}, b2[4] = {127, 127, 5, -1};   // -128
        int64_t expected = 0;
        int lanes = NUM_IP_K < 4 ? NUM_IP_K : 4;
        for (int k = 0; k < lanes; k++)
            expected += a0[k] * b0[k] + a1[k] * b1[k] + a2[k] * b2[k];

        drive(a0, b0, false);
        drive(a1, b1, false);
        check(result.read() == 0, "no output before the last K tile");
        drive(a2, b2, true);
        idle(2);
        check(result.read().to_int64() == expected, "flush after K sweep equals dot product");
        check(pe->accumulator == 0, "accumulator cleared by flush");

        cout << "@" << sc_time_stamp() << " Second output tile..." << endl;
        int64_t a3[4] = {2, 0, 0, 0}, b3[4] = {3, 0, 0, 0};
        drive(a3, b3, true);
        idle(2);
        check(result.read() == 6, "next tile starts from zero");

        // Lanes change while valid is low: nothing happens
        for (int k = 0; k < NUM_IP_K; k++) {
            a_lane[k].write(100);
            b_lane[k].write(100);
        }
        idle(3);
        check(result.read() == 6 && pe->accumulator == 0, "idle cycles ignored");

        // Direct contract: accumulate over the largest K sweep, then flush
        lane_t a[NUM_IP_K], b[NUM_IP_K];
        for (int k = 0; k < NUM_IP_K; k++) {
            a[k] = -(1 << (IN_DATA_WIDTH - 1));
            b[k] = -(1 << (IN_DATA_WIDTH - 1));
        }
        int64_t per_step = (int64_t(1) << (2 * IN_DATA_WIDTH - 2)) * NUM_IP_K;
        for (int step = 0; step < MAX_TILE_COUNT; step++) pe->accumulate(a, b);
        int64_t full = per_step * MAX_TILE_COUNT;
        check(pe->flush().to_int64() == wrap_to_width(full, OUT_DATA_WIDTH), "full-K reduction exact");
        check(pe->flush() == 0, "flush twice returns zero");

        // Reset clears the held result
        reset.write(true);
        tick(2);
        reset.write(false);
        tick();
        check(result.read() == 0, "reset clears result");

        sc_stop();
    }
};

int sc_main(int argc, char* argv[])
{
    cout << "\n--- PE Tests ---" << endl;
    PE_tb tb("tb");
    sc_start();

    if (tb.failures == 0) {
        cout << "\nAll PE tests passed!" << endl;
        return 0;
    }
    cout << "\n" << tb.failures << " PE test(s) failed." << endl;
    return 1;
}
