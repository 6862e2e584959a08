#ifndef PE_H
#define PE_H

#include <systemc.h>
#include <iostream>

#include "Config.h"

using namespace std;

typedef sc_int<IN_DATA_WIDTH> lane_t;
typedef sc_int<ACC_WIDTH> acc_t;
typedef sc_int<OUT_DATA_WIDTH> out_t;

// Processing Element (PE) - one output-stationary multiply-accumulate cell.
// Each valid cycle it consumes one K tile (NUM_IP_K lanes of A and B) and adds
// their dot product to its accumulator. On the last K tile of an output tile
// the finished sum is registered on `result` and the accumulator restarts at 0.
SC_MODULE(PE)
{
    // Clock and reset
    sc_in<bool> clk;
    sc_in<bool> reset;

    // Lanes carry a valid K tile / the last K tile of this output
    sc_in<bool> valid;
    sc_in<bool> last;

    // One K tile of A (this PE's row) and B (this PE's column)
    sc_in<lane_t> a_lane[NUM_IP_K];
    sc_in<lane_t> b_lane[NUM_IP_K];

    // Flushed output element, held until the next flush
    sc_out<out_t> result;

    // Running sum for the current output element
    acc_t accumulator;

    SC_HAS_PROCESS(PE);

    PE(sc_module_name name) : sc_module(name), accumulator(0)
    {
        SC_THREAD(process);
        sensitive << clk.pos();
        dont_initialize();
    }

    // Add sum_k a[k] * b[k] to the accumulator
    void accumulate(const lane_t a[NUM_IP_K], const lane_t b[NUM_IP_K])
    {
        int64_t dot = 0;
        for (int k = 0; k < NUM_IP_K; k++) {
            dot += (int64_t)a[k].to_int64() * b[k].to_int64();
        }
        accumulator = accumulator.to_int64() + dot;
    }

    // Return the accumulator truncated to OUT_DATA_WIDTH and clear it
    out_t flush()
    {
        out_t value = accumulator.to_int64();
        accumulator = 0;
        return value;
    }

    void process()
    {
        while (true)
        {
            if (reset.read() == true)
            {
                accumulator = 0;
                result.write(0);
            }
            else if (valid.read() == true)
            {
                lane_t a[NUM_IP_K];
                lane_t b[NUM_IP_K];
                for (int k = 0; k < NUM_IP_K; k++) {
                    a[k] = a_lane[k].read();
                    b[k] = b_lane[k].read();
                }
                accumulate(a, b);

                if (last.read() == true) {
                    result.write(flush());
                }
            }

            wait();
        }
    }
};

#endif // PE_H
