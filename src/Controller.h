#ifndef CONTROLLER_H
#define CONTROLLER_H

#include <systemc.h>
#include <iostream>

#include "AddrGen.h"

using namespace std;

enum CtrlState { CTRL_IDLE = 0, CTRL_RUN = 1 };

inline ostream& operator<<(ostream& os, CtrlState state)
{
    return os << (state == CTRL_RUN ? "RUN" : "IDLE");
}

// GEMM controller FSM
//
// IDLE -> RUN on start. In RUN one (A, B) tile read is issued per cycle while
// the counters walk the tile loop, K fastest, then N, then M. Two pipeline
// stages follow each read:
//   stage 1 (acc_valid/acc_last): memory read data is on the bus, PEs accumulate
//   stage 2 (result_valid):       flushed C tile and its address are valid
// RUN -> IDLE (done pulse, busy low) one cycle after the final tile is written.
SC_MODULE(Controller)
{
    // Clock and control
    sc_in<bool> clk;
    sc_in<bool> reset;
    sc_in<bool> start;
    sc_out<bool> busy;
    sc_out<bool> done;

    // Tile counts, held stable for the whole run
    sc_in<dim_t> m_size;
    sc_in<dim_t> k_size;
    sc_in<dim_t> n_size;

    // Tile loop counters (to the address generator)
    sc_out<dim_t> m_count;
    sc_out<dim_t> n_count;
    sc_out<dim_t> k_count;

    // Stage 1: PE grid enables
    sc_out<bool> acc_valid;
    sc_out<bool> acc_last;

    // Stage 2: one C tile ready
    sc_out<bool> result_valid;

    // Internal registers
    sc_signal<CtrlState> state;
    sc_signal<bool> issuing;        // counters still walking the tile loop
    sc_signal<bool> acc_final;      // stage 1 holds the last read of the run
    sc_signal<bool> result_final;   // stage 2 holds the last tile of the run

    bool verbose;
    unsigned tiles_written;

    SC_CTOR(Controller) : verbose(false), tiles_written(0)
    {
        SC_THREAD(control_process);
        sensitive << clk.pos();
        dont_initialize();
    }

    void control_process()
    {
        while (true)
        {
            if (reset.read() == true)
            {
                state.write(CTRL_IDLE);
                issuing.write(false);
                m_count.write(0);
                n_count.write(0);
                k_count.write(0);
                acc_valid.write(false);
                acc_last.write(false);
                acc_final.write(false);
                result_valid.write(false);
                result_final.write(false);
                busy.write(false);
                done.write(false);
            }
            else
            {
                CtrlState current = state.read();
                bool issue = current == CTRL_RUN && issuing.read();

                unsigned m = m_count.read(), n = n_count.read(), k = k_count.read();
                unsigned m_t = m_size.read(), k_t = k_size.read(), n_t = n_size.read();
                bool k_end = k + 1 >= k_t;
                bool n_end = n + 1 >= n_t;
                bool m_end = m + 1 >= m_t;
                bool sweep_end = issue && k_end;

                // Pipeline registers
                acc_valid.write(issue);
                acc_last.write(sweep_end);
                acc_final.write(sweep_end && n_end && m_end);
                result_valid.write(acc_valid.read() && acc_last.read());
                result_final.write(acc_final.read());
                done.write(false);

                if (current == CTRL_IDLE)
                {
                    if (start.read() == true)
                    {
                        cout << "[CTRL] @" << sc_time_stamp() << " start: M_t=" << m_t
                             << " K_t=" << k_t << " N_t=" << n_t << endl;
                        state.write(CTRL_RUN);
                        issuing.write(true);
                        busy.write(true);
                        m_count.write(0);
                        n_count.write(0);
                        k_count.write(0);
                        tiles_written = 0;
                    }
                }
                else
                {
                    if (issue)
                    {
                        if (!k_end) {
                            k_count.write(k + 1);
                        } else {
                            k_count.write(0);
                            if (!n_end) {
                                n_count.write(n + 1);
                            } else {
                                n_count.write(0);
                                if (!m_end) {
                                    m_count.write(m + 1);
                                } else {
                                    // Hold the terminal counters until IDLE
                                    k_count.write(k);
                                    n_count.write(n);
                                    issuing.write(false);
                                }
                            }
                        }
                    }

                    if (result_valid.read() == true)
                    {
                        tiles_written++;
                        if (verbose) {
                            cout << "[CTRL] @" << sc_time_stamp() << " C tile " << tiles_written
                                 << " written" << endl;
                        }

                        if (result_final.read() == true)
                        {
                            cout << "[CTRL] @" << sc_time_stamp() << " done: "
                                 << tiles_written << " C tiles" << endl;
                            state.write(CTRL_IDLE);
                            busy.write(false);
                            done.write(true);
                        }
                    }
                }
            }

            wait();
        }
    }
};

#endif // CONTROLLER_H
