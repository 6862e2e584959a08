#ifndef ADDR_GEN_H
#define ADDR_GEN_H

#include <systemc.h>

#include "Config.h"

using namespace std;

typedef sc_uint<DIM_WIDTH> dim_t;
typedef sc_uint<MEM_ADDR_WIDTH> addr_t;

// Address generator
// A/B read addresses are combinational in the controller counters.
// The C write address goes through two registers: the first tracks the read
// issued last cycle, the second captures it when that read was the last K tile
// of an output tile, so c_addr is valid in the same cycle as the flushed tile.
SC_MODULE(AddrGen)
{
    sc_in<bool> clk;
    sc_in<bool> reset;

    // Controller counters and tile counts
    sc_in<dim_t> m_count;
    sc_in<dim_t> n_count;
    sc_in<dim_t> k_count;
    sc_in<dim_t> k_size;
    sc_in<dim_t> n_size;

    // Stage-1 "last K tile" flag (read data of the final K step is on the bus)
    sc_in<bool> last;

    sc_out<addr_t> a_addr;
    sc_out<addr_t> b_addr;
    sc_out<addr_t> c_addr;

    // C address of the read issued in the previous cycle
    sc_signal<addr_t> c_addr_pending;

    static unsigned a_address(unsigned m, unsigned k, unsigned k_t) { return m * k_t + k; }
    static unsigned b_address(unsigned k, unsigned n, unsigned n_t) { return k * n_t + n; }
    static unsigned c_address(unsigned m, unsigned n, unsigned n_t) { return m * n_t + n; }

    SC_CTOR(AddrGen)
    {
        SC_METHOD(read_address_process);
        sensitive << m_count << n_count << k_count << k_size << n_size;

        SC_THREAD(write_address_process);
        sensitive << clk.pos();
        dont_initialize();
    }

    void read_address_process()
    {
        unsigned m = m_count.read(), n = n_count.read(), k = k_count.read();
        a_addr.write(a_address(m, k, k_size.read()));
        b_addr.write(b_address(k, n, n_size.read()));
    }

    void write_address_process()
    {
        while (true)
        {
            if (reset.read()) {
                c_addr_pending.write(0);
                c_addr.write(0);
            } else {
                c_addr_pending.write(c_address(m_count.read(), n_count.read(), n_size.read()));
                if (last.read()) {
                    c_addr.write(c_addr_pending.read());
                }
            }
            wait();
        }
    }
};

#endif // ADDR_GEN_H
