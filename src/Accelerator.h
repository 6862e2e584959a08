#ifndef ACCELERATOR_H
#define ACCELERATOR_H

#include "Memory.h"
#include "Controller.h"
#include "AddrGen.h"
#include "PEGrid.h"

using namespace std;

// Tiled GEMM accelerator:
// 1. A and B live in their own memories as packed tiles (loaded before start)
// 2. The controller walks the (M, N, K) tile loop, one A/B tile read per cycle
// 3. The PE grid accumulates over K and flushes one C tile per K sweep
// 4. Each flushed tile is written to the C memory at m_t * N_t + n_t
SC_MODULE(GemmAccelerator)
{
    // Clock and control
    sc_in<bool> clk;
    sc_in<bool> reset;
    sc_in<bool> start;
    sc_out<bool> busy;
    sc_out<bool> done;

    // Tile counts M_t, K_t, N_t
    sc_in<dim_t> m_size;
    sc_in<dim_t> k_size;
    sc_in<dim_t> n_size;

    // Internal components
    Memory<A_WORD_WIDTH>* mem_a;
    Memory<B_WORD_WIDTH>* mem_b;
    Memory<C_WORD_WIDTH>* mem_c;
    Controller* ctrl;
    AddrGen* addr_gen;
    PEGrid* pe_grid;

    // Controller <-> address generator / PE grid
    sc_signal<dim_t> m_count, n_count, k_count;
    sc_signal<bool> acc_valid;
    sc_signal<bool> acc_last;
    sc_signal<bool> result_valid;

    // Memory interface signals
    sc_signal<addr_t> a_addr, b_addr, c_addr;
    sc_signal<sc_bv<A_WORD_WIDTH> > a_read_data, a_write_data;
    sc_signal<sc_bv<B_WORD_WIDTH> > b_read_data, b_write_data;
    sc_signal<sc_bv<C_WORD_WIDTH> > c_read_data, c_write_data;
    sc_signal<bool> ab_write_enable;     // A/B are read-only to the core

    SC_CTOR(GemmAccelerator)
    {
        mem_a = new Memory<A_WORD_WIDTH>("mem_a");
        mem_a->clk(clk);
        mem_a->reset(reset);
        mem_a->write_enable(ab_write_enable);
        mem_a->address(a_addr);
        mem_a->write_data(a_write_data);
        mem_a->read_data(a_read_data);

        mem_b = new Memory<B_WORD_WIDTH>("mem_b");
        mem_b->clk(clk);
        mem_b->reset(reset);
        mem_b->write_enable(ab_write_enable);
        mem_b->address(b_addr);
        mem_b->write_data(b_write_data);
        mem_b->read_data(b_read_data);

        mem_c = new Memory<C_WORD_WIDTH>("mem_c");
        mem_c->clk(clk);
        mem_c->reset(reset);
        mem_c->write_enable(result_valid);
        mem_c->address(c_addr);
        mem_c->write_data(c_write_data);
        mem_c->read_data(c_read_data);

        ctrl = new Controller("ctrl");
        ctrl->clk(clk);
        ctrl->reset(reset);
        ctrl->start(start);
        ctrl->busy(busy);
        ctrl->done(done);
        ctrl->m_size(m_size);
        ctrl->k_size(k_size);
        ctrl->n_size(n_size);
        ctrl->m_count(m_count);
        ctrl->n_count(n_count);
        ctrl->k_count(k_count);
        ctrl->acc_valid(acc_valid);
        ctrl->acc_last(acc_last);
        ctrl->result_valid(result_valid);

        addr_gen = new AddrGen("addr_gen");
        addr_gen->clk(clk);
        addr_gen->reset(reset);
        addr_gen->m_count(m_count);
        addr_gen->n_count(n_count);
        addr_gen->k_count(k_count);
        addr_gen->k_size(k_size);
        addr_gen->n_size(n_size);
        addr_gen->last(acc_last);
        addr_gen->a_addr(a_addr);
        addr_gen->b_addr(b_addr);
        addr_gen->c_addr(c_addr);

        pe_grid = new PEGrid("pe_grid");
        pe_grid->clk(clk);
        pe_grid->reset(reset);
        pe_grid->valid(acc_valid);
        pe_grid->last(acc_last);
        pe_grid->a_word(a_read_data);
        pe_grid->b_word(b_read_data);
        pe_grid->c_word(c_write_data);

        cout << "GemmAccelerator created: " << NUM_PE_M << "x" << NUM_PE_N << " PEs, "
             << NUM_IP_K << " K lanes, " << IN_DATA_WIDTH << "-bit in, "
             << OUT_DATA_WIDTH << "-bit out, " << MEM_DEPTH << " words per memory" << endl;
    }

    ~GemmAccelerator()
    {
        delete mem_a;
        delete mem_b;
        delete mem_c;
        delete ctrl;
        delete addr_gen;
        delete pe_grid;
    }

    // Trace the run protocol and the memory-facing signals
    void trace(sc_trace_file* tf)
    {
        sc_trace(tf, start, "start");
        sc_trace(tf, busy, "busy");
        sc_trace(tf, done, "done");
        sc_trace(tf, m_size, "M_size");
        sc_trace(tf, k_size, "K_size");
        sc_trace(tf, n_size, "N_size");
        sc_trace(tf, m_count, "M_count");
        sc_trace(tf, n_count, "N_count");
        sc_trace(tf, k_count, "K_count");
        sc_trace(tf, acc_valid, "acc_valid");
        sc_trace(tf, acc_last, "acc_last");
        sc_trace(tf, result_valid, "result_valid");
        sc_trace(tf, a_addr, "a_addr");
        sc_trace(tf, b_addr, "b_addr");
        sc_trace(tf, c_addr, "c_addr");
        sc_trace(tf, a_read_data, "a_read_data");
        sc_trace(tf, b_read_data, "b_read_data");
        sc_trace(tf, c_write_data, "c_write_data");
    }
};

#endif // ACCELERATOR_H
