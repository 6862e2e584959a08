#ifndef PE_GRID_H
#define PE_GRID_H

#include "PE.h"
#include "PackedTile.h"
#include <string>
#include <vector>

using namespace std;

// PE Grid (NUM_PE_M x NUM_PE_N PEs)
// Row r of the grid shares the A lanes of A-tile row r, column c shares the
// B lanes of B-tile column c. All PEs accumulate and flush together.
SC_MODULE(PEGrid)
{
    // Clock and reset
    sc_in<bool> clk;
    sc_in<bool> reset;

    // Stage-1 control from the controller (aligned with memory read data)
    sc_in<bool> valid;
    sc_in<bool> last;

    // Packed tiles from the A/B memories, packed output tile to C
    sc_in<sc_bv<A_WORD_WIDTH> > a_word;
    sc_in<sc_bv<B_WORD_WIDTH> > b_word;
    sc_out<sc_bv<C_WORD_WIDTH> > c_word;

    // Unpacked lanes and per-PE results
    sc_signal<lane_t> a_lane[NUM_PE_M][NUM_IP_K];
    sc_signal<lane_t> b_lane[NUM_PE_N][NUM_IP_K];
    sc_signal<out_t> pe_result[NUM_PE_M][NUM_PE_N];

    PE* pe_array[NUM_PE_M][NUM_PE_N];

    SC_CTOR(PEGrid)
    {
        // Instantiate PEs in NUM_PE_M x NUM_PE_N grid
        for (int r = 0; r < NUM_PE_M; r++) {
            for (int c = 0; c < NUM_PE_N; c++) {
                string pe_name = "PE_" + to_string(r) + "_" + to_string(c);
                pe_array[r][c] = new PE(pe_name.c_str());

                pe_array[r][c]->clk(clk);
                pe_array[r][c]->reset(reset);
                pe_array[r][c]->valid(valid);
                pe_array[r][c]->last(last);

                for (int k = 0; k < NUM_IP_K; k++) {
                    pe_array[r][c]->a_lane[k](a_lane[r][k]);
                    pe_array[r][c]->b_lane[k](b_lane[c][k]);
                }
                pe_array[r][c]->result(pe_result[r][c]);
            }
        }

        SC_METHOD(unpack_process);
        sensitive << a_word << b_word;

        SC_METHOD(pack_process);
        for (int r = 0; r < NUM_PE_M; r++)
            for (int c = 0; c < NUM_PE_N; c++)
                sensitive << pe_result[r][c];
    }

    ~PEGrid()
    {
        for (int r = 0; r < NUM_PE_M; r++) {
            for (int c = 0; c < NUM_PE_N; c++) {
                delete pe_array[r][c];
            }
        }
    }

    // Drive the lane signals from the packed A/B words
    void unpack_process()
    {
        vector<int64_t> a = unpack_tile(a_word.read(), a_tile_shape());
        vector<int64_t> b = unpack_tile(b_word.read(), b_tile_shape());

        for (int r = 0; r < NUM_PE_M; r++)
            for (int k = 0; k < NUM_IP_K; k++)
                a_lane[r][k].write(a[r * NUM_IP_K + k]);

        for (int c = 0; c < NUM_PE_N; c++)
            for (int k = 0; k < NUM_IP_K; k++)
                b_lane[c][k].write(b[c * NUM_IP_K + k]);
    }

    // Concatenate the PE results into one C word
    void pack_process()
    {
        vector<int64_t> results(NUM_PE_M * NUM_PE_N);
        for (int r = 0; r < NUM_PE_M; r++)
            for (int c = 0; c < NUM_PE_N; c++)
                results[r * NUM_PE_N + c] = pe_result[r][c].read().to_int64();

        c_word.write(pack_tile<C_WORD_WIDTH>(results, c_tile_shape()));
    }
};

#endif // PE_GRID_H
