#ifndef MEMORY_H
#define MEMORY_H

#include <systemc.h>
#include <fstream>
#include <string>
#include <vector>
#include <iomanip>

#include "Config.h"

using namespace std;

// Single-port synchronous memory of W-bit words
// - Read-first: read_data shows the word at `address` one cycle later
// - A write commits at the clock edge when write_enable is high
// - Backdoor load/peek for the test driver (before start / after done only)
template <int W>
class Memory : public sc_module
{
public:
    sc_in<bool> clk;
    sc_in<bool> reset;

    sc_in<bool> write_enable;
    sc_in<sc_uint<MEM_ADDR_WIDTH> > address;
    sc_in<sc_bv<W> > write_data;
    sc_out<sc_bv<W> > read_data;

    SC_HAS_PROCESS(Memory);

    Memory(sc_module_name name, int depth = MEM_DEPTH)
        : sc_module(name), depth(depth), storage(depth), written(depth, false)
    {
        SC_THREAD(memory_process);
        sensitive << clk.pos();
        dont_initialize();
    }

    int size() const { return depth; }

    void load(int addr, const sc_bv<W>& word)
    {
        if (!check_address(addr, "load")) return;
        storage[addr] = word;
        written[addr] = true;
    }

    sc_bv<W> peek(int addr) const
    {
        if (!check_address(addr, "peek")) return sc_bv<W>();
        return storage[addr];
    }

    bool is_written(int addr) const
    {
        return addr >= 0 && addr < depth && written[addr];
    }

    void clear()
    {
        for (int i = 0; i < depth; i++) {
            storage[i] = sc_bv<W>();
            written[i] = false;
        }
    }

    // Write the contents to a text file, one "ADDRESS: VALUE" line per word.
    // Words never written show as XXXX.
    bool dump(const string& filename) const
    {
        ofstream file(filename.c_str(), ios::trunc);
        if (!file.is_open()) {
            SC_REPORT_WARNING("/gemm/memory", ("cannot create memory file " + filename).c_str());
            return false;
        }

        file << "# Word-Addressed Memory File: " << name() << endl;
        file << "# Format: ADDRESS: VALUE (" << W << "-bit hex)" << endl;
        file << "# XXXX indicates unwritten memory" << endl;
        file << "#" << endl;

        for (int i = 0; i < depth; i++) {
            file << setw(8) << setfill('0') << i << ": ";
            if (written[i])
                file << storage[i].to_string(SC_HEX_US, false) << endl;
            else
                file << "XXXX" << endl;
        }

        cout << "[MEM] " << name() << " dumped to " << filename << endl;
        return true;
    }

private:
    int depth;
    vector<sc_bv<W> > storage;
    vector<bool> written;

    bool check_address(int addr, const char* op) const
    {
        if (addr < 0 || addr >= depth) {
            SC_REPORT_ERROR("/gemm/memory", (string(name()) + ": " + op + " address " +
                to_string(addr) + " outside [0, " + to_string(depth) + ")").c_str());
            return false;
        }
        return true;
    }

    void memory_process()
    {
        while (true)
        {
            if (reset.read()) {
                read_data.write(sc_bv<W>());
            } else {
                int addr = address.read();
                if (addr < depth) {
                    read_data.write(storage[addr]);
                    if (write_enable.read()) {
                        storage[addr] = write_data.read();
                        written[addr] = true;
                    }
                } else {
                    SC_REPORT_WARNING("/gemm/memory", (string(name()) + ": address " +
                        to_string(addr) + " beyond depth").c_str());
                    read_data.write(sc_bv<W>());
                }
            }
            wait();
        }
    }
};

#endif // MEMORY_H
