#include "lcg.hpp"
#include "lcg_utils.hpp"
#include <exception>
#include <fstream>
#include <iostream>
#include <string>

// Writes COUNT consecutive states of a known LCG, one per line.
// Output is the input format of lcg_crack.
int main(int argc, char** argv) {
    if (argc < 6 || argc > 7) {
        std::cerr << "Usage: " << argv[0] << " STATE A C M COUNT [OUT_FILE]\n";
        return 1;
    }

    for (int i = 1; i <= 4; ++i) {
        if (!is_big_decimal(argv[i])) {
            std::cerr << "Error: '" << argv[i] << "' is not a decimal integer\n";
            return 1;
        }
    }
    u64 count = 0;
    if (!parse_count(argv[5], count)) {
        std::cerr << "Error: invalid COUNT '" << argv[5] << "'\n";
        return 1;
    }

    try {
        LCG gen(read_big_decimal(argv[1]), read_big_decimal(argv[2]),
                read_big_decimal(argv[3]), read_big_decimal(argv[4]));

        std::ofstream fout;
        if (argc == 7) {
            fout.open(argv[6]);
            if (!fout) {
                std::cerr << "Error: cannot open " << argv[6] << " for writing\n";
                return 1;
            }
        }
        std::ostream& out = (argc == 7) ? static_cast<std::ostream&>(fout) : std::cout;

        auto start = now_tp();
        out << "# " << gen << "\n";
        for (u64 i = 0; i < count; ++i) {
            out << gen.next() << "\n";
        }
        out.flush();

        if (argc == 7) {
            std::cout << "Wrote " << count << " values to " << argv[6]
                      << " in " << ms_since(start) << " ms\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
