#include <hexcalc/driver.hpp>
#include <hexcalc/format.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

// Sample program shown when no input is given.
static const char* kDemo =
    "abc := 1a5 + 2f;\n"
    "_var := 0ff * (x - 1b);\n"
    "// This is a comment;\n"
    "new := a + b * 2;\n"
    "undef := 5 + ;\n";

static std::string read_all(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void print_outcome(const hexcalc::StatementOutcome& o) {
    std::cout << o.raw_text << " -- " << hexcalc::to_string(o.status);
    if (o.message) std::cout << ": " << *o.message;
    std::cout << "\n";

    if (o.tokens.empty()) return;
    std::cout << "   ";
    for (const auto& t : o.tokens) std::cout << " [" << t.text << " : " << hexcalc::to_string(t.kind) << "]";
    std::cout << "\n";
}

// usage: hexcalc_run [--validate] [file|-]
int main(int argc, char** argv) {
    hexcalc::RunOptions options;
    std::string path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--validate") {
            options.mode = hexcalc::Mode::Validate;
        } else if (path.empty()) {
            path = arg;
        } else {
            std::cerr << "usage: " << argv[0] << " [--validate] [file|-]\n";
            return 2;
        }
    }

    std::string source;
    if (path.empty()) {
        source = kDemo;
    } else if (path == "-") {
        source = read_all(std::cin);
    } else {
        std::ifstream in(path);
        if (!in) {
            std::cerr << "cannot open " << path << "\n";
            return 1;
        }
        source = read_all(in);
    }

    hexcalc::RunResult result = hexcalc::run(source, options);

    for (const auto& o : result.outcomes) print_outcome(o);

    if (!result.variables.empty()) {
        std::cout << "\nvariables:\n";
        for (const auto& [name, value] : result.variables) {
            std::cout << "  " << name << " = " << value << " (hex " << hexcalc::to_hex(value) << ")\n";
        }
    }
    return 0;
}
