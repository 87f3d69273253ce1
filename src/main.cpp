#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h> // for isatty
#include <vector>

#include "Engine/BasicEngine.hpp"
#include "Runtime/StringFunctions.hpp"

using minibasic::BasicEngine;
using minibasic::EngineOptions;
using minibasic::ProgramStore;

namespace {

const char* const VERSION = "MiniBasic Interpreter v0.1";

void printInfo() {
    std::cout << VERSION << "\n";
    std::cout << "-------------------------\n";
    std::cout << "Interprets BASIC-like programs with support for:\n";
    std::cout << "  - Arithmetic operations (+ - * / and parentheses)\n";
    std::cout << "  - Loops built from goto\n";
    std::cout << "  - Conditional jumps (if <condition> goto <label>)\n";
    std::cout << "\n";
    std::cout << "Test programs in programs/:\n";
    std::cout << "  loop.bas      - a simple loop with arithmetic\n";
    std::cout << "  endless.bas   - an endless loop stopped by the step ceiling\n";
    std::cout << "  arith.bas     - a complex arithmetic expression\n";
}

void printUsage(const char* argv0) {
    std::cout << VERSION << "\n";
    std::cout << "Usage: " << argv0 << " [options] [filename.bas]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help        Show this help\n";
    std::cout << "  --version         Show program information\n";
    std::cout << "  --trace           Trace each executed line on stderr\n";
    std::cout << "  --max-steps N     Step ceiling per run (default 100)\n";
    std::cout << "  --exact-labels    Match goto targets exactly instead of by prefix\n";
    std::cout << "\n";
    std::cout << "With a filename the program is loaded, run and its output printed.\n";
    std::cout << "With piped input, stdin is the program.\n";
    std::cout << "Otherwise an interactive session starts.\n";
    std::cout << "\n";
    std::cout << "Interactive commands:\n";
    std::cout << "  RUN       - Run the current program\n";
    std::cout << "  LIST      - List the current program\n";
    std::cout << "  NEW       - Clear the current program\n";
    std::cout << "  CLEAR     - Clear all variables\n";
    std::cout << "  LOAD \"filename\" - Load a program from file\n";
    std::cout << "  SAVE \"filename\" - Save the current program to file\n";
    std::cout << "  INFO      - Show program information\n";
    std::cout << "  SYSTEM    - Exit the interpreter\n";
    std::cout << "Any other line is added to the program.\n";
}

bool readFile(const std::string& filename, std::string& contents) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;
    std::ostringstream oss;
    oss << file.rdbuf();
    contents = oss.str();
    return true;
}

// Argument of LOAD/SAVE: quoted or bare filename
std::string commandArgument(const std::string& line, size_t keywordLength) {
    std::string arg = minibasic::trim(line.substr(keywordLength));
    if (arg.size() >= 2 && arg.front() == '"' && arg.back() == '"') {
        arg = arg.substr(1, arg.size() - 2);
    } else if (!arg.empty() && arg.front() == '"') {
        arg = arg.substr(1);
    }
    return arg;
}

void runSource(BasicEngine& engine, const std::string& source) {
    engine.load(source);
    engine.run();
    std::cout << engine.getOutput();
}

// Interactive session: a source buffer plus immediate-mode commands
int runInteractive(BasicEngine& engine) {
    std::vector<std::string> buffer;

    std::cout << VERSION << "\n";
    std::cout << "Type INFO for help, SYSTEM to exit.\n";
    std::cout << "Ok\n";

    std::string inputLine;
    while (std::getline(std::cin, inputLine)) {
        std::string line = minibasic::trim(inputLine);
        if (line.empty()) continue;

        std::string upper = line;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        if (upper == "SYSTEM" || upper == "EXIT") {
            break;
        } else if (upper == "RUN") {
            std::string source;
            for (const auto& l : buffer) source += l + "\n";
            runSource(engine, source);
            std::cout << "Ok\n";
        } else if (upper == "LIST") {
            for (const auto& l : buffer) std::cout << l << "\n";
            std::cout << "Ok\n";
        } else if (upper == "NEW") {
            buffer.clear();
            std::cout << "Ok\n";
        } else if (upper == "CLEAR") {
            engine.clearVariables();
            std::cout << "Ok\n";
        } else if (upper == "INFO") {
            printInfo();
        } else if (minibasic::startsWith(upper, "LOAD")) {
            std::string filename = commandArgument(line, 4);
            std::string contents;
            if (filename.empty()) {
                std::cerr << "?Missing filename" << std::endl;
            } else if (!readFile(filename, contents)) {
                std::cerr << "Error loading file: cannot open '" << filename << "'" << std::endl;
            } else {
                ProgramStore parsed;
                parsed.load(contents);
                buffer = parsed.getLines();
                std::cout << "Loaded " << buffer.size() << " lines from " << filename << "\n";
            }
        } else if (minibasic::startsWith(upper, "SAVE")) {
            std::string filename = commandArgument(line, 4);
            if (filename.empty()) {
                std::cerr << "?Missing filename" << std::endl;
                continue;
            }
            std::ofstream out(filename);
            if (!out) {
                std::cerr << "Error saving file: cannot create '" << filename << "'" << std::endl;
                continue;
            }
            for (const auto& l : buffer) out << l << "\n";
            std::cout << "Saved " << buffer.size() << " lines to " << filename << "\n";
        } else {
            buffer.push_back(line);
        }
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    EngineOptions options;
    std::string filename;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            printInfo();
            return 0;
        } else if (arg == "--trace") {
            options.trace = true;
        } else if (arg == "--exact-labels") {
            options.labelMatcher = &ProgramStore::exactLabelMatch;
        } else if (arg == "--max-steps") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --max-steps requires a value" << std::endl;
                return 1;
            }
            char* end = nullptr;
            long steps = std::strtol(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0' || steps <= 0) {
                std::cerr << "Error: invalid --max-steps value '" << argv[i] << "'" << std::endl;
                return 1;
            }
            options.maxSteps = static_cast<size_t>(steps);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option '" << arg << "'" << std::endl;
            return 1;
        } else {
            filename = arg;
        }
    }

    BasicEngine engine(options);
    engine.setLogCallback([](const std::string& component, const std::string& message) {
        std::cerr << "[" << component << "] " << message << std::endl;
    });

    if (!filename.empty()) {
        std::string source;
        if (!readFile(filename, source)) {
            std::cerr << "Error: Cannot open file '" << filename << "'" << std::endl;
            return 1;
        }
        runSource(engine, source);
        return 0;
    }

    // Check if stdin is a terminal (interactive) or piped
    bool isInputPiped = !isatty(STDIN_FILENO);
    if (isInputPiped) {
        std::ostringstream oss;
        oss << std::cin.rdbuf();
        runSource(engine, oss.str());
        return 0;
    }

    return runInteractive(engine);
}
