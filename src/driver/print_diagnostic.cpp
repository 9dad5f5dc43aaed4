#include "driver/Driver.h"
#include "sema/Diagnostic.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace pyinfer {
    // ANSI fragments
    static constexpr std::string_view kRed = "\033[31m";
    static constexpr std::string_view kYellow = "\033[33m";
    static constexpr std::string_view kBold = "\033[1m";
    static constexpr std::string_view kReset = "\033[0m";

    static void print_header(const sema::Diagnostic &diag, const bool color) {
        if (diag.file.empty()) { return; }
        if (color) { std::cerr << kBold; }
        std::cerr << diag.file << ":" << diag.line << ":" << diag.col << ": ";
        if (color) { std::cerr << kReset; }
    }

    static void print_label(const Severity severity, const bool color) {
        const std::string_view label = severity == Severity::Error ? "error: " : "warning: ";
        if (color) {
            std::cerr << (severity == Severity::Error ? kRed : kYellow) << label << kReset;
        } else { std::cerr << label; }
    }

    static std::vector<std::string> read_lines(const std::string &path) {
        std::vector<std::string> lines;
        std::ifstream input(path);
        std::string lineStr;
        while (std::getline(input, lineStr)) { lines.push_back(lineStr); }
        return lines;
    }

    std::string Driver::render_snippet(const std::vector<std::string> &lines, const int line, const int col,
                                       const int context) {
        if (line <= 0 || static_cast<std::size_t>(line) > lines.size()) { return {}; }
        std::string out;
        const int first = std::max(1, line - std::max(context, 1) + 1);
        for (int cur = first; cur <= line; ++cur) {
            out += "  " + lines[static_cast<std::size_t>(cur) - 1] + "\n";
        }
        if (col > 0) { out += "  " + std::string(static_cast<std::size_t>(col - 1), ' ') + "^\n"; }
        return out;
    }

    void Driver::print_diagnostic(const sema::Diagnostic &diag, const Severity severity, const bool color,
                                  const int context) {
        print_header(diag, color);
        print_label(severity, color);
        std::cerr << diag.message << "\n";
        if (diag.file.empty()) { return; }
        std::cerr << render_snippet(read_lines(diag.file), diag.line, diag.col, context);
    }
} // namespace pyinfer
