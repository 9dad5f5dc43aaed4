#include "driver/Driver.h"
#include "cli/ParseArgs.h"
#include "cli/Usage.h"
#include "pyinfer/exceptions/pyinfer_exception.h"
#include <exception>
#include <iostream>
/***
 * Name: pyinfer::main
 * Purpose: CLI entry point for pyinfer.
 * Inputs:
 *   - argv
 * Outputs:
 *   - Exit status: 0 ok, 1 syntax/analysis failure, 2 usage/config/I/O or internal error
 * Theory of Operation:
 *   Parse args then invoke Driver::run; every exception stops here.
 */
int main(const int argc, char** argv) {
  try {
    pyinfer::cli::Options opts;
    if (!pyinfer::cli::ParseArgs(argc, argv, opts)) {
      std::cerr << "pyinfer: argument parse error\n";
      std::cerr << pyinfer::cli::Usage();
      return 2;
    }
    if (opts.showHelp) {
      std::cout << pyinfer::cli::Usage();
      return 0;
    }
    return pyinfer::Driver::run(opts);
  } catch (const pyinfer::exceptions::PyinferException& ex) {
    std::cerr << "pyinfer: " << ex.what() << "\n";
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "pyinfer: internal error: " << ex.what() << "\n";
    return 2;
  }
}
