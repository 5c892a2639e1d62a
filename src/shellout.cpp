/*
  Copyright (c) 2012 by Procera Networks, Inc. ("PROCERA")

  Permission to use, copy, modify, and/or distribute this software for
  any purpose with or without fee is hereby granted, provided that the
  above copyright notice and this permission notice appear in all
  copies.

  THE SOFTWARE IS PROVIDED "AS IS" AND PROCERA DISCLAIMS ALL WARRANTIES
  WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
  MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL PROCERA BE LIABLE FOR
  ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
  WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN
  ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT
  OF OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
#include "shellout.hpp"

#include <stdlib.h>
#include <stdio.h>
#include <iostream>
#include <fstream>
#include <string>
#include <boost/program_options/errors.hpp>
#include "shell.hpp"
#include "settings.hpp"
#include "run.hpp"

using namespace std;
using namespace shellout;

int main(int argc, char* argv[]) {
    try {
        settings cfg;
        run_options opts;
        string input;

        const int ret = parse_commandline(argc, argv, cfg, opts, input);
        if (ret != 0)
            return ret < 0 ? 0 : ret;

        ifstream input_file;
        if (!open_input(input, input_file, opts._input))
            return 1;

        cmd c;
        if (!make_cmd(cfg, opts, c))
            return 1;

        return run(default_shell(), c, opts._summary, cout, cerr);
    }
    catch(const boost::program_options::unknown_option& e) {
        fprintf(stderr, "Unknown option: %s. See -h or --help.\n", e.what());
        return 1;
    }
    catch(const boost::program_options::error& e) {
        fprintf(stderr, "Error: %s. See -h or --help.\n", e.what());
        return 1;
    }
    catch(const std::exception& e) {
        fprintf(stderr, "Internal error: %s\n", e.what());
        return 1;
    }
}
