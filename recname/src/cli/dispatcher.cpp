//! # CLI Command Dispatcher
//!
//! ```text
//! recname_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ resolve        → run_resolve()
//!   └─ describe       → run_describe()
//! ```
//!
//! Logging options are accepted anywhere on the command line and are
//! consumed before dispatch.

#include "cmd_resolve.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace recname::cli {

int recname_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!log::is_log_option(arg)) {
            args.push_back(std::move(arg));
        }
    }

    if (args.empty()) {
        print_usage(std::cout);
        return 0;
    }

    const std::string command = args.front();
    std::vector<std::string> rest(args.begin() + 1, args.end());
    RECNAME_LOG_DEBUG("cli", "command '" << command << "' with " << rest.size() << " argument(s)");

    if (command == "--help" || command == "-h") {
        print_usage(std::cout);
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version(std::cout);
        return 0;
    }

    int status = 2;
    if (command == "resolve") {
        status = run_resolve(rest, std::cout, std::cerr);
    } else if (command == "describe") {
        status = run_describe(rest, std::cout, std::cerr);
    } else {
        std::cerr << "error: unknown command '" << command << "'\n\n";
        print_usage(std::cerr);
    }

    log::Logger::instance().flush();
    return status;
}

} // namespace recname::cli
