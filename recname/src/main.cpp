//! # recname Entry Point
//!
//! ```bash
//! recname resolve 'com.example.Pair<Int, String>'          # com.example.Pair__Int_String
//! recname resolve 'com.example.Pair<Int, String>' --erased # com.example.Pair
//! recname describe 'app.<local run>.Event'
//! ```
//!
//! All work happens in the CLI driver (`cli/driver.hpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return recname::cli::recname_main(argc, argv);
}
