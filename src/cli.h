#pragma once
#include <ostream>
#include <string>
#include <vector>

namespace dls {

// Command line of dls-audit, as given. Empty strings mean "not given".
struct CliArgs {
    std::string check_path;
    std::string repair_path;
    std::string size_check_path;
    std::string generate_path;
    std::string read_path;
    std::string write_path;
    std::string add_from;
    std::string block_filter;
    std::string conf;
    std::string log_file;
    bool have_filter = false;
    bool verbose = false;
    bool help = false;

    int modes() const {
        return !check_path.empty() + !repair_path.empty() + !size_check_path.empty() +
               !generate_path.empty() + !read_path.empty();
    }
};

void print_usage(std::ostream& os);

// Parse the arguments after the program name. Problems are reported on err.
bool parse_cli_args(const std::vector<std::string>& args, CliArgs& a, std::ostream& err);

// Run dls-audit. Report lines go to out, usage problems to err, diagnostics
// to the logger. Returns the process exit code.
int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

}
