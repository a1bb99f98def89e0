#pragma once
#include "Config.h"
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace iperf_discovery {

class ArgumentParser {
public:
    ArgumentParser();

    // false = do not scan: --help/--version were handled, or a usage error was printed.
    // exit_code() tells the two apart.
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }

    void print_help(std::ostream& os) const;
    static void print_version(std::ostream& os);

private:
    enum class ArgKind { None, String, Int, Double };
    struct FlagSpec {
        std::string name;
        std::string short_name;
        ArgKind kind;
        std::string help;
        std::function<bool(const std::string&, Config&)> apply;
    };

    const FlagSpec* find(const std::string& flag) const;

    std::vector<FlagSpec> specs_;
    int exit_code_ = 0;
};

}
