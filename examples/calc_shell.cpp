#include <calcexpr/expr.hpp>
#include <calcexpr/format.hpp>
#include <calcexpr/keypad.hpp>
#include <calcexpr/log.hpp>

#include <iostream>
#include <string>
#include <string_view>

// Line-oriented front end for the calculator core.
//
//   calc_shell [--keys] [--log-level=<debug|info|warning|error|off>]
//
// Default mode reads one expression per line and prints the formatted result.
// With --keys every line is a sequence of keypad presses (see press_key) and
// the display is printed after the line has been applied.

static int usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--keys] [--log-level=<debug|info|warning|error|off>]\n";
    return 2;
}

int main(int argc, char** argv) {
    bool keys = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        constexpr std::string_view level_flag = "--log-level=";

        if (arg == "--keys") {
            keys = true;
        } else if (arg.substr(0, level_flag.size()) == level_flag) {
            auto level = calcexpr::parse_log_level(arg.substr(level_flag.size()));
            if (!level) return usage(argv[0]);
            calcexpr::set_log_level(*level);
        } else {
            return usage(argv[0]);
        }
    }

    calcexpr::KeypadState state;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (keys) {
            for (char key : line) state = calcexpr::press_key(state, key);
            std::cout << calcexpr::display(state) << "\n";
            continue;
        }

        calcexpr::Result r = calcexpr::try_evaluate(line);
        if (const auto* err = std::get_if<calcexpr::Error>(&r)) {
            CALCEXPR_LOG(Info, "{}: {}", calcexpr::to_string(err->kind), err->message);
        }
        std::cout << calcexpr::format(r) << "\n";
    }
    return 0;
}
