#include "driver/Driver.h"
#include "cli/ColorMode.h"
#include "cli/Options.h"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <string_view>
#include <unistd.h>

namespace pyinfer {
    static bool equals_ci(const std::string_view lhs, const std::string_view rhs) {
        if (lhs.size() != rhs.size()) { return false; }
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            const unsigned char lhsCh = static_cast<unsigned char>(lhs[i]);
            const unsigned char rhsCh = static_cast<unsigned char>(rhs[i]);
            if (std::tolower(lhsCh) != std::tolower(rhsCh)) { return false; }
        }
        return true;
    }

    static bool is_true_value(const char *strVal) {
        if (strVal == nullptr) { return false; }
        const std::string_view valView{strVal, std::strlen(strVal)};
        return valView == "1" || equals_ci(valView, "true") || equals_ci(valView, "yes") ||
               equals_ci(valView, "always");
    }

    bool Driver::use_env_color() {
        const char *no_color = std::getenv("NO_COLOR");
        if (no_color != nullptr && *no_color != '\0') { return false; }
        return is_true_value(std::getenv("PYINFER_COLOR"));
    }

    // --color wins; in auto mode NO_COLOR disables, PYINFER_COLOR or a terminal enables.
    bool Driver::use_color(const cli::Options &opts) {
        if (opts.color == cli::ColorMode::Always) { return true; }
        if (opts.color == cli::ColorMode::Never) { return false; }
        const char *no_color = std::getenv("NO_COLOR");
        if (no_color != nullptr && *no_color != '\0') { return false; }
        constexpr int kStderrFd = 2;
        return use_env_color() || isatty(kStderrFd) != 0;
    }
} // namespace pyinfer
