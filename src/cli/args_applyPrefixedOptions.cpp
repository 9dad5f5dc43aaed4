#include "cli/ParseArgsInternals.h"

#include <algorithm>
#include <charconv>
#include <string>

namespace pyinfer::cli::detail {
    /***
     * Name: pyinfer::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options like suggestions/color/diag-context.
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out) {
        if (constexpr std::string_view suggestionsPrefix{"--suggestions="}; arg.rfind(suggestionsPrefix, 0) == 0) {
            out.suggestionsPath = std::string(arg.substr(suggestionsPrefix.size()));
            return true;
        }

        if (constexpr std::string_view logPathPrefix{"--log-path="}; arg.rfind(logPathPrefix, 0) == 0) {
            out.logPath = std::string(arg.substr(logPathPrefix.size()));
            return true;
        }

        if (constexpr std::string_view colorPrefix{"--color="}; arg.rfind(colorPrefix, 0) == 0) {
            out.color = parseColorValue(arg.substr(colorPrefix.size()));
            return true;
        }

        if (constexpr std::string_view diagPrefix{"--diag-context="}; arg.rfind(diagPrefix, 0) == 0) {
            const std::string_view value = arg.substr(diagPrefix.size());
            int numLines = 0;
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), numLines);
            if (ec != std::errc{} || ptr != value.data() + value.size()) { numLines = 0; }
            out.diagContext = std::max(numLines, 0);
            return true;
        }
        return false;
    }
} // namespace pyinfer::cli::detail
