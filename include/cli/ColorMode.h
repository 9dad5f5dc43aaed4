#pragma once

namespace pyinfer::cli {

    enum class ColorMode {
        Auto,
        Always,
        Never
    };

} // namespace pyinfer::cli
