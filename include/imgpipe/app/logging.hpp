#pragma once

#include <string_view>

namespace imgpipe::app {

/// Installs the "imgpipe" colour stdout logger as the spdlog default.
/// Unknown level names fall back to info. Safe to call more than once.
void init_logging(std::string_view level);

}  // namespace imgpipe::app
