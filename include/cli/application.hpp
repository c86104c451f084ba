#pragma once

namespace gifrgb::cli {

int run(int argc, char** argv);

} // namespace gifrgb::cli
