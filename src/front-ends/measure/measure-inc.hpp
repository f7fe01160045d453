
#pragma once

namespace anthro::measure
{
inline string brief() noexcept
{
   return "Turns a capture's keypoint frames into a reconciled measurement "
          "set, and optionally mesh parameters.";
}

int run_main(int argc, char** argv);
} // namespace anthro::measure
