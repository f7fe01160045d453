
#pragma once

namespace anthro::dump_default_params
{
inline string brief() noexcept
{
   return "Dumps the default params, measurement plan, and mesh metadata.";
}

int run_main(int argc, char** argv);
} // namespace anthro::dump_default_params
