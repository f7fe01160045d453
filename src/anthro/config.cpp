
#include "config.hpp"

#include "stdinc.hpp"

#include "anthro/utils/file-system.hpp"

#include "json/json.h"

#include <stdlib.h>

#include <mutex>

#include <boost/lexical_cast.hpp>

namespace anthro
{
struct EnvironmentVariables
{
   bool is_init                  = false;
   std::string installation_root = ""s;
   std::string data_dir          = ""s;
   bool trace_mode               = false;
   int log_level                 = 0;
   Json::Value env_obj           = Json::Value{Json::nullValue};

   string make_config_info_str() const;
   void init_config(const Json::Value& o);
};

static EnvironmentVariables env_vars_;

static void init_instance(const Json::Value& o) noexcept
{
   env_vars_.init_config(o);
}

static EnvironmentVariables& instance()
{
   if(!env_vars_.is_init)
      FATAL(format("Must call 'load_environment_variables()' before attempting "
                   "to load any environmental variables"));
   return env_vars_;
}

// -------------------------------------------------------- make config info str
//
string EnvironmentVariables::make_config_info_str() const
{
   auto make_build_str = []() {
      std::stringstream ss{""};
      bool needs_comma = false;
      auto push_bool   = [&](bool val, const string_view s) {
         if(!val) return;
         if(needs_comma) ss << ", ";
         ss << s;
         needs_comma = true;
      };
      push_bool(k_is_cli_build, "cli");
      push_bool(k_is_testcase_build, "testcases");
      push_bool(k_is_debug_build, "debug");
      push_bool(k_is_release_build, "release");
      return ss.str();
   };

   return format(R"V0G0N(
   k-anthro-version              = '{}'
   build-configuration           =  {}
   installation-root             = '{}'
   ANTHRO_DATA_DIR               = '{}'
   ANTHRO_TRACE_MODE             =  {}
   ANTHRO_LOG_LEVEL              =  {}
)V0G0N",
                 k_version,
                 make_build_str(),
                 installation_root,
                 data_dir,
                 str(trace_mode),
                 log_level);
}

// -------------------------------------------------------------------- read-env
//
static Json::Value read_env()
{
   Json::Value o{Json::objectValue};

   auto get_w_default
       = [&o](const std::string_view name,
              const std::string_view default_value) -> std::string {
      const char* ss = getenv(name.data());
      const auto ret
          = (ss == nullptr) ? std::string(default_value) : std::string(ss);
      o[string(name)] = ret;
      return ret;
   };

   auto get_bool_w_default = [&](const std::string_view name) -> bool {
      const auto val  = get_w_default(name, "");
      const auto ret  = (val == std::string("1") or val == std::string("true"));
      o[string(name)] = ret;
      return ret;
   };

   auto get_int_w_default = [&](const std::string_view name, int def) -> int {
      const auto s = get_w_default(name, "");
      int ret      = def;
      if(s.size() > 0) {
         using boost::bad_lexical_cast;
         using boost::lexical_cast;
         try {
            ret = lexical_cast<int>(s);
         } catch(bad_lexical_cast&) {
            FATAL(
                format("bad lexical cast reading environment variable {}='{}' "
                       "as an integer",
                       name,
                       s));
         }
      }
      o[string(name)] = ret;
      return ret;
   };

   get_w_default("ANTHRO_DATA_DIR", ""s);
   get_bool_w_default("ANTHRO_TRACE_MODE");
   get_int_w_default("ANTHRO_LOG_LEVEL", 0);

   return o;
}

static const Json::Value& get_env_data()
{
   static std::mutex padlock_;
   static bool first_run_ = true;
   static Json::Value env_data_;
   {
      std::lock_guard<decltype(padlock_)> lock(padlock_);
      if(first_run_) {
         env_data_  = read_env();
         first_run_ = false;
      }
   }

   return env_data_;
}

// ----------------------------------------------------------------- init config
//
void EnvironmentVariables::init_config(const Json::Value& o)
{
   auto get_string = [&o](const char* key) -> string {
      return o.isMember(key) ? o[key].asString() : ""s;
   };

   installation_root = k_installation_root;

   data_dir = get_string("ANTHRO_DATA_DIR");
   if(data_dir.empty() and !installation_root.empty())
      data_dir = format("{}/share/anthro", installation_root);
   if(!data_dir.empty() and !is_directory(data_dir))
      WARN(format("ANTHRO_DATA_DIR='{}' is not a directory", data_dir));

   trace_mode = o.isMember("ANTHRO_TRACE_MODE")
                and o["ANTHRO_TRACE_MODE"].asBool();
   log_level  = o.isMember("ANTHRO_LOG_LEVEL") ? o["ANTHRO_LOG_LEVEL"].asInt()
                                               : 0;
   env_obj    = o;

   if(log_level > 0) Logger::set_log_level(log_level);

   is_init = true;
}

// -------------------------------------------------- load environment variables
//
void load_environment_variables() noexcept { init_instance(get_env_data()); }

void set_environment_variables(const Json::Value& o) noexcept
{
   init_instance(o);
}

// --------------------------------------------------------------------- getters
//
const std::string& anthro_data_dir() noexcept { return instance().data_dir; }

bool anthro_trace_mode() noexcept
{
   // Tracing can be hit before the environment is loaded
   return env_vars_.is_init and env_vars_.trace_mode;
}

int anthro_log_level() noexcept { return instance().log_level; }

std::string environment_info() noexcept
{
   return instance().make_config_info_str();
}

} // namespace anthro
