#pragma once

#include "params.hpp"

#include "mocap/io/json-io.hpp"
#include "mocap/io/struct-meta.hpp"

namespace mocap::pipeline
{
struct CliArgs : public MetaCompatible
{
   virtual ~CliArgs() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   string version{k_version};
   bool show_help{false};
   bool has_error{false};

   string session_id{""s};
   string data_dir{""s}; // empty means MOCAP_DATA_DIR

   // Defaults, then `-p` or `--p-json`, then the individual overrides below
   Params params;
};

void show_help(string argv0) noexcept;

// The callback gets first crack at each argument. It returns true if it
// consumed `argv[i]`, advancing `i` past any values.
CliArgs parse_command_line(
    int argc,
    char** argv,
    std::function<bool(int argc, char** argv, int& i)> callback
    = nullptr) noexcept;

} // namespace mocap::pipeline

namespace mocap
{
META_READ_WRITE_LOAD_SAVE(pipeline::CliArgs)
}
