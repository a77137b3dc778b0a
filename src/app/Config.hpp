#pragma once

#include "auth/Session.hpp"
#include "http/Server.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tbl::storage
{
class Database;
}

namespace tbl::app
{

inline constexpr char kDefaultAddr[] = "127.0.0.1:1234";

struct Settings
{
    std::optional<std::string> git_url;
    std::string bind_host = "127.0.0.1";
    std::uint16_t base_port = 1234;
    std::optional<std::string> tls_cert;
    std::optional<std::string> tls_key;
    std::optional<std::string> basic_user;
    std::optional<std::string> basic_pass;
    bool auto_open_browser = true;

    std::string addr() const;
    bool tls_enabled() const noexcept { return tls_cert && tls_key; }
    std::optional<auth::StaticCredential> static_credential() const;
};

// Flags as typed on the command line, before any other source is merged.
struct CommandLine
{
    std::map<std::string, std::string> values;
    bool no_browser = false;
    bool stop = false;
    bool help = false;
    bool version = false;
};

// Accepts `--name value` and `--name=value`. Throws ConfigError on unknown
// flags or a missing value.
CommandLine parse_command_line(std::vector<std::string> const &args);

using EnvLookup =
    std::function<std::optional<std::string>(char const *name)>;
std::optional<std::string> read_environment(char const *name);

// Command line > environment > persisted settings > defaults.
// Throws ConfigError on a malformed addr.
Settings resolve_settings(CommandLine const &cli, EnvLookup const &env,
                          storage::Database const *db);

// Writes every configured key; returns false if any write failed.
bool save_settings(storage::Database &db, Settings const &settings);

// Reads the configured PEM files. nullopt when TLS is not configured.
// Throws ConfigError when a file cannot be read.
std::optional<http::TlsMaterial> load_tls_material(Settings const &settings);

std::string usage_text();

} // namespace tbl::app
