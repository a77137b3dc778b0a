#include "app/Config.hpp"

#include "state/SettingsStore.hpp"
#include "utils/Endpoint.hpp"
#include "utils/Errors.hpp"
#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <array>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string_view>

namespace tbl::app
{
namespace
{

struct ValueKey
{
    char const *flag;
    char const *env;
    char const *setting;
};

// Every value-carrying option with its environment variable and the key
// used in the settings table.
constexpr std::array<ValueKey, 6> kValueKeys = {{
    {"git-url", "TBL_GIT_URL", "git_url"},
    {"addr", "TBL_ADDR", "addr"},
    {"tls-cert", "TBL_TLS_CERT", "tls_cert"},
    {"tls-key", "TBL_TLS_KEY", "tls_key"},
    {"basic-user", "TBL_BASIC_USER", "basic_user"},
    {"basic-pass", "TBL_BASIC_PASS", "basic_pass"},
}};

ValueKey const *find_value_key(std::string_view flag)
{
    for (auto const &key : kValueKeys)
    {
        if (flag == key.flag)
        {
            return &key;
        }
    }
    return nullptr;
}

std::string trim_whitespace(std::string value)
{
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
    {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::optional<std::string> non_empty(std::optional<std::string> value)
{
    if (!value)
    {
        return std::nullopt;
    }
    auto trimmed = trim_whitespace(std::move(*value));
    if (trimmed.empty())
    {
        return std::nullopt;
    }
    return trimmed;
}

std::string read_pem(std::string const &path, char const *what)
{
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        throw ConfigError(std::format("failed to open TLS {} {}", what, path));
    }
    std::string content((std::istreambuf_iterator<char>(input)),
                        std::istreambuf_iterator<char>());
    if (content.empty())
    {
        throw ConfigError(std::format("TLS {} {} is empty", what, path));
    }
    return content;
}

} // namespace

std::string Settings::addr() const
{
    return net::format_host_port(bind_host, base_port);
}

std::optional<auth::StaticCredential> Settings::static_credential() const
{
    if (!basic_user || !basic_pass)
    {
        return std::nullopt;
    }
    return auth::StaticCredential{*basic_user, *basic_pass};
}

CommandLine parse_command_line(std::vector<std::string> const &args)
{
    CommandLine cli;
    for (std::size_t index = 0; index < args.size(); ++index)
    {
        auto const &arg = args[index];
        if (arg == "--no-browser")
        {
            cli.no_browser = true;
            continue;
        }
        if (arg == "--stop")
        {
            cli.stop = true;
            continue;
        }
        if (arg == "--help" || arg == "-h")
        {
            cli.help = true;
            continue;
        }
        if (arg == "--version" || arg == "-V")
        {
            cli.version = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0)
        {
            throw ConfigError("unexpected argument: " + arg);
        }
        auto name = arg.substr(2);
        std::optional<std::string> value;
        if (auto eq = name.find('='); eq != std::string::npos)
        {
            value = name.substr(eq + 1);
            name.resize(eq);
        }
        auto const *key = find_value_key(name);
        if (key == nullptr)
        {
            throw ConfigError("unknown option: --" + name);
        }
        if (!value)
        {
            if (index + 1 >= args.size())
            {
                throw ConfigError("option --" + name + " requires a value");
            }
            value = args[++index];
        }
        cli.values[key->flag] = *value;
    }
    return cli;
}

std::optional<std::string> read_environment(char const *name)
{
    auto value = std::getenv(name);
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string(value);
}

Settings resolve_settings(CommandLine const &cli, EnvLookup const &env,
                          storage::Database const *db)
{
    std::map<std::string, std::string> merged;
    for (auto const &key : kValueKeys)
    {
        std::optional<std::string> value;
        if (auto it = cli.values.find(key.flag); it != cli.values.end())
        {
            value = non_empty(it->second);
        }
        if (!value && env)
        {
            value = non_empty(env(key.env));
        }
        if (!value && db != nullptr && db->is_valid())
        {
            value = non_empty(db->get_setting(key.setting));
        }
        if (value)
        {
            merged[key.setting] = *value;
        }
    }

    auto pick = [&](char const *setting) -> std::optional<std::string>
    {
        if (auto it = merged.find(setting); it != merged.end())
        {
            return it->second;
        }
        return std::nullopt;
    };

    Settings settings;
    settings.git_url = pick("git_url");
    auto bind = net::parse_bind_address(pick("addr").value_or(kDefaultAddr));
    settings.bind_host = bind.host;
    settings.base_port = bind.port;
    settings.tls_cert = pick("tls_cert");
    settings.tls_key = pick("tls_key");
    settings.basic_user = pick("basic_user");
    settings.basic_pass = pick("basic_pass");
    settings.auto_open_browser = !cli.no_browser;

    if (settings.tls_cert.has_value() != settings.tls_key.has_value())
    {
        TBL_LOG_WARN("TLS needs both a certificate and a key; serving plain "
                     "HTTP");
    }
    if (settings.basic_user.has_value() != settings.basic_pass.has_value())
    {
        TBL_LOG_WARN("basic auth needs both a user and a password; "
                     "static credential disabled");
    }
    if (!net::is_loopback_host(settings.bind_host))
    {
        TBL_LOG_WARN("binding to non-loopback host {}", settings.bind_host);
    }
    return settings;
}

bool save_settings(storage::Database &db, Settings const &settings)
{
    if (!db.is_valid())
    {
        return false;
    }
    std::array<std::pair<char const *, std::optional<std::string>>, 6> rows = {{
        {"git_url", settings.git_url},
        {"addr", settings.addr()},
        {"tls_cert", settings.tls_cert},
        {"tls_key", settings.tls_key},
        {"basic_user", settings.basic_user},
        {"basic_pass", settings.basic_pass},
    }};
    if (!db.begin_transaction())
    {
        return false;
    }
    bool ok = true;
    for (auto const &[key, value] : rows)
    {
        if (value)
        {
            ok = db.set_setting(key, *value) && ok;
        }
    }
    if (!ok)
    {
        if (!db.rollback_transaction())
        {
            TBL_LOG_WARN("settings rollback failed for {}", db.path().string());
        }
        return false;
    }
    return db.commit_transaction();
}

std::optional<http::TlsMaterial> load_tls_material(Settings const &settings)
{
    if (!settings.tls_enabled())
    {
        return std::nullopt;
    }
    http::TlsMaterial material;
    material.cert_pem = read_pem(*settings.tls_cert, "certificate");
    material.key_pem = read_pem(*settings.tls_key, "key");
    return material;
}

std::string usage_text()
{
    std::ostringstream out;
    out << version::kDisplayVersion << " - " << version::kTagline << "\n\n"
        << "Usage: tbl [options]\n\n"
        << "Options:\n"
        << "  --git-url <url>      Git URL of the web app to serve\n"
        << "  --addr <host:port>   Address to bind; the port is searched "
           "upward from the given value (default "
        << kDefaultAddr << ")\n"
        << "  --tls-cert <file>    TLS certificate file (PEM)\n"
        << "  --tls-key <file>     TLS private key file (PEM)\n"
        << "  --basic-user <name>  HTTP Basic auth username\n"
        << "  --basic-pass <pass>  HTTP Basic auth password\n"
        << "  --no-browser         Do not open the browser automatically\n"
        << "  --stop               Stop a running tbl server\n"
        << "  -h, --help           Show this help\n"
        << "  -V, --version        Show the version\n";
    return out.str();
}

} // namespace tbl::app
