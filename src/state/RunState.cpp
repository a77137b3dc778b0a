#include "state/RunState.hpp"

#include "auth/Token.hpp"
#include "utils/Errors.hpp"
#include "utils/FS.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace tbl::state
{

namespace
{
constexpr char kRunFileName[] = "pid.json";
constexpr char kTempSuffix[] = ".tmp";
} // namespace

std::string serialize_run_record(RunRecord const &record)
{
    tbl::json::MutableDocument doc;
    auto *root = doc.object_root();
    if (root == nullptr)
    {
        return {};
    }
    auto *native = doc.doc();
    yyjson_mut_obj_add_int(native, root, "pid", record.pid);
    yyjson_mut_obj_add_uint(native, root, "port", record.port);
    yyjson_mut_obj_add_strncpy(native, root, "auth_token",
                               record.auth_token.data(),
                               record.auth_token.size());
    yyjson_mut_obj_add_bool(native, root, "tls", record.tls);
    return doc.write("");
}

std::optional<RunRecord> parse_run_record(std::string_view payload)
{
    auto doc = tbl::json::Document::parse(payload);
    if (!doc.is_valid())
    {
        return std::nullopt;
    }
    auto pid = doc.get_int("pid");
    auto port = doc.get_int("port");
    auto token = doc.get_string("auth_token");
    auto tls = doc.get_bool("tls");
    if (!pid || !port || !token || !tls)
    {
        return std::nullopt;
    }
    if (*pid <= 0 || *port <= 0 || *port > 65535 ||
        !tbl::auth::is_well_formed_token(*token))
    {
        return std::nullopt;
    }
    RunRecord record;
    record.pid = *pid;
    record.port = static_cast<std::uint16_t>(*port);
    record.auth_token = std::move(*token);
    record.tls = *tls;
    return record;
}

RunStateStore::RunStateStore(std::filesystem::path run_dir)
    : dir_(std::move(run_dir)), file_(dir_ / kRunFileName)
{
}

std::optional<RunRecord> RunStateStore::read() const
{
    std::ifstream input(file_, std::ios::binary);
    if (!input)
    {
        return std::nullopt;
    }
    std::string payload((std::istreambuf_iterator<char>(input)),
                        std::istreambuf_iterator<char>());
    auto record = parse_run_record(payload);
    if (!record)
    {
        TBL_LOG_DEBUG("ignoring malformed run state file {}", file_.string());
    }
    return record;
}

void RunStateStore::write(RunRecord const &record) const
{
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec)
    {
        throw PersistenceError("cannot create run directory " + dir_.string() +
                               ": " + ec.message());
    }
    auto payload = serialize_run_record(record);
    if (payload.empty())
    {
        throw PersistenceError("cannot serialize run state");
    }

    auto tmp_path = file_;
    tmp_path += kTempSuffix;
    {
        std::ofstream output(tmp_path, std::ios::binary | std::ios::trunc);
        if (!output)
        {
            throw PersistenceError("cannot open " + tmp_path.string() +
                                   " for writing");
        }
        // The record carries the session secret.
        if (!tbl::utils::secure_file_permissions(tmp_path))
        {
            TBL_LOG_WARN("unable to restrict permissions on {}",
                         tmp_path.string());
        }
        output << payload;
        output.flush();
        if (!output)
        {
            output.close();
            std::filesystem::remove(tmp_path, ec);
            throw PersistenceError("cannot write " + tmp_path.string());
        }
    }
    std::filesystem::rename(tmp_path, file_, ec);
    if (ec)
    {
        auto message = ec.message();
        std::filesystem::remove(tmp_path, ec);
        throw PersistenceError("cannot move run state into " + file_.string() +
                               ": " + message);
    }
    TBL_LOG_DEBUG("run state written to {} (pid {}, port {})", file_.string(),
                  record.pid, record.port);
}

bool RunStateStore::clear() const
{
    std::error_code ec;
    std::filesystem::remove(file_, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
    {
        TBL_LOG_WARN("failed to remove run state {}: {}", file_.string(),
                     ec.message());
        return false;
    }
    return true;
}

bool RunStateStore::clear_if_owned(std::int64_t owner_pid) const
{
    auto current = read();
    if (current && current->pid != owner_pid)
    {
        TBL_LOG_INFO("run state now belongs to pid {}; leaving it in place",
                     current->pid);
        return true;
    }
    return clear();
}

} // namespace tbl::state
