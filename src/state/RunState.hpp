#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace tbl::state
{

// The persisted claim that an instance is serving. Its presence is not proof
// of liveness; callers must probe `port`.
struct RunRecord
{
    std::int64_t pid = 0;
    std::uint16_t port = 0;
    std::string auth_token;
    bool tls = false;

    bool operator==(RunRecord const &) const = default;
};

std::string serialize_run_record(RunRecord const &record);
// Rejects anything that is not a complete, well-formed record.
std::optional<RunRecord> parse_run_record(std::string_view payload);

// Owns <run-dir>/pid.json. Concurrent processes may race on the file; the
// liveness probe, not locking, resolves conflicts.
class RunStateStore
{
  public:
    explicit RunStateStore(std::filesystem::path run_dir);

    std::optional<RunRecord> read() const;
    // Throws PersistenceError when the directory or file cannot be written.
    void write(RunRecord const &record) const;
    // Best effort; returns false (and logs) when an existing file could not
    // be removed.
    bool clear() const;
    // Removes the record only while it still names `owner_pid`, so an
    // instance that started after this one keeps its claim. Returns false
    // when a record it owns could not be removed.
    bool clear_if_owned(std::int64_t owner_pid) const;

    std::filesystem::path const &file() const noexcept { return file_; }

  private:
    std::filesystem::path dir_;
    std::filesystem::path file_;
};

} // namespace tbl::state
