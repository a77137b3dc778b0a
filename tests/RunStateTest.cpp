#include "HttpTestUtils.hpp"
#include "auth/Token.hpp"
#include "state/RunState.hpp"
#include "utils/Errors.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <doctest/doctest.h>

using tbl::state::RunRecord;
using tbl::state::RunStateStore;

namespace
{

RunRecord sample_record()
{
    RunRecord record;
    record.pid = 4242;
    record.port = 1234;
    record.auth_token = tbl::auth::generate_token();
    record.tls = true;
    return record;
}

void write_raw(std::filesystem::path const &file, std::string const &payload)
{
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out << payload;
}

} // namespace

TEST_CASE("RunStateStore reads back what it wrote")
{
    tbl::tests::TempDir dir("runstate");
    RunStateStore store(dir.path() / "run");
    CHECK_FALSE(store.read());

    auto record = sample_record();
    store.write(record);
    CHECK(store.file() == dir.path() / "run" / "pid.json");

    auto loaded = store.read();
    REQUIRE(loaded);
    CHECK(*loaded == record);

    auto perms = std::filesystem::status(store.file()).permissions();
    CHECK((perms & std::filesystem::perms::group_read) ==
          std::filesystem::perms::none);
    CHECK((perms & std::filesystem::perms::others_read) ==
          std::filesystem::perms::none);
}

TEST_CASE("RunStateStore treats malformed content as absent")
{
    tbl::tests::TempDir dir("runstate-malformed");
    RunStateStore store(dir.path() / "run");

    write_raw(store.file(), "not json");
    CHECK_FALSE(store.read());

    write_raw(store.file(), R"({"pid":1,"port":1234,"tls":false})");
    CHECK_FALSE(store.read());

    write_raw(store.file(),
              R"({"pid":1,"port":70000,"auth_token":")" +
                  tbl::auth::generate_token() + R"(","tls":false})");
    CHECK_FALSE(store.read());

    write_raw(store.file(),
              R"({"pid":1,"port":1234,"auth_token":"short","tls":false})");
    CHECK_FALSE(store.read());
}

TEST_CASE("RunStateStore clear is idempotent")
{
    tbl::tests::TempDir dir("runstate-clear");
    RunStateStore store(dir.path() / "run");
    store.write(sample_record());
    CHECK(store.clear());
    CHECK_FALSE(std::filesystem::exists(store.file()));
    CHECK(store.clear());
    CHECK_FALSE(store.read());
}

TEST_CASE("RunStateStore write fails when the directory cannot be created")
{
    tbl::tests::TempDir dir("runstate-blocked");
    auto blocker = dir.path() / "run";
    write_raw(blocker, "occupied by a file");
    RunStateStore store(blocker);
    CHECK_THROWS_AS(store.write(sample_record()), tbl::PersistenceError);
}

TEST_CASE("serialize_run_record uses the documented field names")
{
    auto record = sample_record();
    auto json = tbl::state::serialize_run_record(record);
    CHECK(json.find("\"pid\":4242") != std::string::npos);
    CHECK(json.find("\"port\":1234") != std::string::npos);
    CHECK(json.find("\"auth_token\":\"" + record.auth_token + "\"") !=
          std::string::npos);
    CHECK(json.find("\"tls\":true") != std::string::npos);
    auto parsed = tbl::state::parse_run_record(json);
    REQUIRE(parsed);
    CHECK(*parsed == record);
}

TEST_CASE("clear_if_owned leaves a record claimed by another process")
{
    tbl::tests::TempDir dir("runstate-owned");
    RunStateStore store(dir.path() / "run");
    auto mine = sample_record();
    store.write(mine);

    auto successor = sample_record();
    successor.pid = mine.pid + 1;
    successor.port = 1235;
    store.write(successor);

    CHECK(store.clear_if_owned(mine.pid));
    auto remaining = store.read();
    REQUIRE(remaining);
    CHECK(*remaining == successor);

    CHECK(store.clear_if_owned(successor.pid));
    CHECK_FALSE(store.read());
    CHECK(store.clear_if_owned(successor.pid));
}
