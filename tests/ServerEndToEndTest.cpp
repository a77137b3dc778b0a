#include "HttpTestUtils.hpp"
#include "app/StopCommand.hpp"
#include "auth/Session.hpp"
#include "auth/Token.hpp"
#include "http/Server.hpp"
#include "utils/Shutdown.hpp"

#include <mongoose.h>

#include <chrono>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include <doctest/doctest.h>

namespace
{

using namespace tbl::tests;

constexpr std::uint16_t kTestBasePort = 18480;

struct ServerFixture
{
    explicit ServerFixture(
        tbl::http::ServerOptions options = {},
        std::optional<tbl::auth::StaticCredential> basic = std::nullopt)
        : dir("server"), token(tbl::auth::generate_token())
    {
        options.base_port = kTestBasePort;
        options.web_root = dir.path() / "web";
        options.grace_period = std::chrono::milliseconds(500);
        server = std::make_unique<tbl::http::Server>(
            std::make_shared<tbl::auth::SessionGate const>(token,
                                                           std::move(basic)),
            signal, std::move(options));
        port = server->bind();
        server->start();
    }

    ~ServerFixture()
    {
        server->shutdown();
    }

    std::string url(std::string const &path) const
    {
        return base_url(port) + path;
    }

    TempDir dir;
    tbl::runtime::ShutdownSignal signal;
    std::string token;
    std::unique_ptr<tbl::http::Server> server;
    std::uint16_t port = 0;
};

// Holds a listening socket on a port without ever serving it.
class PortOccupant
{
  public:
    explicit PortOccupant(std::uint16_t port)
    {
        mg_mgr_init(&mgr_);
        auto url = "http://127.0.0.1:" + std::to_string(port);
        listener_ = mg_http_listen(&mgr_, url.c_str(), nullptr, nullptr);
    }
    ~PortOccupant() { mg_mgr_free(&mgr_); }

    PortOccupant(PortOccupant const &) = delete;
    PortOccupant &operator=(PortOccupant const &) = delete;

    bool holding() const noexcept { return listener_ != nullptr; }

  private:
    mg_mgr mgr_;
    struct mg_connection *listener_ = nullptr;
};

} // namespace

TEST_CASE("bootstrap link redemption")
{
    ServerFixture fixture;
    REQUIRE(fixture.port == kTestBasePort);

    SUBCASE("missing token is a bad request")
    {
        auto response = http_get(fixture.url("/bootstrap"));
        CHECK(response.status == 400);
        CHECK(response.body == "missing token in query");
        CHECK_FALSE(response.header("Set-Cookie"));
    }
    SUBCASE("wrong token is forbidden and issues no cookie")
    {
        auto response = http_get(fixture.url("/bootstrap?token=" +
                                             tbl::auth::generate_token()));
        CHECK(response.status == 403);
        CHECK(response.body == "invalid bootstrap token");
        CHECK_FALSE(response.header("Set-Cookie"));
    }
    SUBCASE("empty, oversized or badly encoded tokens are invalid")
    {
        for (auto const &query :
             {std::string("token="), "token=" + std::string(300, 'a'),
              std::string("token=%zz")})
        {
            auto response = http_get(fixture.url("/bootstrap?" + query));
            CHECK(response.status == 403);
            CHECK(response.body == "invalid bootstrap token");
            CHECK_FALSE(response.header("Set-Cookie"));
        }
    }
    SUBCASE("matching token issues the durable credential")
    {
        auto response =
            http_get(fixture.url("/bootstrap?token=" + fixture.token));
        CHECK(response.status == 200);
        auto cookie = response.header("Set-Cookie");
        REQUIRE(cookie);
        CHECK(cookie->find("tbl_token=" + fixture.token) != std::string::npos);
        CHECK(response.body.find(fixture.token) != std::string::npos);
        CHECK(response.body.find("location.replace(\"/\")") !=
              std::string::npos);

        auto ping = http_get(fixture.url("/api/v1/ping"),
                             {cookie_header(fixture.token)});
        CHECK(ping.status == 200);
    }
}

TEST_CASE("protected routes reject requests without the session cookie")
{
    ServerFixture fixture;

    auto anonymous = http_get(fixture.url("/api/v1/ping"));
    CHECK(anonymous.status == 401);
    auto forged = http_get(fixture.url("/api/v1/ping"),
                           {cookie_header(tbl::auth::generate_token())});
    CHECK(forged.status == 401);

    auto ok = http_get(fixture.url("/api/v1/ping"),
                       {cookie_header(fixture.token)});
    CHECK(ok.status == 200);
    CHECK(ok.body == R"({"status":"ok"})");
}

TEST_CASE("stop endpoint requires the credential and acknowledges first")
{
    ServerFixture fixture;

    auto rejected = http_post(fixture.url("/api/v1/shutdown"));
    CHECK(rejected.status == 401);
    CHECK_FALSE(fixture.signal.requested());
    CHECK(fixture.server->running());

    auto wrong_method = http_get(fixture.url("/api/v1/shutdown"),
                                 {cookie_header(fixture.token)});
    CHECK(wrong_method.status == 405);
    CHECK_FALSE(fixture.signal.requested());

    auto accepted = http_post(fixture.url("/api/v1/shutdown"), {},
                              {cookie_header(fixture.token)});
    CHECK(accepted.status == 200);
    CHECK(accepted.body == R"({"status":"shutting_down"})");
    CHECK(fixture.signal.wait_for(std::chrono::seconds(2)));

    fixture.server->shutdown();
    CHECK_FALSE(fixture.server->running());
    // A second shutdown is a no-op.
    fixture.server->shutdown();
}

TEST_CASE("static credential adds a Basic challenge")
{
    tbl::http::ServerOptions options;
    ServerFixture fixture(options,
                          tbl::auth::StaticCredential{"operator", "pw"});

    auto cookie_only = http_get(fixture.url("/api/v1/ping"),
                                {cookie_header(fixture.token)});
    CHECK(cookie_only.status == 401);
    auto challenge = cookie_only.header("WWW-Authenticate");
    REQUIRE(challenge);
    CHECK(challenge->find("realm=\"tbl\"") != std::string::npos);

    // "operator:pw"
    auto both = http_get(fixture.url("/api/v1/ping"),
                         {cookie_header(fixture.token),
                          "Authorization: Basic b3BlcmF0b3I6cHc="});
    CHECK(both.status == 200);
}

TEST_CASE("loopback servers refuse foreign Host headers")
{
    ServerFixture fixture;

    tbl::http::ClientRequest request;
    request.url = fixture.url("/api/v1/ping");
    request.headers = {cookie_header(fixture.token)};
    request.host_header = "attacker.example:" + std::to_string(fixture.port);
    CHECK(tbl::http::send_request(request).status == 403);

    request.host_header = "localhost:" + std::to_string(fixture.port);
    CHECK(tbl::http::send_request(request).status == 200);
}

TEST_CASE("public routes serve setup, helper script and web content")
{
    ServerFixture fixture;

    auto setup = http_get(fixture.url("/"));
    CHECK(setup.status == 200);
    CHECK(setup.body.find("action=\"/setup\"") != std::string::npos);

    auto script = http_get(fixture.url("/tbl.js"));
    CHECK(script.status == 200);
    CHECK(script.body.find("window.tblApi") != std::string::npos);

    CHECK(http_get(fixture.url("/nope")).status == 404);

    auto web = fixture.dir.path() / "web";
    std::filesystem::create_directories(web);
    {
        std::ofstream(web / "index.html") << "<h1>hello from web</h1>";
    }

    auto redirect = http_get(fixture.url("/"));
    CHECK(redirect.status == 307);
    CHECK(redirect.header("Location") == "/web/");

    auto page = http_get(fixture.url("/web/index.html"));
    CHECK(page.status == 200);
    CHECK(page.body.find("hello from web") != std::string::npos);
}

TEST_CASE("setup form runs the content fetch off the event loop")
{
    std::mutex mtx;
    std::string fetched;
    tbl::http::ServerOptions options;
    options.setup = [&](std::string const &url)
    {
        if (url.find("broken") != std::string::npos)
        {
            throw std::runtime_error("git clone failed for " + url);
        }
        std::lock_guard<std::mutex> lock(mtx);
        fetched = url;
        return tbl::http::SetupOutcome{true, {}};
    };
    ServerFixture fixture(std::move(options));
    auto const form = "application/x-www-form-urlencoded";

    auto empty = http_post(fixture.url("/setup"), "git_url=", {}, form);
    CHECK(empty.status == 400);

    auto ok = http_post(fixture.url("/setup"),
                        "git_url=https%3A%2F%2Fexample.com%2Fweb.git", {},
                        form);
    CHECK(ok.status == 303);
    CHECK(ok.header("Location") == "/");
    {
        std::lock_guard<std::mutex> lock(mtx);
        CHECK(fetched == "https://example.com/web.git");
    }

    auto failed = http_post(fixture.url("/setup"),
                            "git_url=https%3A%2F%2Fbroken.example%2Fx.git",
                            {}, form);
    CHECK(failed.status == 500);
    CHECK(failed.body.find("git clone failed") != std::string::npos);
}

TEST_CASE("shutdown does not wait past the grace period for a setup fetch")
{
    std::promise<void> entered;
    std::promise<void> release;
    std::promise<void> returned;
    auto release_future = release.get_future().share();
    tbl::http::ServerOptions options;
    options.setup = [&entered, &returned,
                     release_future](std::string const &)
    {
        entered.set_value();
        release_future.wait();
        returned.set_value();
        return tbl::http::SetupOutcome{true, {}};
    };
    ServerFixture fixture(std::move(options));

    auto client = std::async(
        std::launch::async,
        [url = fixture.url("/setup")]
        {
            tbl::http::ClientRequest request;
            request.method = "POST";
            request.url = url;
            request.body = "git_url=https%3A%2F%2Fslow.example%2Fweb.git";
            request.content_type = "application/x-www-form-urlencoded";
            request.timeout = std::chrono::milliseconds(2000);
            try
            {
                return tbl::http::send_request(request).status;
            }
            catch (std::runtime_error const &)
            {
                return 0;
            }
        });
    REQUIRE(entered.get_future().wait_for(std::chrono::seconds(5)) ==
            std::future_status::ready);

    auto started = std::chrono::steady_clock::now();
    fixture.server->shutdown();
    auto elapsed = std::chrono::steady_clock::now() - started;
    CHECK(elapsed < std::chrono::seconds(2));
    CHECK_FALSE(fixture.server->running());

    // The fetch finishing after the server stopped must be harmless.
    release.set_value();
    CHECK(returned.get_future().wait_for(std::chrono::seconds(5)) ==
          std::future_status::ready);
    CHECK(client.get() != 303);
}

TEST_CASE("server moves to the next port when the base is taken")
{
    PortOccupant occupant(kTestBasePort);
    REQUIRE(occupant.holding());
    ServerFixture fixture;
    CHECK(fixture.port == kTestBasePort + 1);
}

TEST_CASE("launch, authenticate and stop on the default port")
{
    TempDir dir("e2e");
    tbl::state::RunStateStore store(dir.path() / "run");
    CHECK_FALSE(store.read());

    ControllerRunner runner(dir.path(), tbl::app::Settings{});
    auto record = runner.wait_until_serving();
    CHECK(record.port == 1234);
    CHECK(tbl::auth::is_well_formed_token(record.auth_token));
    CHECK_FALSE(record.tls);

    auto persisted = store.read();
    REQUIRE(persisted);
    CHECK(*persisted == record);
    CHECK(runner.controller().state() == tbl::app::LaunchState::Serving);

    auto bootstrap =
        http_get(base_url(record.port) + "/bootstrap?token=" + record.auth_token);
    CHECK(bootstrap.status == 200);
    auto ping = http_get(base_url(record.port) + "/api/v1/ping",
                         {cookie_header(record.auth_token)});
    CHECK(ping.status == 200);

    auto stop = http_post(base_url(record.port) + "/api/v1/shutdown", {},
                          {cookie_header(record.auth_token)});
    CHECK(stop.status == 200);

    CHECK(runner.join() == 0);
    CHECK(runner.controller().state() == tbl::app::LaunchState::Stopped);
    CHECK_FALSE(store.read());
}

TEST_CASE("launch records the fallback port when 1234 is occupied")
{
    PortOccupant occupant(1234);
    REQUIRE(occupant.holding());

    TempDir dir("e2e-fallback");
    ControllerRunner runner(dir.path(), tbl::app::Settings{});
    auto record = runner.wait_until_serving();
    CHECK(record.port == 1235);

    tbl::state::RunStateStore store(dir.path() / "run");
    auto persisted = store.read();
    REQUIRE(persisted);
    CHECK(persisted->port == 1235);

    runner.controller().shutdown_signal().request();
    CHECK(runner.join() == 0);
    CHECK_FALSE(store.read());
}

TEST_CASE("the stop command shuts down a live instance")
{
    TempDir dir("e2e-stop");
    tbl::app::Settings settings;
    settings.base_port = kTestBasePort + 20;
    ControllerRunner runner(dir.path(), settings);
    auto record = runner.wait_until_serving();

    tbl::app::StopOptions options;
    options.config_dir = dir.path();
    auto report = tbl::app::stop_running_instance(options);
    CHECK(report.result == tbl::app::StopResult::Stopped);
    CHECK(report.port == record.port);
    CHECK(tbl::app::report_stop_result(report) == 0);

    CHECK(runner.join() == 0);
    tbl::state::RunStateStore store(dir.path() / "run");
    CHECK_FALSE(store.read());
}
