#pragma once

#include "app/DaemonController.hpp"
#include "http/Client.hpp"
#include "state/RunState.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <unistd.h>

namespace tbl::tests
{

// Unique scratch directory removed on destruction.
class TempDir
{
  public:
    explicit TempDir(std::string const &label)
    {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("tbl-test-" + label + "-" + std::to_string(::getpid()) + "-" +
                 std::to_string(counter.fetch_add(1)));
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        std::filesystem::create_directories(path_, ec);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(TempDir const &) = delete;
    TempDir &operator=(TempDir const &) = delete;

    std::filesystem::path const &path() const noexcept { return path_; }

  private:
    std::filesystem::path path_;
};

inline std::string base_url(std::uint16_t port, bool secure = false)
{
    return std::string(secure ? "https" : "http") + "://127.0.0.1:" +
           std::to_string(port);
}

inline http::ClientResponse http_get(std::string const &url,
                                     std::vector<std::string> headers = {})
{
    http::ClientRequest request;
    request.url = url;
    request.headers = std::move(headers);
    return http::send_request(request);
}

inline http::ClientResponse http_post(std::string const &url,
                                      std::string body = {},
                                      std::vector<std::string> headers = {},
                                      std::string content_type = {})
{
    http::ClientRequest request;
    request.method = "POST";
    request.url = url;
    request.body = std::move(body);
    request.headers = std::move(headers);
    request.content_type = std::move(content_type);
    return http::send_request(request);
}

inline std::string cookie_header(std::string const &token)
{
    return "Cookie: tbl_token=" + token;
}

// Runs a DaemonController on a background thread in daemonized mode and
// exposes the RunRecord it publishes once serving.
class ControllerRunner
{
  public:
    ControllerRunner(std::filesystem::path config_dir, app::Settings settings,
                     app::LaunchHooks hooks = {})
    {
        app::LaunchOptions options;
        options.config_dir = std::move(config_dir);
        options.settings = std::move(settings);
        options.settings.auto_open_browser = false;
        options.daemonized = true;
        options.grace_period = std::chrono::milliseconds(500);
        if (!hooks.surface_link)
        {
            hooks.surface_link = [](std::string const &, bool) {};
        }
        auto user_on_serving = std::move(hooks.on_serving);
        hooks.on_serving = [this, user_on_serving](state::RunRecord const &rec)
        {
            if (user_on_serving)
            {
                user_on_serving(rec);
            }
            serving_.set_value(rec);
        };
        controller_ =
            std::make_unique<app::DaemonController>(std::move(options),
                                                    std::move(hooks));
        serving_future_ = serving_.get_future();
        thread_ = std::thread(
            [this]
            {
                try
                {
                    exit_code_ = controller_->run();
                }
                catch (std::exception const &)
                {
                    failure_ = std::current_exception();
                }
                finished_.store(true);
            });
    }

    ~ControllerRunner()
    {
        if (thread_.joinable())
        {
            controller_->shutdown_signal().request();
            thread_.join();
        }
    }

    ControllerRunner(ControllerRunner const &) = delete;
    ControllerRunner &operator=(ControllerRunner const &) = delete;

    // Blocks until the controller is serving; throws if it failed first.
    state::RunRecord wait_until_serving(
        std::chrono::milliseconds timeout = std::chrono::seconds(10))
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (serving_future_.wait_for(std::chrono::milliseconds(20)) !=
               std::future_status::ready)
        {
            if (finished_.load())
            {
                join();
                throw std::runtime_error("controller exited before serving");
            }
            if (std::chrono::steady_clock::now() > deadline)
            {
                throw std::runtime_error("controller did not start serving");
            }
        }
        return serving_future_.get();
    }

    // Joins the controller thread and returns its exit code, rethrowing any
    // startup failure.
    int join()
    {
        if (thread_.joinable())
        {
            thread_.join();
        }
        if (failure_)
        {
            std::rethrow_exception(failure_);
        }
        return exit_code_;
    }

    app::DaemonController &controller() { return *controller_; }

  private:
    std::unique_ptr<app::DaemonController> controller_;
    std::promise<state::RunRecord> serving_;
    std::future<state::RunRecord> serving_future_;
    std::thread thread_;
    std::atomic<bool> finished_{false};
    std::exception_ptr failure_;
    int exit_code_ = -1;
};

} // namespace tbl::tests
