// Download session tests against a scripted transfer agent (run via CTest).
#include "megadl/download_session.hpp"
#include "megadl/cli.hpp"
#include "megadl/errors.hpp"
#include "megadl/progress_reporter.hpp"
#include "megadl/vpn_peer_ip_changer.hpp"

#include "test_support.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using megadl_test::ScratchDir;
using megadl_test::TestContext;

namespace {

// Shared, ordered record of what the fakes were asked to do.
struct EventLog {
    std::mutex mutex;
    std::vector<std::string> events;

    void add(const std::string &event) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }

    std::vector<std::string> only(const std::vector<std::string> &names) {
        std::vector<std::string> filtered;
        for (const auto &event : snapshot()) {
            for (const auto &name : names) {
                if (event == name) {
                    filtered.push_back(event);
                }
            }
        }
        return filtered;
    }

    std::size_t count(const std::string &name) { return only({name}).size(); }
};

struct ScriptedGet {
    megadl::RunOutcome outcome{megadl::RunOutcome::Completed};
    std::optional<int> exit_code{0};
    // Leaves a stray file in the destination, as an interrupted transfer does.
    bool partial{false};
};

std::string unquotedName(const std::string &remote) {
    std::string path = remote;
    if (path.size() >= 2 && path.front() == '\'' && path.back() == '\'') {
        path = path.substr(1, path.size() - 2);
    }
    const auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

megadl::ProcessResult completedWith(int exit_code, std::string output = {}) {
    megadl::ProcessResult result;
    result.outcome = megadl::RunOutcome::Completed;
    result.exit_code = exit_code;
    result.output = std::move(output);
    return result;
}

class FakeAgent final : public megadl::TransferAgent {
public:
    explicit FakeAgent(EventLog &log) : log_(log) {}

    std::string listing;
    bool listing_fails{false};
    bool login_fails{false};
    bool logged_in{false};
    bool logout_succeeds{true};
    // Status polls answered with a timeout before the script is consulted.
    std::size_t failing_polls{0};
    // Dot-file the server leaves in the destination when it is killed.
    std::string kill_leftover;
    // Name of the file a file-link download produces.
    std::string file_link_name{"single.bin"};
    std::deque<ScriptedGet> gets;
    // One entry per poll; nullopt means the transfer is not listed.
    std::deque<std::optional<std::string>> active_states;
    std::deque<std::optional<std::string>> completed_states;

    void login(const std::string &) override {
        log_.add("login");
        if (login_fails) {
            throw megadl::Error("Login refused");
        }
    }

    bool logout() override {
        log_.add("logout");
        return logout_succeeds;
    }

    bool isLoggedIn() override { return logged_in; }

    std::size_t polls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return polls_;
    }

    megadl::ProcessResult get(const std::string &remote, const fs::path &destination,
                              std::chrono::seconds) override {
        log_.add("get:" + remote);
        ScriptedGet step;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!gets.empty()) {
                step = gets.front();
                gets.pop_front();
            }
        }
        if (step.partial) {
            megadl_test::writeFile(destination / ".megatmp.partial");
        }
        megadl::ProcessResult result;
        result.outcome = step.outcome;
        result.exit_code = step.exit_code;
        if (result.succeeded()) {
            const auto name = remote.find("mega.nz") != std::string::npos ? file_link_name
                                                                          : unquotedName(remote);
            megadl_test::writeFile(destination / name);
        }
        return result;
    }

    megadl::ProcessResult queueGet(const std::string &remote, const fs::path &destination) override {
        log_.add("queue:" + remote);
        std::lock_guard<std::mutex> lock(mutex_);
        queued_name_ = unquotedName(remote);
        queued_dest_ = destination;
        return completedWith(0);
    }

    megadl::ProcessResult findFiles() override {
        log_.add("find");
        if (listing_fails) {
            return completedWith(1, "[API:err: 12:00:00] Failed to fetch nodes");
        }
        return completedWith(0, listing);
    }

    megadl::ProcessResult transfers(bool show_completed) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++polls_;
        if (failing_polls > 0) {
            --failing_polls;
            megadl::ProcessResult result;
            result.outcome = megadl::RunOutcome::TimedOut;
            result.error_message = "mega-transfers timed out";
            return result;
        }
        auto &script = show_completed ? completed_states : active_states;
        std::string output = "DESTINYPATH|||STATE|||PROGRESS\n";
        if (script.empty()) {
            return completedWith(0, output);
        }
        const auto state = script.front();
        script.pop_front();
        if (state) {
            const auto path = queued_dest_ / queued_name_;
            if (*state == "COMPLETED") {
                megadl_test::writeFile(path);
            }
            output += path.string() + "|||" + *state + "|||50.00%\n";
        }
        return completedWith(0, output);
    }

    void cancelTransfers() override { log_.add("cancel"); }
    void killServer() override {
        log_.add("kill");
        std::lock_guard<std::mutex> lock(mutex_);
        if (!kill_leftover.empty()) {
            megadl_test::writeFile(queued_dest_ / kill_leftover);
        }
    }
    void restartServer() override { log_.add("restart"); }

private:
    EventLog &log_;
    std::mutex mutex_;
    std::string queued_name_;
    fs::path queued_dest_;
    std::size_t polls_{0};
};

class FakeIpChanger final : public megadl::IpChanger {
public:
    explicit FakeIpChanger(EventLog &log) : log_(log) {}

    bool fails{false};

    void changeIp() override {
        log_.add("change_ip");
        if (fails) {
            throw megadl::ChangeIpError("Failed to change ip with error: router unreachable");
        }
    }

private:
    EventLog &log_;
};

struct Fixture {
    EventLog log;
    FakeAgent agent{log};
    FakeIpChanger ip_changer{log};
    ScratchDir scratch;
    fs::path destination = scratch.makeDir("dest");
    fs::path tmp_parent = scratch.makeDir("tmp");

    megadl::SessionOptions options(const std::string &link = "https://mega.nz/folder/abc#key") const {
        megadl::SessionOptions options;
        options.link = link;
        options.destination = destination;
        options.poll_interval = 0ms;
        options.tmp_parent = tmp_parent;
        options.show_progress = false;
        return options;
    }
};

bool sameEvents(const std::vector<std::string> &actual, const std::vector<std::string> &expected) {
    if (actual == expected) {
        return true;
    }
    std::cerr << "  events:";
    for (const auto &event : actual) {
        std::cerr << " " << event;
    }
    std::cerr << "\n";
    return false;
}

void test_missing_files_only(TestContext &t) {
    Fixture f;
    megadl_test::writeFile(f.destination / "movie1.mkv");
    f.agent.listing = "Films/movie1.mkv (700 MB)\nFilms/movie2.mkv (800 MB)\n";

    fs::path tmp;
    {
        megadl::DownloadSession session(f.agent, f.ip_changer, f.options());
        tmp = session.tmpFolder();
        t.check(fs::is_directory(tmp), "tmp folder exists during the session");
        t.check(tmp.parent_path() == f.tmp_parent, "tmp folder placed under the configured parent");

        const auto report = session.downloadFolder();
        t.check(report.queued == 1, "only movie2 is missing");
        t.check(report.downloaded == 1, "movie2 downloaded");
        t.check(session.phase() == megadl::SessionPhase::LoggedIn, "session back to logged in");
        t.check(megadl_test::countEntries(tmp) == 0, "tmp folder emptied by the move");
    }
    t.check(fs::exists(f.destination / "movie2.mkv"), "movie2 moved to destination");
    t.check(!fs::exists(tmp), "tmp folder removed after the session");
    t.check(f.log.count("logout") == 1, "logged out exactly once");
    t.check(sameEvents(f.log.snapshot(), {"login", "find", "get:'Films/movie2.mkv'", "logout"}),
            "only the missing file is fetched");
}

void test_threshold_rotation(TestContext &t) {
    Fixture f;
    f.agent.listing = "a.mkv (200 MB)\nb.mkv (200 MB)\nc.mkv (200 MB)\nd.mkv (100 MB)\n";
    auto options = f.options();
    options.ip_rotation_threshold_mb = 500.0;

    double cumulative = 0.0;
    {
        megadl::DownloadSession session(f.agent, f.ip_changer, options);
        const auto report = session.downloadFolder();
        t.check(report.downloaded == 4, "all four files downloaded");
        cumulative = session.cumulativeDownloadedMb();
    }
    t.check(sameEvents(f.log.snapshot(),
                       {"login", "find", "get:'a.mkv'", "get:'b.mkv'", "logout", "change_ip",
                        "login", "get:'c.mkv'", "get:'d.mkv'", "logout"}),
            "ip rotated once, right before the third file");
    t.check(cumulative > 299.9 && cumulative < 300.1, "volume counted from the last rotation");
}

void test_quota_retry_while_polling(TestContext &t) {
    Fixture f;
    f.agent.listing = "Big/huge.mkv (2 GB)\n";
    f.agent.active_states = {std::string("ACTIVE"), std::string("RETRYING"), std::string("RETRYING"),
                             std::string("RETRYING")};
    f.agent.completed_states = {std::string("COMPLETED")};

    {
        megadl::DownloadSession session(f.agent, f.ip_changer, f.options());
        const auto report = session.downloadFolder();
        t.check(report.downloaded == 1, "large file downloaded after the retries");
        t.check(session.cumulativeDownloadedMb() > 2047.0, "large file counted after the last restart");
    }
    t.check(sameEvents(f.log.only({"kill", "change_ip", "restart"}),
                       {"kill", "change_ip", "restart", "kill", "change_ip", "restart", "kill",
                        "change_ip", "restart"}),
            "one server restart around an ip change per quota hit");
    t.check(fs::exists(f.destination / "huge.mkv"), "large file moved to destination");
    t.check(f.log.count("get:'Big/huge.mkv'") == 0, "large file never fetched blocking");
}

void test_polling_completing_then_completed(TestContext &t) {
    Fixture f;
    f.agent.listing = "huge.mkv (1500 MB)\n";
    f.agent.completed_states = {std::string("COMPLETING"), std::string("COMPLETED")};
    {
        megadl::DownloadSession session(f.agent, f.ip_changer, f.options());
        const auto report = session.downloadFolder();
        t.check(report.downloaded == 1, "completing is not treated as an end state");
    }
    t.check(fs::exists(f.destination / "huge.mkv"), "file moved after completion");
}

void test_polling_failure_and_timeout(TestContext &t) {
    {
        Fixture f;
        f.agent.listing = "huge.mkv (1500 MB)\n";
        f.agent.completed_states = {std::string("FAILED")};
        megadl::DownloadSession session(f.agent, f.ip_changer, f.options());
        const auto report = session.downloadFolder();
        t.check(report.failed == 1, "failed transfer reported");
        t.check(report.downloaded == 0, "nothing downloaded after a failed transfer");
    }
    {
        Fixture f;
        f.agent.listing = "huge.mkv (1500 MB)\n";
        auto options = f.options();
        options.max_download_time = 0s;
        megadl::DownloadSession session(f.agent, f.ip_changer, options);
        const auto report = session.downloadFolder();
        t.check(report.timed_out == 1, "polling path enforces the time limit");
        t.check(f.log.count("cancel") == 1, "timed out transfer cancelled in the agent");
    }
}

void test_folder_continues_after_failures(TestContext &t) {
    Fixture f;
    f.agent.listing = "a.mkv (10 MB)\nb.mkv (10 MB)\nc.mkv (10 MB)\n";
    ScriptedGet timed_out;
    timed_out.outcome = megadl::RunOutcome::TimedOut;
    timed_out.exit_code = std::nullopt;
    timed_out.partial = true;
    ScriptedGet failed;
    failed.exit_code = 1;
    failed.partial = true;
    f.agent.gets = {timed_out, failed, ScriptedGet{}};

    {
        megadl::DownloadSession session(f.agent, f.ip_changer, f.options());
        const auto report = session.downloadFolder();
        t.check(report.queued == 3, "three files queued");
        t.check(report.timed_out == 1, "first file timed out");
        t.check(report.failed == 1, "second file failed");
        t.check(report.downloaded == 1, "third file still downloaded");
    }
    t.check(f.log.count("cancel") == 1, "timed out transfer cancelled");
    t.check(fs::exists(f.destination / "c.mkv"), "third file moved");
    t.check(megadl_test::countEntries(f.destination) == 1, "partial leftovers never reach the destination");
}

void test_quota_exit_code_rotates(TestContext &t) {
    Fixture f;
    f.agent.listing = "a.mkv (10 MB)\n";
    ScriptedGet quota;
    quota.exit_code = megadl::kQuotaExceededExitCode;
    quota.partial = true;
    f.agent.gets = {quota, ScriptedGet{}};

    {
        megadl::DownloadSession session(f.agent, f.ip_changer, f.options());
        const auto report = session.downloadFolder();
        t.check(report.downloaded == 1, "file downloaded after the rotation");
    }
    t.check(sameEvents(f.log.snapshot(),
                       {"login", "find", "get:'a.mkv'", "logout", "change_ip", "login", "get:'a.mkv'",
                        "logout"}),
            "quota exit code rotates the ip and retries");
    t.check(megadl_test::countEntries(f.destination) == 1, "only the finished file is moved");
}

void test_listing_failure_cleans_up(TestContext &t) {
    Fixture f;
    f.agent.listing_fails = true;
    fs::path tmp;
    {
        megadl::DownloadSession session(f.agent, f.ip_changer, f.options());
        tmp = session.tmpFolder();
        t.checkThrows([&] { (void)session.downloadFolder(); }, "listing failure propagates");
    }
    t.check(!fs::exists(tmp), "tmp folder removed after a listing failure");
    t.check(f.log.count("logout") == 1, "logged out after a listing failure");
}

void test_login_failure_cleans_up(TestContext &t) {
    Fixture f;
    f.agent.login_fails = true;
    t.checkThrows([&] { megadl::DownloadSession session(f.agent, f.ip_changer, f.options()); },
                  "login failure propagates");
    t.check(megadl_test::countEntries(f.tmp_parent) == 0, "tmp folder removed after a login failure");
    t.check(f.log.count("logout") == 1, "logged out once after a login failure");
}

void test_preconditions(TestContext &t) {
    Fixture f;
    auto missing_destination = f.options();
    missing_destination.destination = f.scratch.path() / "nowhere";
    bool raised = false;
    try {
        megadl::DownloadSession session(f.agent, f.ip_changer, missing_destination);
    } catch (const megadl::PreconditionError &) {
        raised = true;
    }
    t.check(raised, "missing destination is a precondition error");

    auto no_link = f.options("");
    t.checkThrows([&] { megadl::DownloadSession session(f.agent, f.ip_changer, no_link); },
                  "empty link rejected");
    t.check(f.log.snapshot().empty(), "nothing is run before the preconditions hold");
    t.check(megadl_test::countEntries(f.tmp_parent) == 0, "no tmp folder left behind");
}

void test_change_ip_failure_propagates(TestContext &t) {
    Fixture f;
    f.agent.listing = "a.mkv (600 MB)\n";
    f.ip_changer.fails = true;
    auto options = f.options();
    options.ip_rotation_threshold_mb = 500.0;

    fs::path tmp;
    bool raised = false;
    {
        megadl::DownloadSession session(f.agent, f.ip_changer, options);
        tmp = session.tmpFolder();
        try {
            (void)session.downloadFolder();
        } catch (const megadl::ChangeIpError &) {
            raised = true;
        }
    }
    t.check(raised, "ip change failure aborts the folder run");
    t.check(f.log.count("get:'a.mkv'") == 0, "no transfer after a failed ip change");
    t.check(f.log.snapshot().back() == "logout", "session still logs out");
    t.check(!fs::exists(tmp), "tmp folder removed after an ip change failure");
}

void test_single_file(TestContext &t) {
    const std::string link = "https://mega.nz/file/XYZ#key";
    {
        Fixture f;
        {
            megadl::DownloadSession session(f.agent, f.ip_changer, f.options(link));
            session.downloadFile();
        }
        t.check(fs::exists(f.destination / "single.bin"), "single file moved to destination");
        t.check(sameEvents(f.log.snapshot(), {"change_ip", "get:" + megadl::shellQuote(link), "logout"}),
                "file link rotates first and needs no login");
    }
    {
        Fixture f;
        ScriptedGet failed;
        failed.exit_code = 1;
        failed.partial = true;
        f.agent.gets = {failed};
        bool raised = false;
        {
            megadl::DownloadSession session(f.agent, f.ip_changer, f.options(link));
            try {
                session.downloadFile();
            } catch (const megadl::DownloadFailure &) {
                raised = true;
            }
        }
        t.check(raised, "failed single file download throws");
        t.check(megadl_test::countEntries(f.destination) == 0, "nothing moved after a failure");
        t.check(f.log.count("logout") == 1, "logged out once after a failure");
    }
    {
        Fixture f;
        ScriptedGet timed_out;
        timed_out.outcome = megadl::RunOutcome::TimedOut;
        timed_out.exit_code = std::nullopt;
        f.agent.gets = {timed_out};
        bool raised = false;
        {
            megadl::DownloadSession session(f.agent, f.ip_changer, f.options(link));
            try {
                session.downloadFile();
            } catch (const megadl::TimeoutError &) {
                raised = true;
            }
        }
        t.check(raised, "timed out single file download throws");
        t.check(f.log.count("cancel") == 1, "timed out transfer cancelled");
    }
}

struct VpnScript {
    std::vector<std::string> calls;
    std::optional<std::int64_t> group{7};
    std::vector<megadl::VpnPeer> peers{{1, "se-sto-wg-001"}, {2, "de-fra-wg-002"}, {3, "nl-ams-wg-003"}};
    std::deque<bool> connected;
};

class FakeVpnApi final : public megadl::VpnRouterApi {
public:
    explicit FakeVpnApi(VpnScript &script) : script_(script) {}

    std::optional<std::int64_t> findGroup(const std::string &provider) override {
        script_.calls.push_back("find_group:" + provider);
        return script_.group;
    }
    std::vector<megadl::VpnPeer> listPeers(std::int64_t) override {
        script_.calls.push_back("list_peers");
        return script_.peers;
    }
    void stop() override { script_.calls.push_back("stop"); }
    void start(std::int64_t group_id, std::int64_t peer_id) override {
        script_.calls.push_back("start:" + std::to_string(group_id) + ":" + std::to_string(peer_id));
    }
    megadl::VpnStatus status() override {
        script_.calls.push_back("status");
        const bool up = script_.connected.empty() ? true : script_.connected.front();
        if (!script_.connected.empty()) {
            script_.connected.pop_front();
        }
        return {up, up ? "185.65.134.1" : ""};
    }

private:
    VpnScript &script_;
};

void test_vpn_peer_rotation(TestContext &t) {
    VpnScript script;
    script.connected = {false, false, true};
    {
        megadl::VpnPeerIpChanger changer(std::make_unique<FakeVpnApi>(script), "Mullvad", 0ms, 42);
        changer.changeIp();

        std::size_t stops = 0;
        std::size_t starts = 0;
        for (const auto &call : script.calls) {
            stops += call == "stop" ? 1 : 0;
            starts += call.rfind("start:7:", 0) == 0 ? 1 : 0;
        }
        t.check(script.calls.front() == "find_group:Mullvad", "provider group looked up first");
        t.check(stops == 3, "vpn stopped before every attempt");
        t.check(starts == 3, "a peer of the group started on every attempt");
        t.check(script.calls.back() == "status", "ends on a connected status");
    }
    t.check(script.calls.back() == "stop", "vpn stopped when the changer is destroyed");
}

void test_vpn_errors(TestContext &t) {
    {
        VpnScript script;
        script.group = std::nullopt;
        megadl::VpnPeerIpChanger changer(std::make_unique<FakeVpnApi>(script), "Nobody", 0ms, 1);
        bool raised = false;
        try {
            changer.changeIp();
        } catch (const megadl::ChangeIpError &ex) {
            raised = std::string(ex.what()).find("Nobody") != std::string::npos;
        }
        t.check(raised, "unknown provider is an ip change error naming it");
    }
    {
        VpnScript script;
        script.peers.clear();
        megadl::VpnPeerIpChanger changer(std::make_unique<FakeVpnApi>(script), "Mullvad", 0ms, 1);
        t.checkThrows([&] { changer.changeIp(); }, "provider without peers is an error");
        t.check(script.calls.back() == "list_peers", "no vpn started without peers");
    }
}

void test_quota_restart_leftovers_stay_out(TestContext &t) {
    Fixture f;
    f.agent.listing = "huge.mkv (2 GB)\n";
    f.agent.kill_leftover = ".getxfer.4242.mega";
    f.agent.active_states = {std::string("RETRYING")};
    f.agent.completed_states = {std::string("COMPLETED")};

    fs::path tmp;
    {
        megadl::DownloadSession session(f.agent, f.ip_changer, f.options());
        tmp = session.tmpFolder();
        const auto report = session.downloadFolder();
        t.check(report.downloaded == 1, "file downloaded after the server restart");
        t.check(megadl_test::countEntries(tmp) == 0, "agent leftovers purged after the move");
    }
    t.check(fs::exists(f.destination / "huge.mkv"), "finished file moved");
    t.check(!fs::exists(f.destination / ".getxfer.4242.mega"), "unfinished agent file kept out of the destination");
    t.check(megadl_test::countEntries(f.destination) == 1, "destination holds only the finished file");
}

void test_status_poll_failures_are_retried(TestContext &t) {
    Fixture f;
    f.agent.listing = "huge.mkv (1500 MB)\n";
    f.agent.failing_polls = 2;
    f.agent.active_states = {std::string("ACTIVE")};
    f.agent.completed_states = {std::string("COMPLETED")};
    {
        megadl::DownloadSession session(f.agent, f.ip_changer, f.options());
        const auto report = session.downloadFolder();
        t.check(report.downloaded == 1, "unreadable status polls do not fail the transfer");
        t.check(report.failed == 0, "no failure recorded for unreadable polls");
    }
    t.check(f.log.count("cancel") == 0, "nothing cancelled for a finished transfer");
    t.check(fs::exists(f.destination / "huge.mkv"), "file moved once completed");
}

void test_polling_failure_cancels_transfer(TestContext &t) {
    Fixture f;
    f.agent.listing = "huge.mkv (1500 MB)\n";
    f.agent.completed_states = {std::nullopt};
    {
        megadl::DownloadSession session(f.agent, f.ip_changer, f.options());
        const auto report = session.downloadFolder();
        t.check(report.failed == 1, "vanished transfer counts as failed");
    }
    t.check(f.log.count("cancel") == 1, "failed polled transfer cancelled in the agent");
}

void test_reporter_stops_after_record_vanishes(TestContext &t) {
    EventLog log;
    FakeAgent agent(log);
    ScratchDir scratch;
    const auto tmp = scratch.makeDir("tmp");
    (void)agent.queueGet("'movie.mkv'", tmp);
    agent.active_states = {std::nullopt, std::string("ACTIVE"), std::string("ACTIVE"), std::nullopt};

    megadl::ProgressReporter reporter(agent, "movie.mkv", tmp, 100.0, 5ms);
    reporter.start();
    std::this_thread::sleep_for(500ms);
    const auto polls = agent.polls();
    t.check(polls == 4, "reporter stops polling once the seen record is gone");
    std::this_thread::sleep_for(100ms);
    t.check(agent.polls() == polls, "no polls after the reporter ended");
    reporter.stop();
}

void test_reporter_stop_joins_without_record(TestContext &t) {
    EventLog log;
    FakeAgent agent(log);
    ScratchDir scratch;
    const auto tmp = scratch.makeDir("tmp");
    agent.failing_polls = 1;

    megadl::ProgressReporter reporter(agent, "movie.mkv", tmp, 100.0, 5ms);
    reporter.start();
    std::this_thread::sleep_for(100ms);
    t.check(agent.polls() > 2, "reporter keeps polling while the record has not appeared");
    reporter.stop();
    const auto polls = agent.polls();
    std::this_thread::sleep_for(50ms);
    t.check(agent.polls() == polls, "stop joins the polling thread");
}

void test_reporter_around_blocking_transfer(TestContext &t) {
    Fixture f;
    f.agent.listing = "a.mkv (10 MB)\nb.mkv (10 MB)\n";
    auto options = f.options();
    options.show_progress = true;
    options.progress_period = 5ms;
    {
        megadl::DownloadSession session(f.agent, f.ip_changer, options);
        const auto report = session.downloadFolder();
        t.check(report.downloaded == 2, "downloads finish with the reporter running");
    }
    const auto polls = f.agent.polls();
    std::this_thread::sleep_for(50ms);
    t.check(f.agent.polls() == polls, "reporter joined after each transfer");
}

void test_stale_session(TestContext &t) {
    {
        EventLog log;
        FakeAgent agent(log);
        t.check(megadl::clearStaleSession(agent, false), "no session, nothing to clear");
        t.check(log.snapshot().empty(), "no logout without a session");
    }
    {
        EventLog log;
        FakeAgent agent(log);
        agent.logged_in = true;
        t.check(!megadl::clearStaleSession(agent, false), "active session blocks the run");
        t.check(log.count("logout") == 0, "session left alone without force");
    }
    {
        EventLog log;
        FakeAgent agent(log);
        agent.logged_in = true;
        t.check(megadl::clearStaleSession(agent, true), "forced logout clears the session");
        t.check(log.count("logout") == 1, "forced logout issued");
    }
    {
        EventLog log;
        FakeAgent agent(log);
        agent.logged_in = true;
        agent.logout_succeeds = false;
        t.check(!megadl::clearStaleSession(agent, true), "failed forced logout blocks the run");
    }
}

} // namespace

int main() {
    TestContext t;
    test_missing_files_only(t);
    test_threshold_rotation(t);
    test_quota_retry_while_polling(t);
    test_polling_completing_then_completed(t);
    test_polling_failure_and_timeout(t);
    test_folder_continues_after_failures(t);
    test_quota_exit_code_rotates(t);
    test_listing_failure_cleans_up(t);
    test_login_failure_cleans_up(t);
    test_preconditions(t);
    test_change_ip_failure_propagates(t);
    test_single_file(t);
    test_vpn_peer_rotation(t);
    test_vpn_errors(t);
    test_quota_restart_leftovers_stay_out(t);
    test_status_poll_failures_are_retried(t);
    test_polling_failure_cancels_transfer(t);
    test_reporter_stops_after_record_vanishes(t);
    test_reporter_stop_joins_without_record(t);
    test_reporter_around_blocking_transfer(t);
    test_stale_session(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] megadl_session_tests\n";
    return EXIT_SUCCESS;
}
