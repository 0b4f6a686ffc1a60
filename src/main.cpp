#include "Challenge/ChallengeLoader.hpp"
#include "Challenge/ChallengeOrchestrator.hpp"
#include "Challenge/ChallengeScheduler.hpp"
#include "Challenge/SessionStore.hpp"
#include "Core/config/LabConfig.hpp"
#include "Remote/ssh/SshExecutor.hpp"
#include "Storage/RocksDbStore.hpp"
#include "Utils/Exception.hpp"
#include "Utils/Logger.hpp"
#include "Utils/PathUtils.hpp"
#include "Virtualization/vmm/HypervisorSession.hpp"
#include <boost/algorithm/string/join.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <fmt/format.h>

namespace po = boost::program_options;
namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

constexpr const char* kDefaultConfig = "~/.config/practicelab/config.yaml";

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Cli {
    LabConfig config;
    std::string vm;
    std::vector<std::string> args;
    po::variables_map options;

    [[nodiscard]] const std::string& arg(std::size_t i, const char* what) const {
        if (i >= args.size()) throw UsageError(fmt::format("missing argument: {}", what));
        return args[i];
    }
    [[nodiscard]] bool flag(const char* name) const { return options.count(name) > 0; }
};

void printUsage(const po::options_description& opts) {
    std::cout << "Usage: practicelab [options] <command> [args]\n\n"
                 "Commands:\n"
                 "  vms                                list VMs known to the hypervisor\n"
                 "  snapshot list                      list snapshots of --vm\n"
                 "  snapshot create <name>             external disk-only snapshot\n"
                 "  snapshot revert <name>\n"
                 "  snapshot delete <name>             remove metadata, keep overlay files\n"
                 "  challenge list                     challenges in the challenge directory\n"
                 "  challenge validate <file>          check a challenge definition\n"
                 "  challenge run <id|file>            run a challenge against --vm\n"
                 "  challenge continue <session>       validate a suspended session\n"
                 "  challenge cancel <session>         clean up a suspended session\n"
                 "  exec <command>                     run one SSH command on --vm\n\n"
              << opts << "\n";
}

LabConfig loadConfig(const po::variables_map& vm) {
    LabConfig cfg;
    if (vm.count("config")) {
        cfg = LabConfig::fromFile(PathUtils::expandUser(vm["config"].as<std::string>()));
    } else if (const auto path = PathUtils::expandUser(kDefaultConfig); fs::exists(path)) {
        cfg = LabConfig::fromFile(path);
    }

    if (vm.count("uri")) cfg.hypervisor.uri = vm["uri"].as<std::string>();
    if (vm.count("user")) cfg.ssh.user = vm["user"].as<std::string>();
    if (vm.count("key")) cfg.ssh.keyPath = vm["key"].as<std::string>();
    if (vm.count("verbose")) cfg.logging.console_level = BoostLogger::Level::Debug;
    cfg.validate();
    return cfg;
}

std::unique_ptr<HypervisorSession> openHypervisor(const Cli& cli) {
    return HypervisorSession::connect(cli.config.hypervisor.uri, cli.config.hypervisor.shutdownTimeout);
}

std::shared_ptr<RocksDbStore> openStore(const Cli& cli) {
    auto db = std::make_shared<RocksDbStore>();
    const auto path = PathUtils::expandUser(cli.config.sessionStorePath);
    if (auto opened = db->Open(path.string()); !opened) {
        throw LabException(ErrorKind::Connection, "cannot open session store " + path.string() + ": " + opened.error().ToString());
    }
    return db;
}

std::string formatTime(std::int64_t epoch) {
    const std::time_t t = static_cast<std::time_t>(epoch);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

// يقبل معرف التحدي أو مسار ملف
ChallengeDefinition resolveChallenge(const Cli& cli, const std::string& ref) {
    if (fs::is_regular_file(ref)) {
        return ChallengeLoader::fromFile(ref);
    }
    const auto all = ChallengeLoader::loadDirectory(cli.config.challengesDirectory);
    if (auto it = all.find(ref); it != all.end()) {
        return it->second;
    }
    throw NotFoundError(fmt::format("challenge '{}' not found in {}", ref, cli.config.challengesDirectory));
}

ChallengeDefinition definitionFor(const Cli& cli, const ChallengeSession& session) {
    if (!session.challengeSource.empty() && fs::is_regular_file(session.challengeSource)) {
        return ChallengeLoader::fromFile(session.challengeSource);
    }
    return resolveChallenge(cli, session.challengeId);
}

std::unique_ptr<ChallengeOrchestrator> makeOrchestrator(const Cli& cli) {
    const auto shutdown = cli.config.hypervisor.shutdownTimeout;
    HypervisorSessionFactory factory = [shutdown](const std::string& uri) -> std::unique_ptr<IHypervisorSession> {
        return HypervisorSession::connect(uri, shutdown);
    };
    return std::make_unique<ChallengeOrchestrator>(std::move(factory),
                                                   std::make_shared<SshExecutor>(cli.config.ssh.connectTimeout),
                                                   OrchestratorSettings::fromConfig(cli.config));
}

void printReport(const ChallengeSession& session) {
    std::cout << session.summary() << "\n";
    for (const auto& step : session.validationResults) {
        fmt::print("  [{}] {} {}\n", step.passed ? "PASS" : "FAIL", step.kind,
                   step.description.empty() ? step.command : step.description);
        if (!step.passed) fmt::print("         {}\n", step.reason);
    }
    if (session.cleanup) {
        if (session.cleanup->snapshotKept && session.snapshot) {
            fmt::print("Snapshot kept: {}\n", session.snapshot->name);
        }
        if (!session.cleanup->deleteMessage.empty()) fmt::print("{}\n", session.cleanup->deleteMessage);
        for (const auto& w : session.cleanup->warnings) fmt::print("warning: {}\n", w);
    }
    if (session.report) {
        fmt::print("Steps: {}/{}  Time: {:.1f}s\n", session.report->stepsCompleted, session.report->totalSteps,
                   session.report->executionTimeSeconds);
    }
}

// يشغل الجلسة على المجدول ويلغيها عند SIGINT/SIGTERM
ChallengeSession runScheduled(const Cli& cli, ChallengeSession session, const ChallengeDefinition& def) {
    boost::asio::io_context io;
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    ChallengeScheduler scheduler([&cli] { return makeOrchestrator(cli); }, 1);

    const auto id = session.id;
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        BoostLogger::Warn("Signal {} received, cancelling session {}", signo, id);
        scheduler.cancel(id);
    });

    std::mutex resultMutex;
    ChallengeSession result = session;
    scheduler.submit(std::move(session), def, [&](const ChallengeSession& finished) {
        {
            std::lock_guard lock(resultMutex);
            result = finished;
        }
        boost::asio::post(io, [&signals] { signals.cancel(); });
    });

    io.run();
    scheduler.waitIdle();
    std::lock_guard lock(resultMutex);
    return result;
}

int finishSession(const Cli& cli, const ChallengeSession& session) {
    auto store = SessionStore(openStore(cli));
    if (session.isSuspended()) {
        if (auto saved = store.save(session); !saved) {
            throw LabException(ErrorKind::Connection, saved.error());
        }
        std::cout << session.summary() << "\n";
        fmt::print("Make your changes on '{}', then run: practicelab challenge continue {}\n", session.vmName, session.id);
        return kExitOk;
    }
    if (auto removed = store.remove(session.id); !removed) {
        BoostLogger::Warn("{}", removed.error());
    }
    printReport(session);
    return session.report && session.report->success ? kExitOk : kExitFailed;
}

int cmdVms(Cli& cli) {
    auto hv = openHypervisor(cli);
    fmt::print("{:<32} {:<10} {}\n", "NAME", "STATUS", "IP");
    for (const auto& vm : hv->listVMs()) {
        fmt::print("{:<32} {:<10} {}\n", vm.name, toString(vm.status), vm.ip);
    }
    return kExitOk;
}

int cmdSnapshot(Cli& cli) {
    const auto& action = cli.arg(0, "snapshot action");
    auto hv = openHypervisor(cli);
    auto& snapshots = hv->snapshots();

    if (action == "list") {
        fmt::print("{:<40} {:<20} {:<9} {}\n", "NAME", "CREATED", "KIND", "DESCRIPTION");
        for (const auto& s : snapshots.list(cli.vm)) {
            fmt::print("{:<40} {:<20} {:<9} {}\n", s.name, formatTime(s.creationTime),
                       SnapshotDescriptor::toString(s.kind), s.description);
        }
        return kExitOk;
    }
    if (action == "create") {
        const auto& name = cli.arg(1, "snapshot name");
        const auto description = cli.options.count("description") ? cli.options["description"].as<std::string>()
                                                                     : std::string("created by practicelab");
        const auto info = snapshots.createExternal(cli.vm, name, description, cli.config.snapshot.freezeFs);
        fmt::print("Created snapshot '{}' ({})\n", info.name, boost::algorithm::join(info.diskFiles, ", "));
        return kExitOk;
    }
    if (action == "revert") {
        snapshots.revert(cli.vm, cli.arg(1, "snapshot name"));
        fmt::print("Reverted '{}' to '{}'\n", cli.vm, cli.args[1]);
        return kExitOk;
    }
    if (action == "delete") {
        const auto outcome = snapshots.remove(cli.vm, cli.arg(1, "snapshot name"));
        fmt::print("{}\n", outcome.message);
        return kExitOk;
    }
    throw UsageError("unknown snapshot action '" + action + "'");
}

int cmdChallenge(Cli& cli) {
    const auto& action = cli.arg(0, "challenge action");

    if (action == "list") {
        const auto all = ChallengeLoader::loadDirectory(cli.config.challengesDirectory);
        fmt::print("{:<28} {:<12} {:>5}  {}\n", "ID", "DIFFICULTY", "SCORE", "NAME");
        for (const auto& [id, def] : all) {
            fmt::print("{:<28} {:<12} {:>5}  {}\n", id, def.difficulty, def.score, def.name);
        }
        return kExitOk;
    }
    if (action == "validate") {
        const auto def = ChallengeLoader::fromFile(cli.arg(1, "challenge file"));
        fmt::print("OK: '{}' ({} setup steps, {} validation steps)\n", def.id, def.setup.size(), def.validation.size());
        return kExitOk;
    }
    if (action == "run") {
        const auto def = resolveChallenge(cli, cli.arg(1, "challenge id or file"));
        RunOptions options;
        options.simulate = cli.flag("simulate") || def.simulate;
        options.keepSnapshot = cli.flag("keep-snapshot") || def.keepSnapshot;

        auto session = makeOrchestrator(cli)->createSession(def, cli.vm, options);
        return finishSession(cli, runScheduled(cli, std::move(session), def));
    }
    if (action == "continue" || action == "cancel") {
        SessionStore store(openStore(cli));
        auto loaded = store.load(cli.arg(1, "session id"));
        if (!loaded) throw NotFoundError(loaded.error());
        auto session = std::move(*loaded);
        const auto def = definitionFor(cli, session);

        if (action == "continue") {
            return finishSession(cli, runScheduled(cli, std::move(session), def));
        }
        makeOrchestrator(cli)->cancel(session, def);
        finishSession(cli, session);
        return kExitOk;
    }
    throw UsageError("unknown challenge action '" + action + "'");
}

int cmdExec(Cli& cli) {
    if (cli.args.empty()) throw UsageError("missing argument: command");
    const auto command = boost::algorithm::join(cli.args, " ");

    std::string ip;
    {
        auto hv = openHypervisor(cli);
        auto found = hv->getIP(cli.vm);
        if (!found) throw NotFoundError(fmt::format("no IPv4 address known for '{}'", cli.vm));
        ip = *found;
    }

    SshExecutor ssh(cli.config.ssh.connectTimeout);
    const SshTarget target{ip, cli.config.ssh.user, cli.config.ssh.keyPath, cli.config.ssh.port};
    const auto result = ssh.runCommand(target, command, cli.config.ssh.commandTimeout, std::nullopt);
    std::cout << result.stdoutText;
    std::cerr << result.stderrText;
    if (result.error) {
        std::cerr << "ssh " << toString(result.error->kind) << " error: " << result.error->message << "\n";
        return kExitFailed;
    }
    return *result.exitCode == 0 ? kExitOk : kExitFailed;
}

} // namespace

int main(int argc, char* argv[]) {
    po::options_description general("Options");
    general.add_options()
        ("help,h", "show this help")
        ("config,c", po::value<std::string>(), "YAML configuration file")
        ("uri", po::value<std::string>(), "hypervisor URI")
        ("vm", po::value<std::string>(), "target VM name")
        ("user,u", po::value<std::string>(), "SSH user on the guest")
        ("key,k", po::value<std::string>(), "SSH private key")
        ("simulate", "run the challenge's simulated user action")
        ("keep-snapshot", "keep the pre-challenge snapshot")
        ("description,d", po::value<std::string>(), "snapshot description")
        ("verbose,v", "debug output on the console");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>())
        ("args", po::value<std::vector<std::string>>());

    po::options_description all;
    all.add(general).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    Cli cli;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), cli.options);
        po::notify(cli.options);
    } catch (const po::error& e) {
        std::cerr << "practicelab: " << e.what() << "\n";
        printUsage(general);
        return kExitUsage;
    }

    if (cli.options.count("help")) {
        printUsage(general);
        return kExitOk;
    }
    if (!cli.options.count("command")) {
        printUsage(general);
        return kExitUsage;
    }

    const std::map<std::string, std::function<int(Cli&)>> commands{
        {"vms", cmdVms},
        {"snapshot", cmdSnapshot},
        {"challenge", cmdChallenge},
        {"exec", cmdExec},
    };
    const auto command = cli.options["command"].as<std::string>();
    const auto handler = commands.find(command);
    if (handler == commands.end()) {
        std::cerr << "practicelab: unknown command '" << command << "'\n";
        printUsage(general);
        return kExitUsage;
    }
    if (cli.options.count("args")) {
        cli.args = cli.options["args"].as<std::vector<std::string>>();
    }

    try {
        cli.config = loadConfig(cli.options);
        BoostLogger::Init(cli.config.logging);
        cli.vm = cli.options.count("vm") ? cli.options["vm"].as<std::string>() : cli.config.hypervisor.defaultVm;
        return handler->second(cli);
    } catch (const UsageError& e) {
        std::cerr << "practicelab: " << e.what() << "\n";
        return kExitUsage;
    } catch (const LabException& e) {
        BoostLogger::Error("{}", e.what());
        std::cerr << "practicelab: " << e.what() << "\n";
        return kExitFailed;
    } catch (const std::exception& e) {
        BoostLogger::Critical("{}", e.what());
        std::cerr << "practicelab: " << e.what() << "\n";
        return kExitFailed;
    }
}
