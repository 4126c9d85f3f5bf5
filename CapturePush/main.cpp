#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <time.h>
#include <sqlite3.h>

#include <curl/curl.h>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "optionparser.h"

#include "capturepush/capture_utils.hpp"
#include "capturepush/channel_factory.hpp"
#include "capturepush/channels/email_channel.hpp"
#include "capturepush/constants.hpp"
#include "capturepush/generic_exception.hpp"
#include "capturepush/models/app_config.hpp"
#include "capturepush/notification_dispatcher.hpp"
#include "capturepush/orchestrator.hpp"
#include "capturepush/plugin_exception.hpp"
#include "capturepush/plugin_registry.hpp"
#include "capturepush/plugin_transport.hpp"
#include "capturepush/schedule_linearizer.hpp"
#include "capturepush/spd_log_extensions.hpp"
#include "capturepush/state_store.hpp"
#include "capturepush/sync_exception.hpp"
#include "capturepush/thread_utils.hpp"

using option::Option;
using option::Descriptor;
using option::Parser;
using option::Stats;
using option::ArgStatus;

struct CArg: public option::Arg
{
    static ArgStatus Required(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_ILLEGAL : option::ARG_OK;
    }
    static ArgStatus Optional(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_IGNORE : option::ARG_OK;
    }
};

#define USAGE_STRING "USAGE: CONFIG_DIR_PATH=/path capturepush [options]\n\nOptions:"

enum  optionIndex { UNKNOWN, HELP, CONFIG, MODE, CODE, ORPHAN, VERBOSE };
const option::Descriptor usage[] =
{
    {UNKNOWN, 0,"" , "",        CArg::None,      USAGE_STRING },
    {HELP,    0,"" , "help",    CArg::None,      "  --help  \tPrint usage and exit." },
    {CONFIG,  0,"c", "config",  CArg::Optional,  "  --config, -c  \tConfiguration JSON. Read from the first line of stdin when omitted." },
    {MODE,    0,"m", "mode",    CArg::Required,  "  --mode, -m  \tRequired: sync, once, plugins, install, update or linearize." },
    {CODE,    0,"s", "code",    CArg::Optional,  "  --code, -s  \tInstitution code for install and update." },
    {ORPHAN,  0,"o", "orphan",  CArg::None,      "  --orphan, -o  \tOptional: allow the process to run without a parent bound to stdin." },
    {VERBOSE, 0,"v", "verbose", CArg::None,      "  --verbose, -v  \tOptional: log at debug level." },
    {0,0,0,0,0,0}
};

static void printJSON(const nlohmann::json & json) {
    std::cout << json.dump() << "\n";
    std::cout.flush();
}

static std::shared_ptr<AppConfig> loadConfig(option::Option * options, bool allowStdin) {
    nlohmann::json json = nlohmann::json::object();
    if (options[CONFIG].count() > 0 && options[CONFIG].arg) {
        json = nlohmann::json::parse(options[CONFIG].arg);
    } else if (allowStdin) {
        std::string inputLine;
        std::getline(std::cin, inputLine);
        json = nlohmann::json::parse(inputLine);
    }
    auto config = std::make_shared<AppConfig>(json);
    if (!config->valid()) {
        nlohmann::json errors = config->errors();
        throw GenericException("invalid configuration: " + errors.dump());
    }
    return config;
}

static std::string requireCode(option::Option * options) {
    if (options[CODE].count() == 0 || options[CODE].arg == nullptr || std::string(options[CODE].arg) == "") {
        throw GenericException("--code is required for this mode");
    }
    return options[CODE].arg;
}

void runListenOnMainThread(Orchestrator & orchestrator, std::shared_ptr<NotificationDispatcher> dispatcher, std::shared_ptr<spdlog::logger> logger) {
    time_t lostCINAt = 0;

    while (true) {
        std::string line;
        std::getline(std::cin, line);

        // If cin is disconnected for more than 30 seconds, it means we have
        // been orphaned and we should exit.
        if (std::cin.good()) {
            lostCINAt = 0;
        } else {
            if (lostCINAt == 0) {
                lostCINAt = time(0);
            }
            if (time(0) - lostCINAt > 30) {
                orchestrator.stop();
                std::exit(141);
            }
            std::cin.clear();
            std::this_thread::sleep_for(std::chrono::milliseconds(1000));
            continue;
        }
        if (line == "") {
            continue;
        }

        nlohmann::json packet;
        try {
            packet = nlohmann::json::parse(line);
        } catch (nlohmann::json::exception & ex) {
            nlohmann::json resp = {{"error", ex.what()}};
            logger->error(resp.dump());
            printJSON(resp);
            continue;
        }

        std::string type = packet.value("type", "");

        if (type == "run-now") {
            nlohmann::json results = nlohmann::json::array();
            for (const auto & result : orchestrator.runOnce()) {
                results.push_back(result.toJSON());
            }
            printJSON({{"type", "cycle-results"}, {"results", results}});
        }

        if (type == "set-channel-enabled") {
            bool ok = dispatcher->setEnabled(packet.value("name", ""), packet.value("enabled", true));
            printJSON({{"type", "channel"}, {"name", packet.value("name", "")}, {"ok", ok}});
        }

        if (type == "test-channels") {
            printJSON({{"type", "deliveries"}, {"deliveries", dispatcher->dispatch("CapturePush test", "Notification channels are configured correctly.")}});
        }

        if (type == "shutdown") {
            orchestrator.stop();
            return;
        }
    }
}

int main(int argc, const char * argv[]) {
    SetThreadName("main");

    // indicate we use cout, not stdout
    std::cout.sync_with_stdio(false);

    // parse launch arguments, skip program name argv[0] if present
    argc-=(argc>0); argv+=(argc>0);
    option::Stats  stats(usage, argc, argv);
    option::Option options[20], buffer[20];
    option::Parser parse(usage, argc, argv, options, buffer);

    if (parse.error())
        return 1;

    if (options[HELP] || argc == 0 || !options[MODE]) {
        option::printUsage(std::cout, usage);
        return 1;
    }

    // check required environment
    std::string eConfigDirPath = CaptureUtils::getEnvUTF8("CONFIG_DIR_PATH");
    if (eConfigDirPath == "") {
        option::printUsage(std::cout, usage);
        return 1;
    }

    // keep SQLite temp files next to the rest of our data
    sqlite3_temp_directory = sqlite3_mprintf("%s", eConfigDirPath.c_str());

    std::string mode(options[MODE].arg);

    // When attached to a parent process, or when stdout carries a JSON result,
    // log to a rotating file. Orphaned sync processes log to the console.
    bool console = options[ORPHAN] && mode == "sync";
    auto logger = CreateCaptureLogger("logger", eConfigDirPath + FS_PATH_SEP + "capturepush.log", console, options[VERBOSE].count() > 0);

    // setup curl
    curl_global_init(CURL_GLOBAL_ALL);

    try {
        bool needsAccounts = (mode == "sync" || mode == "once" || mode == "linearize");
        auto config = loadConfig(options, needsAccounts);

        auto transport = std::make_shared<CurlPluginTransport>();
        auto registry = std::make_shared<PluginRegistry>(eConfigDirPath + FS_PATH_SEP + "plugins", config->pluginIndexUrl, transport, logger);

        if (mode == "plugins") {
            nlohmann::json available = nlohmann::json::array();
            for (const auto & d : registry->listAvailable(true)) {
                nlohmann::json j = d.toJSON();
                j["installed_version"] = registry->installedVersion(d.code);
                available.push_back(j);
            }
            nlohmann::json installed = nlohmann::json::array();
            for (const auto & d : registry->listInstalled()) {
                installed.push_back(d.toJSON());
            }
            printJSON({{"available", available}, {"installed", installed}});
            return 0;
        }

        if (mode == "install") {
            printJSON({{"installed", registry->install(requireCode(options)).toJSON()}});
            return 0;
        }

        if (mode == "update") {
            std::string code = requireCode(options);
            bool updated = registry->updateIfNewer(code);
            printJSON({{"code", code}, {"updated", updated}, {"version", registry->installedVersion(code)}});
            return 0;
        }

        auto store = std::make_shared<StateStore>(eConfigDirPath + FS_PATH_SEP + "state", logger);

        if (mode == "linearize") {
            ScheduleLinearizer linearizer(config->semesterWeeks, config->firstMonday);
            nlohmann::json result = nlohmann::json::object();
            for (const auto & account : config->accounts) {
                auto snapshot = store->load(account.accountKey(), RECORD_KIND_SCHEDULE);
                result[account.accountKey()] = snapshot ? linearizer.linearize(*snapshot, time(0)) : nlohmann::json(nullptr);
            }
            printJSON(result);
            return 0;
        }

        if (mode != "sync" && mode != "once") {
            throw GenericException("unknown mode: " + mode);
        }

        auto dispatcher = std::make_shared<NotificationDispatcher>(logger, std::chrono::seconds(config->dispatchTimeout));
        auto channels = std::make_shared<ChannelFactory>(logger, config->dispatchTimeout);
        channels->registerType("email", [logger, config](const ChannelConfig & c) {
            return std::make_shared<EmailChannel>(
                ChannelFactory::requireParameter(c, "smtp_server"),
                (int)ChannelFactory::integerParameter(c, "smtp_port", 465, 1, 65535),
                ChannelFactory::requireParameter(c, "sender"),
                ChannelFactory::requireParameter(c, "auth_code"),
                ChannelFactory::requireParameter(c, "receiver"),
                (long)config->dispatchTimeout,
                logger);
        });

        AppContext ctx{config, logger, registry, store, dispatcher, channels};
        Orchestrator orchestrator(ctx);

        if (mode == "once") {
            nlohmann::json results = nlohmann::json::array();
            for (const auto & result : orchestrator.runOnce()) {
                results.push_back(result.toJSON());
            }
            orchestrator.stop();
            printJSON({{"results", results}, {"skipped", orchestrator.skippedAccounts()}});
            return 0;
        }

        logger->info("------------- Starting CapturePush ({} account(s)) ---------------", config->accounts.size());
        orchestrator.start();

        if (!options[ORPHAN]) {
            runListenOnMainThread(orchestrator, dispatcher, logger);
        } else {
            while (true) {
                std::this_thread::sleep_for(std::chrono::hours(24)); // will block forever.
            }
        }

    } catch (PluginException & ex) {
        logger->error("Plugin error: {}", ex.toJSON().dump());
        printJSON({{"error", ex.toJSON()}});
        return 1;
    } catch (SyncException & ex) {
        logger->error("Network error: {}", ex.toJSON().dump());
        printJSON({{"error", ex.toJSON()}});
        return 1;
    } catch (GenericException & ex) {
        logger->error("Error: {}", ex.what());
        printJSON({{"error", ex.toJSON()}});
        return 1;
    } catch (nlohmann::json::exception & ex) {
        logger->error("Invalid JSON: {}", ex.what());
        printJSON({{"error", ex.what()}});
        return 1;
    } catch (SQLite::Exception & ex) {
        logger->error("Database error: {}", ex.what());
        printJSON({{"error", ex.what()}});
        return 1;
    }

    return 0;
}
