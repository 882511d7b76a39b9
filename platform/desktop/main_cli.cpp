/**
 * @file main_cli.cpp
 * @brief Command-line daemon for the work-session tracking engine
 *
 * Runs the tracking engine against one of three transition sources:
 * - a broker connection (headless or interactive),
 * - the keyboard only (interactive, manual clock in/out),
 * - a JSON-lines replay file driven by a simulated clock.
 *
 * @note Supports configuration via TOML files and environment variables
 * @note Includes signal handling for graceful shutdown
 */

#include "TomlConfig.hpp"
#include "core/Errors.hpp"
#include "core/IClock.hpp"
#include "core/IRng.hpp"
#include "core/JsonCodec.hpp"
#include "core/adapters/InMemoryTrackingStore.hpp"
#include "core/adapters/JsonFileTrackingStore.hpp"
#include "core/adapters/MqttLocationProvider.hpp"
#include "core/adapters/MqttNotificationDispatcher.hpp"
#include "core/domain/EventBus.hpp"
#include "core/domain/HoursCalculator.hpp"
#include "core/domain/SiteRegistry.hpp"
#include "core/domain/TrackingEngine.hpp"
#include "core/sim/MockLocationProvider.hpp"
#include "core/sim/SimulatedClock.hpp"
#include "crypto/AuditSigner.hpp"
#include "net/mqtt/PahoMqttClient.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <signal.h>
#include <sstream>
#include <thread>

using namespace worktrack;

/// Global flag for graceful shutdown coordination
static volatile bool g_running = true;

namespace {

constexpr std::size_t kHistoryLimit = 10;

void signalHandler(int signal) {
    std::cout << "\nReceived signal " << signal << ", shutting down..." << std::endl;
    g_running = false;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config [file]    Configuration file (default: worktrack.toml)\n"
              << "  --replay [file]    Feed a JSON-lines transition file through the engine\n"
              << "  --headless         Run without user interaction (requires [mqtt] host)\n"
              << "  --help             Show this help message\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [tracking]\n"
              << "  cooldown_seconds = 10\n"
              << "  verification_offsets_minutes = [1, 3, 5]\n"
              << "  [store]\n"
              << "  path = \"worktrack.json\"\n"
              << "  [mqtt]\n"
              << "  host = \"localhost\"\n"
              << "  device_id = \"phone-1\"\n"
              << "  [[sites]]\n"
              << "  id = \"office\"\n"
              << "  name = \"Head Office\"\n"
              << "  latitude = -26.2041\n"
              << "  longitude = 28.0473\n"
              << "  radius_meters = 150\n"
              << "\nReplay lines:\n"
              << "  {\"siteId\":\"office\",\"eventType\":\"enter\",\"timestamp\":\"2025-03-03T08:00:00Z\",\"accuracy\":20}\n"
              << "  {\"kind\":\"position\",\"latitude\":-26.21,\"longitude\":28.05,\"accuracy\":15,\"timestamp\":\"...\"}\n"
              << std::endl;
}

/**
 * @brief Safe environment variable getter for Windows
 * @return Environment variable value or empty string if not found
 */
std::string safeGetEnv(const char* name) {
#ifdef _WIN32
    char* buffer = nullptr;
    size_t size = 0;
    if (_dupenv_s(&buffer, &size, name) == 0 && buffer != nullptr) {
        std::string result(buffer);
        free(buffer);
        return result;
    }
    return "";
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : "";
#endif
}

void applyEnvOverrides(AppConfig& config) {
    std::string storePath = safeGetEnv("WORKTRACK_STORE");
    std::string mqttHost = safeGetEnv("WORKTRACK_MQTT_HOST");
    std::string deviceId = safeGetEnv("WORKTRACK_DEVICE_ID");

    if (!storePath.empty()) config.store.path = storePath;
    if (!mqttHost.empty()) config.mqtt.host = mqttHost;
    if (!deviceId.empty()) config.mqtt.deviceId = deviceId;
}

/// Prints notifications when no broker is attached
class ConsoleNotificationDispatcher : public ports::INotificationDispatcher {
public:
    void notify(ports::NotificationKind kind, const std::string& siteId, const std::string& summary) override {
        std::cout << "[Notify] " << ports::notificationKindToString(kind) << " (" << siteId << "): "
                  << summary << std::endl;
    }
};

std::shared_ptr<ports::ITrackingStore> openStore(const StoreSettings& settings) {
    if (settings.path.empty()) {
        std::cout << "[Store] No store path configured, sessions are kept in memory" << std::endl;
        return std::make_shared<adapters::InMemoryTrackingStore>();
    }

    std::shared_ptr<AuditSigner> signer;
    if (!settings.auditKeyBase64.empty()) {
        signer = std::make_shared<AuditSigner>(settings.auditKeyBase64);
    }

    auto store = std::make_shared<adapters::JsonFileTrackingStore>(settings.path, signer);
    if (signer) {
        auto report = store->verifyAuditChain();
        if (!report.intact) {
            std::cerr << "[Store] Audit chain broken at event "
                      << report.firstBrokenEventId.value_or("?") << std::endl;
        } else {
            std::cout << "[Store] Audit chain intact (" << report.verified << " events)" << std::endl;
        }
    }
    return store;
}

/// Configured sites are upserted so the file stays authoritative across restarts
void seedSites(domain::SiteRegistry& registry, const AppConfig& config) {
    for (const auto& entry : config.sites) {
        Site site;
        site.id = entry.id;
        site.name = entry.name;
        site.latitude = entry.latitude;
        site.longitude = entry.longitude;
        site.radiusMeters = entry.radiusMeters > 0.0 ? entry.radiusMeters
                                                     : config.tracking.defaultRadiusMeters;
        site.active = entry.active;

        try {
            registry.defineSite(site);
        } catch (const InvalidSiteError& e) {
            std::cerr << "[Sites] Skipping site '" << entry.id << "': " << e.what() << std::endl;
        }
    }
}

void subscribeChangeLog(ports::IEventBus& bus) {
    auto logChange = [](const ports::TrackingChange& change) {
        std::cout << "[EventBus] " << formatIso8601(change.at) << " "
                  << ports::changeKindToString(change.kind) << " site=" << change.siteId;
        if (!change.sessionId.empty()) {
            std::cout << " session=" << change.sessionId;
        }
        if (!change.detail.empty()) {
            std::cout << " (" << change.detail << ")";
        }
        std::cout << std::endl;
    };

    bus.subscribe(ports::ChangeKind::SessionOpened, logChange);
    bus.subscribe(ports::ChangeKind::SessionPendingExit, logChange);
    bus.subscribe(ports::ChangeKind::SessionResumed, logChange);
    bus.subscribe(ports::ChangeKind::SessionCompleted, logChange);
    bus.subscribe(ports::ChangeKind::TransitionIgnored, logChange);
}

std::string formatMinutes(std::int64_t minutes) {
    std::ostringstream ss;
    ss << minutes / 60 << "h " << std::setw(2) << std::setfill('0') << minutes % 60 << "m";
    return ss.str();
}

void printSession(const TrackingSession& session) {
    std::cout << "  " << formatIso8601(session.clockIn) << " -> "
              << (session.clockOut ? formatIso8601(*session.clockOut) : std::string("open"))
              << "  " << sessionStateToString(session.state)
              << "  " << trackingMethodToString(session.trackingMethod);
    if (session.durationMinutes) {
        std::cout << "  " << formatMinutes(*session.durationMinutes);
    }
    if (session.exitResolution != ExitResolution::None) {
        std::cout << "  [" << exitResolutionToString(session.exitResolution) << "]";
    }
    if (session.belowMinimum) {
        std::cout << "  (short)";
    }
    std::cout << std::endl;
}

void printStatus(const domain::TrackingEngine& engine, const domain::SiteRegistry& registry) {
    auto sites = registry.listSites();
    if (sites.empty()) {
        std::cout << "No sites configured" << std::endl;
        return;
    }

    for (const auto& site : sites) {
        std::cout << site.id << " - " << site.name << " (" << site.radiusMeters << "m)";
        auto session = engine.getActiveSession(site.id);
        if (!session) {
            std::cout << ": off site" << std::endl;
            continue;
        }
        std::cout << ": " << sessionStateToString(session->state) << " since "
                  << formatIso8601(session->clockIn);
        if (auto next = engine.nextVerificationAt(session->id)) {
            std::cout << ", next check " << formatIso8601(*next);
        }
        std::cout << std::endl;
    }
}

void printHistory(const domain::TrackingEngine& engine, const std::string& siteId, std::size_t limit) {
    auto history = engine.getHistory(siteId, limit);
    std::cout << "History for " << siteId << " (" << history.size() << " sessions):" << std::endl;
    for (const auto& session : history) {
        printSession(session);
    }
}

void printTotals(const domain::TrackingEngine& engine, Timestamp from, Timestamp to, Timestamp now) {
    auto totals = domain::HoursCalculator::dailyTotals(engine.getSessionsOverlapping(from, to), from, to, now);
    if (totals.empty()) {
        std::cout << "No tracked time between " << formatUtcDate(from) << " and " << formatUtcDate(to)
                  << std::endl;
        return;
    }

    for (const auto& day : totals) {
        std::cout << "  " << day.date << "  " << formatMinutes(day.minutes) << "  "
                  << day.sessionCount << " session(s), " << domain::workSourceToString(day.source)
                  << std::endl;
    }
    std::cout << "  total  " << formatMinutes(domain::HoursCalculator::totalMinutes(totals)) << std::endl;
}

/**
 * @brief Feed a JSON-lines file through the engine with a simulated clock
 *
 * Every line either carries a transition or, with "kind": "position", the
 * device position returned by later verification fetches. The clock is
 * stepped between lines so due checks run at their scheduled times.
 */
int runReplay(const std::string& replayFile, const AppConfig& config) {
    std::ifstream input(replayFile);
    if (!input.is_open()) {
        std::cerr << "Error: cannot open replay file " << replayFile << std::endl;
        return 1;
    }

    auto clock = std::make_shared<sim::SimulatedClock>();
    auto provider = std::make_shared<sim::MockLocationProvider>();
    auto notifications = std::make_shared<ConsoleNotificationDispatcher>();
    auto store = std::make_shared<adapters::InMemoryTrackingStore>();
    auto rng = std::make_shared<StandardRng>();
    auto bus = std::make_shared<domain::EventBus>();

    domain::TrackingEngine engine(store, provider, notifications, clock, rng, config.tracking, bus);
    domain::SiteRegistry registry(store, provider, clock, rng, config.tracking);
    subscribeChangeLog(*bus);
    engine.attach();

    bool started = false;
    Timestamp firstSeen{};
    const auto step = std::chrono::seconds(15);

    auto advanceTo = [&](Timestamp target) {
        if (!started) {
            clock->setCurrentTime(target);
            seedSites(registry, config);
            firstSeen = target;
            started = true;
            return;
        }
        while (clock->now() + step < target) {
            clock->advance(step);
            engine.tick();
            bus->processEvents();
        }
        if (clock->now() < target) {
            clock->setCurrentTime(target);
        }
        engine.tick();
        bus->processEvents();
    };

    std::string line;
    int lineNumber = 0;
    std::size_t processed = 0;
    while (g_running && std::getline(input, line)) {
        ++lineNumber;
        if (line.find_first_not_of(" \t\r") == std::string::npos || line[0] == '#') {
            continue;
        }

        try {
            auto json = nlohmann::json::parse(line);

            if (json.value("kind", std::string()) == "position") {
                auto fix = JsonCodec::parsePositionFix(json);
                if (!fix) {
                    std::cerr << "[Replay] Line " << lineNumber << ": invalid position fix" << std::endl;
                    continue;
                }
                advanceTo(fix->timestamp);
                provider->setFallbackFix(fix);
            } else {
                auto transition = JsonCodec::parseTransition(json);
                advanceTo(transition.timestamp);
                provider->emitTransition(transition);
                bus->processEvents();
            }
            ++processed;
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[Replay] Line " << lineNumber << ": " << e.what() << std::endl;
        } catch (const InvalidTransition& e) {
            std::cerr << "[Replay] Line " << lineNumber << ": " << e.what() << std::endl;
        }
    }

    if (!started) {
        std::cout << "Replay file contained no usable records" << std::endl;
        return 0;
    }

    // Let outstanding verification windows run out
    advanceTo(clock->now() + config.tracking.maxVerificationWindow());

    std::cout << "\nReplayed " << processed << " record(s)" << std::endl;
    for (const auto& site : registry.listSites()) {
        printHistory(engine, site.id, 0);
    }

    std::cout << "\nDaily totals:" << std::endl;
    printTotals(engine, startOfUtcDay(firstSeen), clock->now(), clock->now());
    return 0;
}

/**
 * @brief Interactive command loop
 *
 * Commands: i <site> (clock in), o <site> (clock out), s (status),
 * h <site> (history), t (today's totals), q (quit).
 */
void runInteractive(domain::TrackingEngine& engine, domain::SiteRegistry& registry,
                    const std::shared_ptr<IClock>& clock) {
    std::cout << "\nInteractive mode. Commands:" << std::endl;
    std::cout << "  i <site> - Clock in" << std::endl;
    std::cout << "  o <site> - Clock out" << std::endl;
    std::cout << "  s        - Status of all sites" << std::endl;
    std::cout << "  h <site> - Session history" << std::endl;
    std::cout << "  t        - Today's totals" << std::endl;
    std::cout << "  q        - Quit" << std::endl;

    char cmd;
    while (g_running && std::cin >> cmd) {
        try {
            switch (cmd) {
                case 'i': {
                    std::string siteId;
                    std::cin >> siteId;
                    auto session = engine.clockIn(siteId);
                    std::cout << "Clocked in at " << siteId << " (" << session.id << ")" << std::endl;
                    break;
                }

                case 'o': {
                    std::string siteId;
                    std::cin >> siteId;
                    auto session = engine.clockOut(siteId);
                    printSession(session);
                    break;
                }

                case 's':
                    printStatus(engine, registry);
                    break;

                case 'h': {
                    std::string siteId;
                    std::cin >> siteId;
                    printHistory(engine, siteId, kHistoryLimit);
                    break;
                }

                case 't': {
                    auto now = clock->now();
                    printTotals(engine, startOfUtcDay(now), now, now);
                    break;
                }

                case 'q':
                    g_running = false;
                    break;

                default:
                    std::cout << "Unknown command" << std::endl;
                    break;
            }
        } catch (const ManualCommandConflict& e) {
            std::cout << "Rejected: " << e.what() << std::endl;
        } catch (const PersistenceError& e) {
            std::cerr << "Store error: " << e.what() << std::endl;
        }
    }
    g_running = false;
}

int runLive(const AppConfig& config, bool headless) {
    if (headless && !config.mqtt.enabled()) {
        std::cerr << "Error: --headless needs an [mqtt] host (or WORKTRACK_MQTT_HOST)" << std::endl;
        return 1;
    }

    auto clock = std::make_shared<SystemClock>();
    auto rng = std::make_shared<StandardRng>();
    auto bus = std::make_shared<domain::EventBus>();
    auto store = openStore(config.store);

    std::shared_ptr<IMqttClient> mqttClient;
    std::shared_ptr<adapters::MqttLocationProvider> mqttProvider;
    std::shared_ptr<ports::ILocationProvider> provider;
    std::shared_ptr<ports::INotificationDispatcher> notifications;

    if (config.mqtt.enabled()) {
        adapters::MqttTopicConfig topics;
        topics.topicPrefix = config.mqtt.topicPrefix;
        topics.deviceId = config.mqtt.deviceId;

        mqttClient = std::make_shared<PahoMqttClient>();
        mqttProvider = std::make_shared<adapters::MqttLocationProvider>(
            mqttClient, clock, topics, std::chrono::seconds(config.mqtt.maxFixAgeSeconds));
        provider = mqttProvider;
        notifications = std::make_shared<adapters::MqttNotificationDispatcher>(mqttClient, clock, topics);

        mqttClient->setConnectionCallback([](bool connected, const std::string& reason) {
            std::cout << "[MQTT] " << (connected ? "Connected" : "Disconnected")
                      << (reason.empty() ? "" : ": " + reason) << std::endl;
        });
    } else {
        std::cout << "No broker configured, automatic tracking disabled" << std::endl;
        provider = std::make_shared<sim::MockLocationProvider>();
        notifications = std::make_shared<ConsoleNotificationDispatcher>();
    }

    domain::TrackingEngine engine(store, provider, notifications, clock, rng, config.tracking, bus);
    domain::SiteRegistry registry(store, provider, clock, rng, config.tracking);
    subscribeChangeLog(*bus);

    seedSites(registry, config);
    engine.attach();
    registry.registerAll();

    auto report = engine.recover();
    std::cout << "Recovery: " << report.rescheduled << " verification(s) rescheduled, "
              << report.resolved << " stale exit(s) resolved" << std::endl;
    bus->processEvents();

    if (mqttClient) {
        bool started = false;
        if (config.mqtt.useTls) {
            TlsConfig tls;
            tls.certPath = config.mqtt.certPath;
            tls.keyPath = config.mqtt.keyPath;
            tls.caPath = config.mqtt.caPath;
            tls.verifyServer = config.mqtt.verifyServer;
            started = mqttClient->connectWithTls(config.mqtt.host, config.mqtt.port, config.mqtt.clientId,
                                                 config.mqtt.username, config.mqtt.password, tls);
        } else {
            started = mqttClient->connect(config.mqtt.host, config.mqtt.port, config.mqtt.clientId,
                                          config.mqtt.username, config.mqtt.password);
        }
        if (!started) {
            std::cerr << "Error: could not start connection to " << config.mqtt.host << std::endl;
            return 1;
        }
        mqttProvider->start();
    }

    std::thread inputThread;
    if (headless) {
        std::cout << "Running in headless mode. Press Ctrl+C to stop." << std::endl;
    } else {
        inputThread = std::thread([&]() { runInteractive(engine, registry, clock); });
    }

    while (g_running) {
        try {
            engine.tick();
        } catch (const PersistenceError& e) {
            std::cerr << "[Engine] Tick failed, retrying next second: " << e.what() << std::endl;
        }
        bus->processEvents();
        std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    }

    if (inputThread.joinable()) {
        inputThread.join();
    }

    if (mqttClient) {
        mqttClient->disconnect();
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    // Install signal handlers for graceful shutdown
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    bool headless = false;
    std::string replayFile;
    std::string configFile = "worktrack.toml";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            }
        } else if (arg == "--replay") {
            if (i + 1 < argc) {
                replayFile = argv[++i];
            } else {
                std::cerr << "--replay needs a file" << std::endl;
                return 1;
            }
        } else if (arg == "--headless") {
            headless = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    auto config = TomlConfig::loadFromFile(configFile);
    applyEnvOverrides(config);

    std::cout << "Starting worktrack daemon" << std::endl;
    std::cout << "Verification checks after ";
    for (std::size_t i = 0; i < config.tracking.verificationOffsetsMinutes.size(); ++i) {
        std::cout << (i ? ", " : "") << config.tracking.verificationOffsetsMinutes[i];
    }
    std::cout << " minute(s), cooldown " << config.tracking.cooldownSeconds << "s" << std::endl;

    try {
        int rc = replayFile.empty() ? runLive(config, headless) : runReplay(replayFile, config);
        std::cout << "Stopped." << std::endl;
        return rc;
    } catch (const PersistenceError& e) {
        std::cerr << "Fatal store error: " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
    }
    return 1;
}
