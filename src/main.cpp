#include "config.hpp"
#include "config_codec.hpp"
#include "http.hpp"
#include "relay.hpp"
#include "sms.hpp"
#include "util.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iostream>
#include <string>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: smsrelay [options]\n"
              << "\n"
              << "Without options, reads SMS messages from stdin (one JSON object per line:\n"
              << "{\"address\": \"+123\", \"body\": \"text\", \"date\": <epoch ms>}) and relays each.\n"
              << "\n"
              << "Options:\n"
              << "  -s, --send SENDER BODY  Relay a single message and exit\n"
              << "  --set RECORD          Validate and save a forwarder record (JSON)\n"
              << "  --show                Print the active forwarder record\n"
              << "  --setup-url           Print the managed relay pairing link\n"
              << "  --check-link          Ask the managed relay whether pairing is complete\n"
              << "  --config PATH         Use PATH instead of ~/.smsrelay/config.json\n"
              << "  -h, --help            Show this help\n"
              << "\n"
              << "Forwarder records:\n"
              << "  {\"StdoutForwarder\": {}}\n"
              << "  {\"HttpCallbackForwarder\": {\"callbackUrl\": URL, \"method\": \"GET|POST|PUT\",\n"
              << "                             \"uriPayload\": {..}, \"jsonPayload\": {..}}}\n"
              << "  {\"TelegramBotForwarder\": {\"token\": TOKEN, \"chatId\": ID}}\n"
              << "  {\"ManagedRelayForwarder\": {\"tgHandle\": HANDLE}}\n"
              << "\n"
              << "Environment variables:\n"
              << "  SMSRELAY_CONFIG       Config file path\n"
              << "  SMSRELAY_FORWARDER    Forwarder record, overrides the config file\n"
              << "  SMSRELAY_HTTP_TIMEOUT HTTP timeout in seconds\n";
}

static int run_stdin_loop(smsrelay::Relay& relay) {
    std::cerr << "[" << relay.active_tag() << "] Relaying messages from stdin...\n";

    std::string line;
    while (!g_shutdown.load() && std::getline(std::cin, line)) {
        line = smsrelay::trim(line);
        if (line.empty()) continue;

        smsrelay::SmsMessage sms;
        try {
            sms = smsrelay::sms_from_json(nlohmann::json::parse(line));
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[sms] Skipping malformed line: " << e.what() << "\n";
            continue;
        } catch (const std::invalid_argument& e) {
            std::cerr << "[sms] Skipping record: " << e.what() << "\n";
            continue;
        }

        std::cout << (relay.relay(sms) ? "ok" : "failed") << std::endl;
    }

    std::cerr << "[" << relay.active_tag() << "] Shutting down. Delivered "
              << relay.delivered_count() << ", failed " << relay.failed_count() << ".\n";
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string config_file;
    std::string send_sender, send_body;
    std::string set_record;
    bool send = false, show = false, setup_url = false, check_link = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-s") == 0 || std::strcmp(argv[i], "--send") == 0) && i + 2 < argc) {
            send = true;
            send_sender = argv[++i];
            send_body = argv[++i];
        } else if (std::strcmp(argv[i], "--set") == 0 && i + 1 < argc) {
            set_record = argv[++i];
        } else if (std::strcmp(argv[i], "--show") == 0) {
            show = true;
        } else if (std::strcmp(argv[i], "--setup-url") == 0) {
            setup_url = true;
        } else if (std::strcmp(argv[i], "--check-link") == 0) {
            check_link = true;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    smsrelay::http_init();
    auto config = smsrelay::Config::load(config_file);

    if (!set_record.empty()) {
        smsrelay::ConfigJson record;
        try {
            record = smsrelay::ConfigJson::parse(set_record);
            if (!config.persist_forwarder(record)) {
                std::cerr << "Error: could not write " << config.path << "\n";
                smsrelay::http_cleanup();
                return 1;
            }
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "Error: record is not valid JSON: " << e.what() << "\n";
            smsrelay::http_cleanup();
            return 1;
        } catch (const smsrelay::ConfigError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            smsrelay::http_cleanup();
            return 1;
        }
        std::cerr << "[config] Saved forwarder to " << config.path << "\n";
    }

    smsrelay::PlatformHttpClient http_client(config.http_timeout);
    smsrelay::Relay relay(http_client);
    try {
        relay.activate_record(config.forwarder);
    } catch (const smsrelay::ConfigError& e) {
        std::cerr << "Error: invalid forwarder configuration: " << e.what() << "\n";
        smsrelay::http_cleanup();
        return 1;
    }

    // Legacy flat records and a freshly generated relay code are written
    // back so the next start decodes the same forwarder.
    if (!std::getenv("SMSRELAY_FORWARDER")) {
        auto canonical = smsrelay::encode_forwarder(*relay.active());
        if (canonical != config.forwarder) {
            if (config.persist_forwarder(canonical))
                std::cerr << "[config] Updated forwarder record in " << config.path << "\n";
            else
                std::cerr << "[config] Could not update " << config.path << "\n";
        }
    }

    int rc = 0;
    if (show) {
        std::cout << smsrelay::encode_forwarder(*relay.active()).dump(4) << "\n";
    } else if (setup_url || check_link) {
        auto active = relay.active();
        const auto* managed = std::get_if<smsrelay::ManagedRelayForwarder>(&*active);
        if (!managed) {
            std::cerr << "Error: the active forwarder (" << relay.active_tag()
                      << ") is not a managed relay.\n";
            rc = 1;
        } else if (setup_url) {
            std::cout << managed->setup_url() << "\n";
        } else {
            bool linked = relay.check_linked().value_or(false);
            std::cout << (linked ? "linked" : "not linked") << "\n";
            rc = linked ? 0 : 2;
        }
    } else if (send) {
        smsrelay::SmsMessage sms;
        sms.sender = send_sender;
        sms.body = send_body;
        sms.timestamp = static_cast<int64_t>(std::time(nullptr)) * 1000;
        rc = relay.relay(sms) ? 0 : 1;
    } else if (set_record.empty()) {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        smsrelay::http_set_abort_flag(&g_shutdown);
        rc = run_stdin_loop(relay);
    }

    smsrelay::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
