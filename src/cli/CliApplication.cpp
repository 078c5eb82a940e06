/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "certificate/CertificateIssuer.hpp"
#include "cli/ProgressDisplay.hpp"
#include "config.h"
#include "config/MetadataLoader.hpp"
#include "pki/TrustAnchor.hpp"
#include "services/CommandExecutor.hpp"
#include "services/DeviceClassifier.hpp"
#include "services/DryRunCommandExecutor.hpp"
#include "services/ReportSynthesizer.hpp"
#include "services/SanitizationJob.hpp"
#include "util/Logger.hpp"
#include "util/Uuid.hpp"

#include <unistd.h>

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>

#include <getopt.h>

namespace cli {

namespace {

// Global for signal handling
std::atomic<bool> g_cancel_requested{false};

void signal_handler(int /*signal*/) {
    g_cancel_requested.store(true);
}

// Application name
constexpr auto APP_NAME = "media-sanitizer";

constexpr int OPT_VERIFY = 0x100;

// Command line options
const struct option long_options[] = {
    {      "help",       no_argument, nullptr,          'h'},
    {   "version",       no_argument, nullptr,          'V'},
    {      "wipe", required_argument, nullptr,          'w'},
    {  "metadata", required_argument, nullptr,          'm'},
    {    "config", required_argument, nullptr,          'c'},
    {    "passes", required_argument, nullptr,          'p'},
    {"output-dir", required_argument, nullptr,          'o'},
    {   "dry-run",       no_argument, nullptr,          'n'},
    {       "yes",       no_argument, nullptr,          'y'},
    {"report-out", required_argument, nullptr,          'r'},
    {    "verify", required_argument, nullptr,   OPT_VERIFY},
    {   "verbose",       no_argument, nullptr,          'v'},
    {     nullptr,                 0, nullptr,            0}
};

auto parse_int(std::string_view text) -> std::optional<int> {
    int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

void print_error(const util::Error& error) {
    std::cerr << "Error: " << error.describe() << "\n";
}

}  // namespace

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto options = parse_args(argc, argv);

    if (options.usage_error) {
        std::cerr << "Error: " << options.error_message << "\n"
                  << "Run with --help for usage.\n";
        return EXIT_FAILED;
    }

    if (options.show_help) {
        print_help();
        return EXIT_OK;
    }

    if (options.show_version) {
        print_version();
        return EXIT_OK;
    }

    auto config = resolve_config(options);
    if (!config) {
        print_error(config.error());
        return EXIT_FAILED;
    }

    auto& logger = util::Logger::instance();
    logger.mirror_to_stderr(config->logging.console);
    if (!logger.open(util::LogSettings{.directory = config::effective_log_dir(*config),
                                       .app_name = APP_NAME,
                                       .min_level = config->logging.level})) {
        std::cerr << "Warning: cannot open log file in "
                  << config::effective_log_dir(*config).string() << "\n";
    }

    if (options.verify_file) {
        return cmd_verify(*options.verify_file, *config);
    }

    if (options.devices.empty()) {
        print_help();
        return EXIT_FAILED;
    }

    return cmd_sanitize(options, *config);
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    optind = 0;  // full getopt reset, parse_args may run more than once per process
    opterr = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, "hVw:m:c:p:o:nyr:v", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'w':
                options.devices.emplace_back(optarg);
                break;
            case 'm':
                options.metadata_file = optarg;
                break;
            case 'c':
                options.config_file = optarg;
                break;
            case 'p':
                if (auto passes = parse_int(optarg); passes && *passes >= 1) {
                    options.overrides.overwrite_passes = *passes;
                } else {
                    options.usage_error = true;
                    options.error_message = std::format("Invalid pass count '{}'", optarg);
                }
                break;
            case 'o':
                options.overrides.output_dir = optarg;
                break;
            case 'n':
                options.overrides.dry_run = true;
                break;
            case 'y':
                options.no_confirm = true;
                break;
            case 'r':
                options.report_out = optarg;
                break;
            case OPT_VERIFY:
                options.verify_file = optarg;
                break;
            case 'v':
                options.overrides.verbose = true;
                break;
            default:
                options.usage_error = true;
                if (options.error_message.empty()) {
                    options.error_message = "Unrecognized or incomplete option";
                }
                break;
        }
    }

    if (optind < argc && !options.usage_error) {
        options.usage_error = true;
        options.error_message = std::format("Unexpected argument '{}'", argv[optind]);
    }

    return options;
}

auto CliApplication::resolve_config(const CliOptions& options)
    -> std::expected<config::AppConfig, util::Error> {
    auto config = config::default_config();
    if (options.config_file) {
        auto loaded = config::load_key_file(*options.config_file, std::move(config));
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }
    return config::apply_overrides(std::move(config), options.overrides);
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS] --wipe <device> [--wipe <device> ...]\n"
              << "       " << APP_NAME << " [OPTIONS] --verify <signed-certificate>\n\n"
              << "Whole-device sanitization with a signed certificate of sanitization\n\n"
              << "Commands:\n"
              << "  -w, --wipe <device>       Device to sanitize (repeatable, processed in order)\n"
              << "      --verify <file>       Verify a signed certificate and exit\n\n"
              << "Options:\n"
              << "  -h, --help                Show this help message\n"
              << "  -V, --version             Show version information\n"
              << "  -m, --metadata <file>     Operator/media metadata JSON for the certificate\n"
              << "  -c, --config <file>       Key file with configuration\n"
              << "  -p, --passes <n>          Overwrite pass count (default: 3)\n"
              << "  -o, --output-dir <dir>    Certificate output directory\n"
              << "  -n, --dry-run             Print the commands, execute nothing\n"
              << "  -y, --yes                 Skip confirmation prompt\n"
              << "  -r, --report-out <file>   Also write the wipe report as JSON\n"
              << "  -v, --verbose             Debug logging, mirrored to stderr\n\n"
              << "Methods (chosen per device):\n"
              << "  NVMe                      nvme sanitize (crypto erase), then nvme format\n"
              << "  SATA SSD                  ATA secure erase, then shred overwrite\n"
              << "  SATA HDD / unknown        shred overwrite\n\n"
              << "The identity bundle passphrase is read from the environment variable\n"
              << "named by [certificates] passphrase_env (default MEDIA_SANITIZER_P12_PASSWORD).\n\n"
              << "Exit status: 0 success, 1 failure, 2 sanitized but certificate not issued\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " --wipe /dev/sdb --metadata operator.json\n"
              << "  " << APP_NAME << " --wipe /dev/nvme0n1 --wipe /dev/sdc --passes 1 --yes\n"
              << "  " << APP_NAME << " --wipe /dev/sdb --dry-run\n"
              << "  " << APP_NAME << " --verify sanitization_report_<uuid>.txt\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Media sanitization with signed certificates\n";
}

auto CliApplication::cmd_sanitize(const CliOptions& options, const config::AppConfig& config)
    -> int {
    DeviceClassifier classifier;

    // Classified once for the prompt and the certificate; the job classifies again.
    std::vector<DeviceInfo> devices;
    for (const auto& path : options.devices) {
        auto device = classifier.classify(path);
        if (!device) {
            LOG_ERROR("CLI", std::format("Cannot use {}: {}", path, device.error().describe()));
            print_error(device.error());
            return EXIT_FAILED;
        }
        devices.push_back(std::move(*device));
    }

    if (!config.dry_run && !options.no_confirm && !confirm_sanitize(devices)) {
        std::cout << "Aborted.\n";
        return EXIT_FAILED;
    }

    std::unique_ptr<ICommandExecutor> executor;
    if (config.dry_run) {
        executor = std::make_unique<DryRunCommandExecutor>(config.sanitization.secure_erase_password);
    } else {
        executor = std::make_unique<CommandExecutor>();
    }

    // Set up signal handler for graceful cancellation
    g_cancel_requested.store(false);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    ProgressDisplay progress(options.devices, config.dry_run);
    SanitizationJob job(classifier, *executor, config.sanitization);

    auto started = job.start(
        options.devices, [&progress](const JobProgress& p) { progress.update(p); },
        [&progress](std::string_view line) { progress.output_line(line); });
    if (!started) {
        print_error(started.error());
        return EXIT_FAILED;
    }

    bool cancel_sent = false;
    while (job.is_running()) {
        if (g_cancel_requested.load() && !cancel_sent) {
            std::cerr << "\nCancellation requested; finishing the current device...\n";
            job.cancel();
            cancel_sent = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
    }

    auto result = job.wait();
    if (!result) {
        std::cerr << "Error: job produced no result\n";
        return EXIT_FAILED;
    }
    const auto& report = result->report;
    const bool success = report.status == WipeStatus::SUCCESS;
    progress.complete(success, report.message);
    if (const auto failure = job_failure_text(*result, config.sanitization.secure_erase_password);
        !failure.empty()) {
        std::cerr << failure << "\n";
    }

    if (options.report_out) {
        std::ofstream out{*options.report_out, std::ios::trunc};
        out << report::to_json(report).dump(4) << "\n";
        if (!out) {
            LOG_ERROR("CLI", std::format("Cannot write report to {}", options.report_out->string()));
            std::cerr << "Warning: cannot write report to " << options.report_out->string() << "\n";
        }
    }

    if (!success) {
        return EXIT_FAILED;
    }
    if (report.dry_run) {
        std::cout << "Dry run complete; no certificate issued.\n";
        return EXIT_OK;
    }

    return issue_certificate(config, report, options.metadata_file, devices);
}

auto CliApplication::job_failure_text(const JobResult& result, std::string_view secret)
    -> std::string {
    if (!result.error) {
        return {};
    }
    std::string text = "Error: " + result.error->describe_command(secret);
    // The device that stopped the job and what was tried on it
    for (const auto& attempt : result.attempts) {
        if (attempt.outcome == AttemptOutcome::FAILED) {
            text += std::format("\n  {} [{}]: {}", attempt.device_path, attempt.method_name,
                                attempt.failure_reason);
        }
    }
    return text;
}

auto CliApplication::issue_certificate(const config::AppConfig& config, const WipeReport& report,
                                       const std::optional<std::filesystem::path>& metadata_file,
                                       const std::vector<DeviceInfo>& devices) -> int {
    config::CertificateMetadata metadata{};
    if (metadata_file) {
        auto loaded = config::load_metadata(*metadata_file);
        if (!loaded) {
            print_error(loaded.error());
            return EXIT_CERTIFICATE_FAILED;
        }
        metadata = std::move(*loaded);
    }
    config::fill_media_defaults(metadata.media, devices);

    auto passphrase = config::read_passphrase(config);
    if (!passphrase) {
        print_error(passphrase.error());
        return EXIT_CERTIFICATE_FAILED;
    }

    auto report_uuid = util::generate_uuid_v4();
    if (!report_uuid) {
        print_error(report_uuid.error());
        return EXIT_CERTIFICATE_FAILED;
    }

    pki::TrustAnchor trust_anchor(config.certificates.identity_bundle);
    CertificateIssuer issuer(trust_anchor,
                             IssuerSettings{.output_dir = config.certificates.output_dir,
                                            .tool_used = std::format("{} {}",
                                                                     config.certificates.tool_name,
                                                                     PROJECT_VERSION),
                                            .passphrase = std::move(*passphrase)});

    auto issued = issuer.issue(metadata.operator_info, metadata.media, report, *report_uuid);
    if (!issued) {
        print_error(issued.error());
        if (issued.error().is(util::ErrorKind::SIGNING)) {
            std::cerr << "The unsigned document was kept at "
                      << issuer.unsigned_path_for(*report_uuid).string() << "\n";
        }
        return EXIT_CERTIFICATE_FAILED;
    }

    std::cout << "Certificate record: " << issued->json_path.string() << "\n"
              << "Signed certificate: " << issued->signed_path.string() << "\n";
    return EXIT_OK;
}

auto CliApplication::cmd_verify(const std::filesystem::path& signed_file,
                                const config::AppConfig& config) -> int {
    auto passphrase = config::read_passphrase(config);
    if (!passphrase) {
        print_error(passphrase.error());
        return EXIT_FAILED;
    }

    pki::TrustAnchor trust_anchor(config.certificates.identity_bundle);
    CertificateIssuer issuer(trust_anchor,
                             IssuerSettings{.output_dir = config.certificates.output_dir,
                                            .tool_used = {},
                                            .passphrase = std::move(*passphrase)});

    auto verified = issuer.verify(signed_file);
    if (!verified) {
        std::cout << "[INVALID] " << signed_file.string() << "\n";
        print_error(verified.error());
        return EXIT_FAILED;
    }

    std::cout << "[VALID] " << signed_file.string() << " has a valid signature from the identity in "
              << config.certificates.identity_bundle.string() << "\n";
    return EXIT_OK;
}

auto CliApplication::confirm_sanitize(const std::vector<DeviceInfo>& devices) -> bool {
    std::cout << "\n";
    std::cout << "\033[1;31mWARNING: This will PERMANENTLY DESTROY all data on:\033[0m\n";
    for (const auto& device : devices) {
        std::cout << "  " << device.path;
        if (!device.model.empty()) {
            std::cout << "  " << device.model;
        }
        std::cout << "  " << ProgressDisplay::format_bytes(device.size_bytes) << "  "
                  << to_string(device.category) << " " << to_string(device.rotational);
        if (device.is_mounted) {
            std::cout << "  (mounted at " << device.mount_point << ", will be refused)";
        }
        std::cout << "\n";
    }
    std::cout << "\nType 'yes' to confirm: ";
    std::cout.flush();

    std::string input;
    std::getline(std::cin, input);

    return input == "yes";
}

}  // namespace cli
