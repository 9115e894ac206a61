#include "config.hpp"
#include "errors.hpp"
#include "graphql_client.hpp"
#include "http_transport.hpp"
#include "models.hpp"
#include "probe.hpp"
#include "uploader.hpp"
#include "url_resolver.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Options {
    asset_upload::ClientConfig  client;
    std::string                 command;
    std::vector<std::string>    arguments;
    std::optional<std::string>  alt;
    std::optional<std::string>  resourceId;
    std::optional<std::string>  fallback;
    bool                        usePut = false;
};

void printUsage() {
    std::cout
        << "Usage: asset_upload [options] upload FILE...\n"
        << "       asset_upload [options] resolve URL [--id ID] [--fallback URL]\n\n"
        << "Options:\n"
        << "  --shop DOMAIN      Shop domain           (env: SHOPIFY_SHOP_DOMAIN)\n"
        << "  --token TOKEN      Admin access token    (env: SHOPIFY_ACCESS_TOKEN)\n"
        << "  --api-version V    Admin API version     (default: 2024-01)\n"
        << "  --timeout-s N      Request timeout in s  (default: 30)\n"
        << "  --alt TEXT         Alt text for uploaded files\n"
        << "  --put              Send the staged upload with PUT instead of POST\n"
        << "  --verbose          Enable verbose diagnostics\n"
        << "  --help, -h         Show this message\n";
}

[[noreturn]] void usageError(const std::string& message) {
    std::cerr << message << "\n\n";
    printUsage();
    std::exit(2);
}

Options parseArgs(int argc, char* argv[]) {
    Options opts;
    opts.client = asset_upload::loadConfigFromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (arg == "--shop" && hasValue) {
            opts.client.shopDomain = argv[++i];
        } else if (arg == "--token" && hasValue) {
            opts.client.accessToken = argv[++i];
        } else if (arg == "--api-version" && hasValue) {
            opts.client.apiVersion = argv[++i];
        } else if (arg == "--timeout-s" && hasValue) {
            opts.client.timeoutSeconds =
                asset_upload::parsePositiveInt("--timeout-s", argv[++i]);
        } else if (arg == "--alt" && hasValue) {
            opts.alt = argv[++i];
        } else if (arg == "--id" && hasValue) {
            opts.resourceId = argv[++i];
        } else if (arg == "--fallback" && hasValue) {
            opts.fallback = argv[++i];
        } else if (arg == "--put") {
            opts.usePut = true;
        } else if (arg == "--verbose") {
            opts.client.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else if (!arg.empty() && arg[0] == '-') {
            usageError("Unknown argument: " + arg);
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.arguments.push_back(arg);
        }
    }

    if (opts.command != "upload" && opts.command != "resolve") {
        usageError(opts.command.empty() ? "Missing command"
                                        : "Unknown command: " + opts.command);
    }
    if (opts.arguments.empty()) {
        usageError("Missing " + std::string(opts.command == "upload" ? "FILE" : "URL"));
    }
    if (opts.command == "resolve" && opts.arguments.size() != 1) {
        usageError("resolve takes exactly one URL");
    }
    return opts;
}

void printResource(const std::string& name, const asset_upload::CreatedResource& r) {
    std::cout << std::left << std::setw(28) << name << "  "
              << std::setw(44) << r.id << "  "
              << std::setw(10) << asset_upload::toString(r.status) << "  "
              << r.deliveryUrl.value_or("-") << "\n";
}

int runUpload(const Options& opts,
              asset_upload::GraphQLClient& graphql,
              asset_upload::Transport& transport) {
    using namespace asset_upload;

    UploaderOptions uploaderOptions;
    uploaderOptions.transferMethod = opts.usePut ? "PUT" : "POST";
    uploaderOptions.verbose        = opts.client.verbose;
    StagedUploader uploader(graphql, transport, uploaderOptions);

    if (opts.arguments.size() == 1) {
        const auto resource = uploader.uploadFile(opts.arguments[0], opts.alt);
        printResource(baseName(opts.arguments[0]), resource);
        return 0;
    }

    std::vector<UploadFile> files;
    for (const auto& path : opts.arguments) {
        files.push_back(loadUploadFile(path, opts.alt));
    }

    const auto result = uploader.uploadBatch(files);
    for (const auto& entry : result.entries) {
        if (entry.ok()) {
            printResource(entry.filename, *entry.resource);
        } else {
            std::cout << std::left << std::setw(28) << entry.filename << "  FAILED at "
                      << toString(*entry.failedPhase) << " ("
                      << toString(entry.errorKind) << "): " << entry.errorMessage
                      << "\n";
        }
    }

    std::cout << "\n=== Summary ===\n"
              << "Total:      " << result.summary.total     << "\n"
              << "Succeeded:  " << result.summary.succeeded << "\n"
              << "Failed:     " << result.summary.failed    << "\n"
              << "===============\n";
    return result.summary.failed == 0 ? 0 : 1;
}

int runResolve(const Options& opts,
               asset_upload::GraphQLClient& graphql,
               asset_upload::Transport& transport) {
    using namespace asset_upload;

    HttpUrlProber            prober(transport,
                                    std::chrono::seconds(opts.client.probeTimeoutSeconds));
    ThreadSleeper            sleeper;
    SystemClock              clock;
    GraphQLDeliveryUrlLookup lookup(graphql);

    ResolverOptions resolverOptions;
    resolverOptions.maxRetries = opts.client.maxResolveRetries;
    resolverOptions.verbose    = opts.client.verbose;
    DeliveryUrlResolver resolver(prober, sleeper, clock, &lookup, resolverOptions);

    const std::string& url = opts.arguments[0];
    if (opts.fallback) {
        std::cout << resolver.resolveWithFallback(url, *opts.fallback, opts.resourceId)
                  << "\n";
        return 0;
    }

    const auto result = resolver.resolve(url, opts.resourceId);
    for (const auto& a : result.attempts) {
        std::cout << "  " << std::left << std::setw(12) << a.strategyName
                  << std::setw(12) << toString(a.outcome) << a.candidateUrl << "\n";
    }
    std::cout << toString(result.state) << ": " << result.url;
    if (result.resolved() && !result.strategy.empty()) {
        std::cout << " (" << result.strategy << ")";
    }
    std::cout << "\n";
    return result.resolved() ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        Options opts = parseArgs(argc, argv);

        if (opts.command == "upload" || opts.resourceId) {
            asset_upload::validateConfig(opts.client);
        }

        asset_upload::TransportConfig transportConfig;
        transportConfig.timeout   = std::chrono::seconds(opts.client.timeoutSeconds);
        transportConfig.userAgent = opts.client.userAgent;
        transportConfig.verbose   = opts.client.verbose;
        asset_upload::BeastTransport transport(transportConfig);

        // Resolving without an id never talks to the Admin API.
        const std::string endpoint = opts.client.shopDomain.empty()
                                         ? "https://localhost/graphql.json"
                                         : opts.client.graphqlEndpoint();
        asset_upload::GraphQLClient graphql(transport, endpoint,
                                            opts.client.accessToken,
                                            std::chrono::seconds(opts.client.timeoutSeconds));
        graphql.setVerbose(opts.client.verbose);

        return opts.command == "upload" ? runUpload(opts, graphql, transport)
                                        : runResolve(opts, graphql, transport);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
