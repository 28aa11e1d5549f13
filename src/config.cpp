#include "config.hpp"
#include <getopt.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

namespace bucketfs {

namespace {
    // Long-only options get values outside the char range
    enum LongOption {
        kOptConfig = 256,
        kOptBackend,
        kOptEndpoint,
        kOptAnonymous,
        kOptDebug,
        kOptVerbose,
        kOptHelp,
        kOptVersion,
    };

    const std::set<std::string> kKnownBackends = {"gcs", "memory"};

    std::optional<bool> parseBool(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (value == "1" || value == "true" || value == "yes" || value == "on") {
            return true;
        }
        if (value == "0" || value == "false" || value == "no" || value == "off") {
            return false;
        }
        return std::nullopt;
    }

    bool envBool(const char* name, bool current) {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return current;
        }
        auto parsed = parseBool(value);
        if (!parsed) {
            throw std::runtime_error(std::string("Invalid boolean value for ") + name + ": " + value);
        }
        return *parsed;
    }

    std::optional<std::string> envString(const char* name) {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    }
}

void BucketFSConfig::loadDefaults() {
    backend = "gcs";
    endpoint.reset();
    anonymous = false;
    debug_mode = false;
    verbose_logging = false;
    bucket_name.clear();
    mount_point.clear();
    fuse_args.clear();
}

BucketFSConfig BucketFSConfig::load(int argc, char* argv[]) {
    BucketFSConfig config;
    config.loadDefaults();

    auto config_path = extractConfigPath(argc, argv);
    if (!config_path) {
        config_path = envString("BUCKETFS_CONFIG");
    }
    if (config_path && !config.loadFromYAML(*config_path)) {
        throw std::runtime_error("Config file not found: " + *config_path);
    }

    config.loadFromEnv();
    config.parseFromArgs(argc, argv);
    config.validate();
    return config;
}

std::optional<std::string> BucketFSConfig::extractConfigPath(int argc, char* argv[]) {
    static const std::string kFlag = "--config";
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.rfind(kFlag + "=", 0) == 0) {
            return arg.substr(kFlag.length() + 1);
        }
        if (arg == kFlag && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

bool BucketFSConfig::loadFromYAML(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return false;
    }
    file.close();

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid YAML in " + config_path + ": " + e.what());
    }

    if (root.IsNull()) {
        return true;  // Empty file
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Invalid config file " + config_path + ": expected key: value pairs");
    }

    try {
        for (const auto& item : root) {
            const auto key = item.first.as<std::string>();
            const auto& value = item.second;

            if (key == "bucket_name") {
                bucket_name = value.as<std::string>();
            } else if (key == "mount_point") {
                mount_point = value.as<std::string>();
            } else if (key == "backend") {
                backend = value.as<std::string>();
            } else if (key == "endpoint") {
                endpoint = value.as<std::string>();
            } else if (key == "anonymous") {
                anonymous = value.as<bool>();
            } else if (key == "debug") {
                debug_mode = value.as<bool>();
            } else if (key == "verbose") {
                verbose_logging = value.as<bool>();
            } else {
                std::cerr << "[WARN] Unknown config key '" << key << "' in " << config_path << std::endl;
            }
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid value in " + config_path + ": " + e.what());
    }

    return true;
}

void BucketFSConfig::loadFromEnv() {
    if (auto value = envString("BUCKETFS_BUCKET")) {
        bucket_name = *value;
    }
    if (auto value = envString("BUCKETFS_MOUNT_POINT")) {
        mount_point = *value;
    }
    if (auto value = envString("BUCKETFS_BACKEND")) {
        backend = *value;
    }
    if (auto value = envString("BUCKETFS_ENDPOINT")) {
        endpoint = *value;
    }
    anonymous = envBool("BUCKETFS_ANONYMOUS", anonymous);
    debug_mode = envBool("BUCKETFS_DEBUG", debug_mode);
    verbose_logging = envBool("BUCKETFS_VERBOSE", verbose_logging);
}

void BucketFSConfig::parseFromArgs(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"config",    required_argument, nullptr, kOptConfig},
        {"backend",   required_argument, nullptr, kOptBackend},
        {"endpoint",  required_argument, nullptr, kOptEndpoint},
        {"anonymous", no_argument,       nullptr, kOptAnonymous},
        {"debug",     no_argument,       nullptr, kOptDebug},
        {"verbose",   no_argument,       nullptr, kOptVerbose},
        {"help",      no_argument,       nullptr, kOptHelp},
        {"version",   no_argument,       nullptr, kOptVersion},
        {nullptr, 0, nullptr, 0}
    };

    // Full getopt reset so repeated parses start from scratch
    optind = 0;
    opterr = 0;

    std::vector<std::string> positional_args;

    int opt;
    while ((opt = getopt_long(argc, argv, "o:dfvh", long_options, nullptr)) != -1) {
        switch (opt) {
            case kOptConfig:
                // Already applied by load()
                break;
            case kOptBackend:
                backend = optarg;
                break;
            case kOptEndpoint:
                endpoint = std::string(optarg);
                break;
            case kOptAnonymous:
                anonymous = true;
                break;
            case kOptDebug:
                debug_mode = true;
                break;
            case 'v':
            case kOptVerbose:
                verbose_logging = true;
                break;
            case 'd':
                // FUSE -d flag
                fuse_args.push_back("-d");
                break;
            case 'f':
                // Always runs in the foreground; accepted for compatibility
                break;
            case 'o':
                // FUSE -o option
                fuse_args.push_back("-o");
                fuse_args.push_back(optarg);
                break;
            case 'h':
            case kOptHelp:
                printUsage(argv[0]);
                exit(0);
            case kOptVersion:
                std::cout << versionString() << std::endl;
                exit(0);
            case '?':
            default:
                throw std::runtime_error(std::string("Unknown or incomplete option: ") +
                                         (optind > 0 && optind <= argc ? argv[optind - 1] : "?"));
        }
    }

    // Collect positional arguments (bucket_name and mount_point)
    while (optind < argc) {
        positional_args.push_back(argv[optind++]);
    }

    if (positional_args.size() > 2) {
        throw std::runtime_error("Unexpected argument: " + positional_args[2]);
    }
    if (positional_args.size() >= 1) {
        bucket_name = positional_args[0];
    }
    if (positional_args.size() == 2) {
        mount_point = positional_args[1];
    }
}

void BucketFSConfig::validate() const {
    if (bucket_name.empty()) {
        throw std::runtime_error("Missing required argument: bucket_name");
    }
    if (mount_point.empty()) {
        throw std::runtime_error("Missing required argument: mount_point");
    }
    if (kKnownBackends.find(backend) == kKnownBackends.end()) {
        throw std::runtime_error("Unknown backend: " + backend + " (expected gcs or memory)");
    }
    if (endpoint && endpoint->rfind("http://", 0) != 0 && endpoint->rfind("https://", 0) != 0) {
        throw std::runtime_error("Invalid endpoint: " + *endpoint + " (expected http:// or https:// URL)");
    }
}

std::string BucketFSConfig::versionString() {
    return std::string("bucketfs ") + BUCKETFS_VERSION;
}

BackendOptions BucketFSConfig::backendOptions() const {
    BackendOptions options;
    options.provider = backend;
    options.endpoint = endpoint;
    options.anonymous = anonymous;
    options.debug_mode = debug_mode;
    return options;
}

void BucketFSConfig::printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <bucket_name> <mount_point>\n\n";
    std::cout << "Required arguments (may also come from the config file or environment):\n";
    std::cout << "  bucket_name              Bucket to mount\n";
    std::cout << "  mount_point              Directory to mount the filesystem\n\n";

    std::cout << "bucketfs options:\n";
    std::cout << "  --config=PATH            YAML config file (or BUCKETFS_CONFIG)\n";
    std::cout << "  --backend=NAME           Storage backend: gcs (default) or memory\n";
    std::cout << "  --endpoint=URL           Override the storage endpoint (e.g. an emulator)\n";
    std::cout << "  --anonymous              Do not send credentials\n";
    std::cout << "  --debug                  Enable debug logging\n";
    std::cout << "  --verbose, -v            Enable verbose output\n";
    std::cout << "  --help, -h               Display this help message\n";
    std::cout << "  --version                Display the version and exit\n\n";

    std::cout << "FUSE options:\n";
    std::cout << "  -f                       Run in foreground (always the case)\n";
    std::cout << "  -d                       Enable FUSE debug output\n";
    std::cout << "  -o option                Mount options (e.g., -o allow_other)\n\n";

    std::cout << "Environment:\n";
    std::cout << "  BUCKETFS_BUCKET, BUCKETFS_MOUNT_POINT, BUCKETFS_BACKEND, BUCKETFS_ENDPOINT,\n";
    std::cout << "  BUCKETFS_ANONYMOUS, BUCKETFS_DEBUG, BUCKETFS_VERBOSE, BUCKETFS_CONFIG\n\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " my-bucket ~/mnt\n";
    std::cout << "  " << program_name << " my-bucket ~/mnt --debug -o allow_other\n";
    std::cout << "  " << program_name << " --endpoint=http://localhost:4443 --anonymous my-bucket /tmp/bucket\n";
}

std::vector<std::string> BucketFSConfig::toFuseArgs() const {
    std::vector<std::string> args;
    args.push_back("bucketfs");  // Program name
    args.push_back("-o");
    args.push_back("ro,noexec,fsname=bucketfs:" + bucket_name);

    for (const auto& arg : fuse_args) {
        args.push_back(arg);
    }
    return args;
}

} // namespace bucketfs
