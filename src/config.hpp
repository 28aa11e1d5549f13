#pragma once

#include <string>
#include <vector>
#include <optional>
#include "backend.hpp"

namespace bucketfs {

/**
 * BucketFSConfig - Configuration options for bucketfs
 *
 * Supports layered configuration from multiple sources:
 * 1. Defaults (lowest priority)
 * 2. YAML config file
 * 3. Environment variables
 * 4. Command-line arguments (highest priority)
 */
struct BucketFSConfig {
    // Backend selection ("gcs" or "memory")
    std::string backend = "gcs";

    // Optional REST endpoint override for the GCS backend
    std::optional<std::string> endpoint;

    // Send unauthenticated requests (emulators, public buckets)
    bool anonymous = false;

    // Logging settings
    bool debug_mode = false;
    bool verbose_logging = false;

    // Bucket name (required)
    std::string bucket_name;

    // Mount point (required)
    std::string mount_point;

    // Remaining FUSE arguments
    std::vector<std::string> fuse_args;

    /**
     * Load configuration from all sources in priority order
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed configuration
     * @throws std::runtime_error if required arguments are missing or invalid
     */
    static BucketFSConfig load(int argc, char* argv[]);

    /**
     * Parse command-line arguments into config and FUSE args
     * This method applies CLI overrides to an existing config
     *
     * @param argc Argument count
     * @param argv Argument values
     * @throws std::runtime_error if an option value is invalid
     */
    void parseFromArgs(int argc, char* argv[]);

    /**
     * Load configuration from YAML file
     *
     * @param config_path Path to YAML config file
     * @return true if file was loaded successfully, false if file doesn't exist
     * @throws std::runtime_error if file exists but is invalid
     */
    bool loadFromYAML(const std::string& config_path);

    /**
     * Load configuration from environment variables
     * Recognizes: BUCKETFS_* variables
     */
    void loadFromEnv();

    /**
     * Set default values
     */
    void loadDefaults();

    /**
     * Validate configuration
     * @throws std::runtime_error if configuration is invalid
     */
    void validate() const;

    // Options for makeBackend()
    BackendOptions backendOptions() const;

    // "bucketfs <version>", as printed by --version
    static std::string versionString();

    /**
     * Print usage information
     */
    static void printUsage(const char* program_name);

    /**
     * Arguments for fuse_session_new(): program name, the read-only mount
     * options, then any user-supplied FUSE options
     */
    std::vector<std::string> toFuseArgs() const;

private:
    /**
     * Extract --config flag from arguments before full parsing
     */
    static std::optional<std::string> extractConfigPath(int argc, char* argv[]);
};

} // namespace bucketfs
