// bucketfs main entry point

#include "bucket_fs.hpp"
#include "config.hpp"
#include "fuse_session.hpp"
#include <iostream>

int main(int argc, char *argv[])
{
    bucketfs::BucketFSConfig config;
    try {
        // Layered configuration: defaults, YAML, environment, command line
        config = bucketfs::BucketFSConfig::load(argc, argv);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    try {
        // Lists the bucket once; fails here if the bucket cannot be listed
        bucketfs::BucketFS fs(config.bucket_name,
                              bucketfs::makeBackend(config.backendOptions()),
                              config);

        bucketfs::FuseSession session(fs, config.toFuseArgs(), config.mount_point);
        std::cout << "Mounted bucket " << config.bucket_name << " at " << config.mount_point << std::endl;

        const int status = session.loop();
        if (config.debug_mode) {
            std::cout << "[DEBUG] Session loop exited with status " << status << std::endl;
        }
        return status == 0 ? 0 : 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
