#include "backend.hpp"
#include <stdexcept>
#include "gcs/gcs_backend.hpp"
#include "memory_backend.hpp"

namespace bucketfs {

std::unique_ptr<IBucketBackend> makeBackend(const BackendOptions& options)
{
    if (options.provider == "gcs") {
        return std::make_unique<GcsBackend>(options);
    }
    if (options.provider == "memory") {
        return std::make_unique<MemoryBackend>();
    }
    throw std::runtime_error("Unknown backend provider: " + options.provider);
}

} // namespace bucketfs
