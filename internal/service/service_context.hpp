#pragma once

#include <cstdint>
#include <memory>

namespace pagequeue::queue {
class JobQueue;
}
namespace pagequeue::status {
class StatusTracker;
}
namespace pagequeue::validation {
class DocumentValidator;
}
namespace pagequeue::storage {
class ArtifactStore;
}
namespace pagequeue::resources {
class ResourceProbe;
}

namespace pagequeue::service {

/*
  Dependency container shared by the service facade.
*/
struct ServiceContext {
  std::shared_ptr<pagequeue::queue::JobQueue>               queue;
  std::shared_ptr<pagequeue::status::StatusTracker>         status;
  std::shared_ptr<pagequeue::validation::DocumentValidator> validator;
  std::shared_ptr<pagequeue::storage::ArtifactStore>        artifacts;
  std::shared_ptr<pagequeue::resources::ResourceProbe>      probe;

  uint32_t default_chunk_size = 10;
};

} // namespace pagequeue::service
