#pragma once

#include <memory>

namespace livetv::core { class TunerBroker; }
namespace livetv::db { class Repository; }

namespace livetv::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<livetv::core::TunerBroker> broker;
  std::shared_ptr<livetv::db::Repository> repository;
};

}
