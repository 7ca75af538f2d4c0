#pragma once

#include <memory>

#include "config/config.pb.h"

namespace dispatch::db {
class Repository;
}
namespace dispatch::realtime {
class ConnectionRegistry;
}
namespace dispatch::events {
class EventOutbox;
}
namespace dispatch::geo {
class GeoService;
}
namespace dispatch::pricing {
class FareEstimator;
}
namespace dispatch::matching {
class CandidateSelector;
class OfferBroadcaster;
class RideStateMachine;
class AcceptanceArbitrator;
class BatchScheduler;
} // namespace dispatch::matching

namespace dispatch::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<dispatch::db::Repository>             repository;
  std::shared_ptr<dispatch::realtime::ConnectionRegistry> registry;
  std::shared_ptr<dispatch::events::EventOutbox>        outbox;
  std::shared_ptr<dispatch::geo::GeoService>            geo;
  std::shared_ptr<dispatch::pricing::FareEstimator>     fare_estimator;
  std::shared_ptr<dispatch::matching::CandidateSelector>    selector;
  std::shared_ptr<dispatch::matching::OfferBroadcaster>     broadcaster;
  std::shared_ptr<dispatch::matching::RideStateMachine>     state_machine;
  std::shared_ptr<dispatch::matching::AcceptanceArbitrator> arbitrator;
  std::shared_ptr<dispatch::matching::BatchScheduler>       scheduler;

  dispatch::runtime::config::RuntimeConfig config;
};

} // namespace dispatch::service
