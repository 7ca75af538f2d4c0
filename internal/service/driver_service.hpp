#pragma once

#include "api/dispatch/engine/v1.hpp"
#include "service_context.hpp"

namespace dispatch::service {

class DriverService {
 public:
  explicit DriverService(ServiceContext ctx);

  dispatch::engine::v1::AcceptOfferResponse AcceptOffer(const dispatch::engine::v1::AcceptOfferRequest& req);

  dispatch::engine::v1::RejectOfferResponse RejectOffer(const dispatch::engine::v1::RejectOfferRequest& req);

  // Heartbeat. Creates the availability row on first contact.
  void UpdateLocation(const dispatch::engine::v1::UpdateLocationRequest& req);

  // Going offline is refused while the driver holds an active ride.
  dispatch::engine::v1::SetAvailabilityResponse SetAvailability(const dispatch::engine::v1::SetAvailabilityRequest& req);

  dispatch::engine::v1::ListPendingOffersResponse ListPendingOffers(const dispatch::engine::v1::ListPendingOffersRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace dispatch::service
