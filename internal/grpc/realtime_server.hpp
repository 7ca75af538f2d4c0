#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "api/dispatch/engine/v1.hpp"
#include "internal/service/realtime_service.hpp"

namespace dispatch::grpc {

/*
  Holds each Connect stream open until the client goes away or the
  server shuts down, writing events in the order the registry delivered
  them. The stream is the live connection.
*/
class RealtimeServer final : public dispatch::engine::v1::RealtimeService::Service {
 public:
  explicit RealtimeServer(std::shared_ptr<dispatch::service::RealtimeService> svc);

  ::grpc::Status Connect(::grpc::ServerContext* ctx, const dispatch::engine::v1::ConnectRequest* req,
                         ::grpc::ServerWriter<dispatch::engine::v1::RealtimeEvent>* writer) override;

 private:
  std::shared_ptr<dispatch::service::RealtimeService> service_;
};

} // namespace dispatch::grpc
