#include "realtime_server.hpp"

#include <chrono>

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace dispatch::grpc {

namespace {

constexpr std::chrono::milliseconds kPollInterval{200};

} // namespace

RealtimeServer::RealtimeServer(std::shared_ptr<dispatch::service::RealtimeService> svc) : service_(std::move(svc)) {
}

::grpc::Status RealtimeServer::Connect(::grpc::ServerContext* ctx, const dispatch::engine::v1::ConnectRequest* req,
                                       ::grpc::ServerWriter<dispatch::engine::v1::RealtimeEvent>* writer) {
  std::shared_ptr<dispatch::service::RealtimeSession> session;
  try {
    session = service_->Connect(*req);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  while (!ctx->IsCancelled() && !session->Closed()) {
    auto event = session->Next(kPollInterval);
    if (!event) continue;
    if (!writer->Write(*event)) {
      DISPATCH_LOG_WARN("Realtime stream write failed", {dispatch::observability::StringField("connection_id", session->ConnectionId()),
                                                         dispatch::observability::StringField("event", event->name())});
      break;
    }
  }

  session->Close();
  return ::grpc::Status::OK;
}

} // namespace dispatch::grpc
