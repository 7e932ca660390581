#pragma once
#include <atomic>
#include <grpcpp/grpcpp.h>
#include "client.hpp"
#include "coordinator.hpp"
#include "logger.hpp"

#include "ms/v1/ms.grpc.pb.h"
#include "ms/v1/ms.pb.h"

namespace MS {

/**
 * @brief gRPC front end: one bidirectional stream per connected client.
 *
 * The handler thread reads and dispatches commands; a companion writer
 * thread is the single consumer of the client's mailbox.
 */
class SessionServiceImpl final : public ms::v1::Masterserver::Service {
public:
  SessionServiceImpl(Coordinator& coord, Logger& log, size_t mailbox_capacity)
    : coord_(coord), log_(log), mailbox_capacity_(mailbox_capacity) {}

  ::grpc::Status Session(::grpc::ServerContext* ctx,
                         ::grpc::ServerReaderWriter<ms::v1::Envelope, ms::v1::Envelope>* rw) override;

private:
  /** Route one command; sets @p logout when the client asked to end the session. */
  void dispatch_(const Client& me, const ms::v1::Command& cmd, bool& logout);

  Coordinator& coord_;
  Logger& log_;
  const size_t mailbox_capacity_;
  std::atomic<ConnectionId> next_conn_{1};
};

} // namespace MS
