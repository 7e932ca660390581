#include <iostream>
#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include "config.hpp"
#include "coordinator.hpp"
#include "logger.hpp"
#include "registry.hpp"
#include "rpc_session.hpp"

int main(int argc, char** argv) {
  MS::ServerConfig cfg;
  std::string err;
  if (!MS::loadConfig(argc, argv, cfg, err)) {
    std::cerr << "masterserver: " << err << "\n"
              << "Usage: masterserver [listen_addr]\n";
    return 2;
  }

  MS::Logger logger{cfg.log_path};
  if (!logger.ok()) std::cerr << "masterserver: cannot open log " << cfg.log_path << "\n";

  MS::Registry registry{cfg.register_poll};
  MS::Coordinator coordinator{registry, logger};
  MS::SessionServiceImpl session_service(coordinator, logger, cfg.mailbox_capacity);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(cfg.listen_addr, grpc::InsecureServerCredentials());
  builder.RegisterService(&session_service);

  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    std::cerr << "masterserver: failed to listen on " << cfg.listen_addr << "\n";
    return 3;
  }
  logger.info(MS::EventType::System, "-", "listening on " + cfg.listen_addr);
  std::cout << "masterserver listening on " << cfg.listen_addr << "\n";
  server->Wait();
  return 0;
}
