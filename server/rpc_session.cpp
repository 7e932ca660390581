#include "rpc_session.hpp"
#include <thread>
#include "wire.hpp"

namespace MS {

using ::grpc::Status;
using ::grpc::StatusCode;
namespace proto = ::ms::v1;

namespace {

/** Closes the mailbox and joins the writer on every exit path. */
struct WriterGuard {
  std::shared_ptr<Mailbox> mailbox;
  std::thread thread;
  ~WriterGuard() {
    if (mailbox) mailbox->close();
    if (thread.joinable()) thread.join();
  }
};

/** Unregisters the client on every exit path. */
struct RegistrationGuard {
  Coordinator& coord;
  Logger& log;
  std::string name;
  ConnectionId conn;
  bool active = true;

  /** Unregister now. False, with @p err_out set, when the registry was inconsistent. */
  bool release(std::string& err_out) {
    if (!active) return true;
    active = false;
    try {
      coord.unregisterClient(name, conn);
    } catch (const InvariantError& ex) {
      err_out = ex.what();
      return false;
    }
    return true;
  }

  ~RegistrationGuard() {
    std::string err;
    if (!release(err)) log.error(name, "invariant violated on disconnect: " + err);
  }
};

const char* commandName(const proto::Command& cmd) {
  switch (cmd.kind_case()) {
    case proto::Command::kLogin:        return "login";
    case proto::Command::kLogout:       return "logout";
    case proto::Command::kListGames:    return "list_games";
    case proto::Command::kGameInit:     return "game_init";
    case proto::Command::kJoinGame:     return "join_game";
    case proto::Command::kLeaveGame:    return "leave_game";
    case proto::Command::kPlayerConfig: return "player_config";
    case proto::Command::kGameConfig:   return "game_config";
    case proto::Command::kStartGame:    return "start_game";
    case proto::Command::kChat:         return "chat";
    case proto::Command::KIND_NOT_SET:  return "empty";
  }
  return "unknown";
}

} // anon

Status SessionServiceImpl::Session(::grpc::ServerContext* ctx,
                                   ::grpc::ServerReaderWriter<proto::Envelope, proto::Envelope>* rw)
{
  proto::Envelope in;
  if (!rw->Read(&in)) return Status::OK;  // gone before saying anything

  if (!in.has_cmd() || !in.cmd().has_login() || in.cmd().login().name().empty()) {
    rw->Write(toWire(Outbound::error(ErrorCode::InvalidRequest, "login required")));
    log_.error(ctx->peer(), "first command was not a login");
    return Status(StatusCode::UNAUTHENTICATED, "login required");
  }

  Client me = newClient(in.cmd().login().name(), peerHost(ctx->peer()), next_conn_++, mailbox_capacity_);

  Registry::RegisterResult reg{};
  try {
    reg = coord_.login(me, [ctx]{ return ctx->IsCancelled(); });
  } catch (const std::exception& ex) {
    log_.error(me.name, std::string("login failed: ") + ex.what());
    return Status(StatusCode::INTERNAL, ex.what());
  }
  if (reg == Registry::RegisterResult::Cancelled) return Status::CANCELLED;

  RegistrationGuard registration{coord_, log_, me.name, me.conn};
  WriterGuard writer{me.mailbox, {}};
  writer.thread = std::thread([this, ctx, rw, mb = me.mailbox, who = me.name]{
    while (auto m = mb->take()) {
      if (!rw->Write(toWire(*m))) {
        mb->close();
        break;
      }
    }
    if (mb->overflowed()) {
      log_.error(who, "outbound queue overflowed; dropping connection");
      ctx->TryCancel();
    }
  });

  Status status = Status::OK;
  bool logout = false;
  try {
    while (!logout && rw->Read(&in)) {
      if (!in.has_cmd()) continue;
      dispatch_(me, in.cmd(), logout);
    }
  } catch (const InvariantError& ex) {
    log_.error(me.name, std::string("invariant violated: ") + ex.what());
    status = Status(StatusCode::INTERNAL, ex.what());
  }

  std::string err;
  if (!registration.release(err)) {
    log_.error(me.name, "invariant violated on disconnect: " + err);
    status = Status(StatusCode::INTERNAL, err);
  }
  return status;
}

void SessionServiceImpl::dispatch_(const Client& me, const proto::Command& cmd, bool& logout) {
  log_.info(EventType::Command, me.name, commandName(cmd));

  switch (cmd.kind_case()) {
    case proto::Command::kLogin:
      me.send(Outbound::error(ErrorCode::InvalidRequest, "already logged in"));
      break;
    case proto::Command::kLogout:
      logout = true;
      break;
    case proto::Command::kListGames:
      coord_.listGames(me);
      break;
    case proto::Command::kGameInit:
      coord_.createGame(me, fromWire(cmd.game_init()));
      break;
    case proto::Command::kJoinGame:
      coord_.join(me, cmd.join_game().name());
      break;
    case proto::Command::kLeaveGame:
      coord_.leave(me, cmd.leave_game().name());
      break;
    case proto::Command::kPlayerConfig:
      coord_.updatePlayer(me, fromWire(cmd.player_config()));
      break;
    case proto::Command::kGameConfig:
      coord_.updateGame(me, fromWire(cmd.game_config()));
      break;
    case proto::Command::kStartGame:
      coord_.startGame(me);
      break;
    case proto::Command::kChat:
      coord_.chat(me, cmd.chat().text());
      break;
    case proto::Command::KIND_NOT_SET:
      me.send(Outbound::error(ErrorCode::InvalidRequest, "empty command"));
      break;
  }
}

} // namespace MS
